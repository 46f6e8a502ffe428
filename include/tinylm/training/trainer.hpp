// include/tinylm/training/trainer.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "../checkpoint/checkpoint_store.hpp"
#include "../config.hpp"
#include "../data/dataset.hpp"
#include "../distributed/communicator.hpp"
#include "../models/language_model.hpp"
#include "../optimizers/adam.hpp"
#include "lr_schedule.hpp"
#include "progress.hpp"

namespace tinylm {
namespace training {

enum class TrainingState {
    Idle,
    Preparing,
    Running,
    Completed,
    Failed,
    Cancelled
};

std::string to_string(TrainingState state);

struct TrainingOutcome {
    TrainingState state = TrainingState::Idle;
    size_t final_step = 0;
    std::string last_checkpoint;
    std::optional<double> best_val_loss;
    std::optional<nlohmann::json> error;
    std::exception_ptr exception;

    // Rethrows the failure, if any
    void rethrow() const;
};

// Result of a worker group, main worker first: the main worker's outcome
// unless a peer failed and it did not. The checkpoint path and best loss are
// always the main worker's, since only it writes checkpoints.
TrainingOutcome combine_outcomes(const std::vector<TrainingOutcome>& outcomes);

// Runs the training loop on one or more workers. With a world size above
// one, every worker holds a full replica, samples its own batches and
// averages gradients with the others before each update. Only the main
// worker writes checkpoints and publishes events.
class TrainingOrchestrator {
public:
    // Workers are threads in this process
    TrainingOrchestrator(Config config, ProgressChannel& channel);
    // This process is one worker of an external group (MPI)
    TrainingOrchestrator(Config config, ProgressChannel& channel, distributed::Communicator& communicator);
    ~TrainingOrchestrator();

    TrainingOrchestrator(const TrainingOrchestrator&) = delete;
    TrainingOrchestrator& operator=(const TrainingOrchestrator&) = delete;

    // Loads the dataset and initial weights. Throws on insufficient data,
    // missing checkpoints and architecture mismatches.
    void prepare();

    // Launches the workers; prepares first if that has not happened
    void start();

    // Blocks until every worker has finished
    TrainingOutcome wait();

    TrainingOutcome run();

    // Honoured at the next step boundary
    void cancel() { cancel_requested_ = true; }

    TrainingState state() const { return state_.load(); }
    size_t start_step() const { return start_step_; }
    const ModelConfig& model_config() const { return model_config_; }
    const CheckpointStore& store() const { return store_; }
    const LossLog& loss_log() const { return loss_log_; }

    size_t num_replicas() const { return workers_.size(); }
    const LanguageModel& replica(size_t index) const;

private:
    struct Worker {
        distributed::Communicator* comm = nullptr;
        std::unique_ptr<LanguageModel> model;
        AdamOptimizer optimizer;
        TrainingOutcome outcome;
    };

    Config config_;
    ProgressChannel& channel_;
    CheckpointStore store_;
    distributed::Communicator* external_comm_ = nullptr;
    std::vector<std::unique_ptr<distributed::Communicator>> owned_comms_;

    std::optional<Dataset> dataset_;
    ModelConfig model_config_;
    std::optional<LrSchedule> schedule_;
    std::vector<Worker> workers_;
    std::vector<std::thread> threads_;

    std::atomic<TrainingState> state_{TrainingState::Idle};
    std::atomic<bool> cancel_requested_{false};

    // Main worker only after start()
    size_t start_step_ = 0;
    size_t micro_steps_ = 1;
    double best_val_loss_;
    LossLog loss_log_;
    std::string last_checkpoint_;
    size_t last_saved_step_;
    std::chrono::steady_clock::time_point started_at_;
    std::optional<TrainingOutcome> outcome_;

    void run_worker(size_t index);
    void evaluate_and_checkpoint(Worker& worker, size_t step, double lr);
    std::string save_latest(const Worker& worker, size_t step);
    ModelCheckpoint make_checkpoint(const Worker& worker, size_t step) const;
    ProgressEvent make_event(EventKind kind, size_t step) const;
    void finish(Worker& worker, TrainingState state, size_t step, const std::string& message,
                const nlohmann::json& error = nullptr);
};

} // namespace training
} // namespace tinylm
