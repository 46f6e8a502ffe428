// include/tinylm/checkpoint/checkpoint_store.hpp
#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>
#include <Eigen/Dense>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>
#include <nlohmann/json.hpp>
#include "../core/eigen_serialization.hpp"
#include "../models/language_model.hpp"
#include "../optimizers/adam.hpp"

namespace tinylm {

// Training options recorded alongside the weights
struct TrainingSnapshot {
    uint64_t seed = 0;
    double learning_rate = 0.0;
    size_t batch_size = 0;
    size_t world_size = 1;
    std::string lr_scheduler;

    template <class Archive>
    void serialize(Archive& archive) {
        archive(
            cereal::make_nvp("seed", seed),
            cereal::make_nvp("learning_rate", learning_rate),
            cereal::make_nvp("batch_size", batch_size),
            cereal::make_nvp("world_size", world_size),
            cereal::make_nvp("lr_scheduler", lr_scheduler)
        );
    }
};

struct ModelCheckpoint {
    ModelConfig model_config;
    std::vector<Eigen::MatrixXf> parameters;
    AdamOptimizer optimizer;
    size_t step = 0;
    double best_val_loss = std::numeric_limits<double>::infinity();
    TrainingSnapshot training;

    template <class Archive>
    void serialize(Archive& archive) {
        archive(
            cereal::make_nvp("model_config", model_config),
            cereal::make_nvp("parameters", parameters),
            cereal::make_nvp("optimizer", optimizer),
            cereal::make_nvp("step", step),
            cereal::make_nvp("best_val_loss", best_val_loss),
            cereal::make_nvp("training", training)
        );
    }
};

// What a load restores
enum class LoadMode {
    Resume,      // parameters, optimizer state, step, best_val_loss
    Pretrained,  // parameters only; step 0, fresh optimizer, best loss +inf
    Weights      // read-only snapshot for evaluation and generation
};

std::string to_string(LoadMode mode);

// Training curve points persisted beside the latest checkpoint
struct LossLog {
    std::vector<size_t> train_steps;
    std::vector<double> train_losses;
    std::vector<size_t> val_steps;
    std::vector<double> val_losses;

    void record_train(size_t step, double loss);
    void record_val(size_t step, double loss);
    // Drops points recorded after step
    void truncate_after(size_t step);

    nlohmann::json to_json() const;
    static LossLog from_json(const nlohmann::json& j);
};

// File layout under output_dir:
//   ckpt.bin            latest
//   best/ckpt.bin       lowest validation loss seen
//   step_<N>/ckpt.bin   periodic snapshots
//   loss_log.json
class CheckpointStore {
public:
    explicit CheckpointStore(std::string output_dir);

    // Writes to a temporary file in the same directory, then renames it
    // over path, so readers see either the old or the new checkpoint.
    static void save(const ModelCheckpoint& checkpoint, const std::string& path);

    // Throws CheckpointNotFoundError, or ConfigMismatchError when the stored
    // architecture differs from expected.
    static ModelCheckpoint load(const std::string& path, LoadMode mode, const ModelConfig& expected);

    // Reads without any compatibility check
    static ModelCheckpoint read(const std::string& path);

    static bool exists(const std::string& path);

    const std::string& output_dir() const { return output_dir_; }
    std::string latest_path() const;
    std::string best_path() const;
    std::string step_path(size_t step) const;
    std::string loss_log_path() const;

    std::string save_latest(const ModelCheckpoint& checkpoint) const;
    std::string save_best(const ModelCheckpoint& checkpoint) const;
    std::string save_step(const ModelCheckpoint& checkpoint) const;

    // Validation loss stored in best/ckpt.bin, if there is one
    std::optional<double> best_val_loss() const;

    LossLog load_loss_log() const;
    void save_loss_log(const LossLog& log) const;

private:
    std::string output_dir_;
};

} // namespace tinylm
