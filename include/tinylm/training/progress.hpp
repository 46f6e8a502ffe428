// include/tinylm/training/progress.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

namespace tinylm {
namespace training {

enum class EventKind {
    Step,
    Evaluation,
    Checkpoint,
    Completed,
    Failed,
    Cancelled
};

std::string to_string(EventKind kind);

struct ProgressEvent {
    EventKind kind = EventKind::Step;
    size_t step = 0;
    size_t max_steps = 0;
    std::optional<double> train_loss;
    std::optional<double> val_loss;
    double learning_rate = 0.0;
    double elapsed_seconds = 0.0;
    double eta_seconds = 0.0;
    std::string message;
    std::string checkpoint_path;
    std::optional<uint64_t> seed;           // evaluation-only runs
    std::optional<nlohmann::json> error;    // Error::to_json() of a failure

    bool is_terminal() const;
    nlohmann::json to_json() const;
};

// Bounded queue between the training loop and its observers. publish()
// never blocks: when the queue is full the oldest non-terminal event is
// dropped. Terminal events are always delivered.
class ProgressChannel {
public:
    explicit ProgressChannel(size_t capacity = 1024);

    void publish(ProgressEvent event);

    std::optional<ProgressEvent> try_pop();
    std::optional<ProgressEvent> pop_for(std::chrono::milliseconds timeout);
    std::vector<ProgressEvent> drain();

    size_t size() const;
    size_t capacity() const { return capacity_; }
    size_t dropped() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<ProgressEvent> queue_;
    size_t capacity_;
    size_t dropped_ = 0;
};

// Delivers events from a channel to a callback on a dedicated thread
class ProgressDispatcher {
public:
    using Observer = std::function<void(const ProgressEvent&)>;

    ProgressDispatcher(ProgressChannel& channel, Observer observer);
    ~ProgressDispatcher();

    ProgressDispatcher(const ProgressDispatcher&) = delete;
    ProgressDispatcher& operator=(const ProgressDispatcher&) = delete;

    // Delivers whatever is still queued, then joins
    void stop();

private:
    ProgressChannel& channel_;
    Observer observer_;
    std::atomic<bool> stopping_{false};
    std::thread thread_;

    void run();
    void deliver(const ProgressEvent& event);
};

} // namespace training
} // namespace tinylm
