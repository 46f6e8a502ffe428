// src/training/progress.cpp
#include "tinylm/training/progress.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace tinylm {
namespace training {

std::string to_string(EventKind kind) {
    switch (kind) {
        case EventKind::Step:       return "step";
        case EventKind::Evaluation: return "evaluation";
        case EventKind::Checkpoint: return "checkpoint";
        case EventKind::Completed:  return "completed";
        case EventKind::Failed:     return "failed";
        case EventKind::Cancelled:  return "cancelled";
    }
    return "step";
}

bool ProgressEvent::is_terminal() const {
    return kind == EventKind::Completed || kind == EventKind::Failed || kind == EventKind::Cancelled;
}

nlohmann::json ProgressEvent::to_json() const {
    nlohmann::json j{
        {"kind", to_string(kind)},
        {"step", step},
        {"max_steps", max_steps},
        {"learning_rate", learning_rate},
        {"elapsed", elapsed_seconds},
        {"eta", eta_seconds},
        {"message", message},
        {"checkpoint_path", checkpoint_path}
    };
    j["train_loss"] = train_loss ? nlohmann::json(*train_loss) : nlohmann::json(nullptr);
    j["val_loss"] = val_loss ? nlohmann::json(*val_loss) : nlohmann::json(nullptr);
    if (seed) {
        j["seed"] = *seed;
    }
    if (error) {
        j["error"] = *error;
    }
    return j;
}

ProgressChannel::ProgressChannel(size_t capacity) : capacity_(capacity) {
    if (capacity == 0) {
        throw std::invalid_argument("event_queue_capacity must be positive");
    }
}

void ProgressChannel::publish(ProgressEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.size() >= capacity_) {
            auto victim = std::find_if(queue_.begin(), queue_.end(),
                                       [](const ProgressEvent& e) { return !e.is_terminal(); });
            if (victim != queue_.end()) {
                queue_.erase(victim);
                ++dropped_;
            } else if (!event.is_terminal()) {
                // Queue holds only terminal events
                ++dropped_;
                return;
            }
        }
        queue_.push_back(std::move(event));
    }
    cv_.notify_one();
}

std::optional<ProgressEvent> ProgressChannel::try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    ProgressEvent event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

std::optional<ProgressEvent> ProgressChannel::pop_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
        return std::nullopt;
    }
    ProgressEvent event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

std::vector<ProgressEvent> ProgressChannel::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ProgressEvent> events(std::make_move_iterator(queue_.begin()),
                                      std::make_move_iterator(queue_.end()));
    queue_.clear();
    return events;
}

size_t ProgressChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

size_t ProgressChannel::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

ProgressDispatcher::ProgressDispatcher(ProgressChannel& channel, Observer observer)
    : channel_(channel), observer_(std::move(observer)) {
    thread_ = std::thread(&ProgressDispatcher::run, this);
}

ProgressDispatcher::~ProgressDispatcher() {
    stop();
}

void ProgressDispatcher::stop() {
    stopping_ = true;
    if (thread_.joinable()) {
        thread_.join();
    }
}

void ProgressDispatcher::run() {
    while (!stopping_) {
        if (auto event = channel_.pop_for(std::chrono::milliseconds(50))) {
            deliver(*event);
        }
    }
    for (const auto& event : channel_.drain()) {
        deliver(event);
    }
}

void ProgressDispatcher::deliver(const ProgressEvent& event) {
    try {
        observer_(event);
    } catch (const std::exception& e) {
        // A broken observer must not stall the producer side
        std::cerr << "Progress observer failed on " << to_string(event.kind)
                  << " event: " << e.what() << std::endl;
    }
}

} // namespace training
} // namespace tinylm
