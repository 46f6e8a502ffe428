// src/distributed/thread_communicator.cpp
#include "tinylm/distributed/thread_communicator.hpp"
#include <stdexcept>
#include <string>

namespace tinylm {
namespace distributed {

ThreadGroup::ThreadGroup(int world_size)
    : world_size_(world_size),
      tensor_slots_(world_size, nullptr),
      scalar_slots_(world_size, 0.0),
      flag_slots_(world_size, 0) {
    if (world_size < 1) {
        throw std::invalid_argument("Worker group size must be positive, got " + std::to_string(world_size));
    }
}

void ThreadGroup::collective(const std::function<void()>& deposit, const std::function<void()>& reduce) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (aborted_) {
        throw std::runtime_error("Worker group aborted");
    }

    if (deposit) {
        deposit();
    }

    const uint64_t generation = generation_;
    if (++arrived_ == world_size_) {
        if (reduce) {
            try {
                reduce();
            } catch (const std::exception&) {
                aborted_ = true;
                cv_.notify_all();
                throw;
            }
        }
        arrived_ = 0;
        ++generation_;
        cv_.notify_all();
        return;
    }

    cv_.wait(lock, [&] { return generation_ != generation || aborted_; });
    if (generation_ == generation) {
        throw std::runtime_error("Worker group aborted");
    }
}

void ThreadGroup::abort() {
    std::lock_guard<std::mutex> lock(mutex_);
    aborted_ = true;
    cv_.notify_all();
}

ThreadCommunicator::ThreadCommunicator(std::shared_ptr<ThreadGroup> group, int rank)
    : group_(std::move(group)), rank_(rank) {
    if (!group_ || rank < 0 || rank >= group_->world_size()) {
        throw std::invalid_argument("Invalid rank " + std::to_string(rank) + " for worker group");
    }
}

void ThreadCommunicator::all_reduce_mean(std::vector<Eigen::MatrixXf>& tensors) {
    ThreadGroup& g = *group_;
    g.collective(
        [&] { g.tensor_slots_[rank_] = &tensors; },
        [&] {
            g.reduced_tensors_ = *g.tensor_slots_[0];
            for (int r = 1; r < g.world_size_; ++r) {
                const auto& other = *g.tensor_slots_[r];
                if (other.size() != g.reduced_tensors_.size()) {
                    throw std::logic_error("all_reduce_mean: ranks passed different tensor lists");
                }
                for (size_t i = 0; i < other.size(); ++i) {
                    g.reduced_tensors_[i] += other[i];
                }
            }
            const float inv = 1.0f / static_cast<float>(g.world_size_);
            for (auto& t : g.reduced_tensors_) {
                t *= inv;
            }
        });

    // reduced_tensors_ stays untouched until every rank passed the second barrier
    tensors = g.reduced_tensors_;
    g.collective(nullptr, nullptr);
}

double ThreadCommunicator::all_reduce_mean(double value) {
    ThreadGroup& g = *group_;
    g.collective(
        [&] { g.scalar_slots_[rank_] = value; },
        [&] {
            double sum = 0.0;
            for (double v : g.scalar_slots_) {
                sum += v;
            }
            g.reduced_scalar_ = sum / static_cast<double>(g.world_size_);
        });

    double result = g.reduced_scalar_;
    g.collective(nullptr, nullptr);
    return result;
}

bool ThreadCommunicator::any(bool flag) {
    ThreadGroup& g = *group_;
    g.collective(
        [&] { g.flag_slots_[rank_] = flag ? 1 : 0; },
        [&] {
            g.reduced_flag_ = false;
            for (char f : g.flag_slots_) {
                g.reduced_flag_ = g.reduced_flag_ || f != 0;
            }
        });

    bool result = g.reduced_flag_;
    g.collective(nullptr, nullptr);
    return result;
}

void ThreadCommunicator::barrier() {
    group_->collective(nullptr, nullptr);
}

void ThreadCommunicator::abort() {
    group_->abort();
}

std::vector<std::unique_ptr<Communicator>> make_thread_communicators(int world_size) {
    auto group = std::make_shared<ThreadGroup>(world_size);
    std::vector<std::unique_ptr<Communicator>> comms;
    comms.reserve(world_size);
    for (int rank = 0; rank < world_size; ++rank) {
        comms.push_back(std::make_unique<ThreadCommunicator>(group, rank));
    }
    return comms;
}

} // namespace distributed
} // namespace tinylm
