// include/tinylm/distributed/thread_communicator.hpp
#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>
#include "communicator.hpp"

namespace tinylm {
namespace distributed {

// Shared state of an in-process worker group. The last worker to arrive
// at a collective reduces the contributions in rank order, so results do
// not depend on thread scheduling.
class ThreadGroup {
public:
    explicit ThreadGroup(int world_size);

    int world_size() const { return world_size_; }

    // Runs deposit under the group lock, waits for every worker, and runs
    // reduce once on the last arrival before anyone is released.
    void collective(const std::function<void()>& deposit, const std::function<void()>& reduce);

    void abort();

private:
    friend class ThreadCommunicator;

    std::mutex mutex_;
    std::condition_variable cv_;
    int world_size_;
    int arrived_ = 0;
    uint64_t generation_ = 0;
    bool aborted_ = false;

    std::vector<std::vector<Eigen::MatrixXf>*> tensor_slots_;
    std::vector<double> scalar_slots_;
    std::vector<char> flag_slots_;

    std::vector<Eigen::MatrixXf> reduced_tensors_;
    double reduced_scalar_ = 0.0;
    bool reduced_flag_ = false;
};

class ThreadCommunicator : public Communicator {
public:
    ThreadCommunicator(std::shared_ptr<ThreadGroup> group, int rank);

    int rank() const override { return rank_; }
    int world_size() const override { return group_->world_size(); }

    void all_reduce_mean(std::vector<Eigen::MatrixXf>& tensors) override;
    double all_reduce_mean(double value) override;
    bool any(bool flag) override;
    void barrier() override;
    void abort() override;

private:
    std::shared_ptr<ThreadGroup> group_;
    int rank_;
};

// One communicator per rank, all sharing a fresh group
std::vector<std::unique_ptr<Communicator>> make_thread_communicators(int world_size);

} // namespace distributed
} // namespace tinylm
