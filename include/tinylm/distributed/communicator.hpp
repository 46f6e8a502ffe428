// include/tinylm/distributed/communicator.hpp
#pragma once

#include <memory>
#include <vector>
#include <Eigen/Dense>

namespace tinylm {
namespace distributed {

// Collectives over a fixed group of workers. Every member must call the
// same collectives in the same order.
class Communicator {
public:
    virtual ~Communicator() = default;

    virtual int rank() const = 0;
    virtual int world_size() const = 0;
    bool is_main() const { return rank() == 0; }

    // Element-wise mean across workers, result written back in place
    virtual void all_reduce_mean(std::vector<Eigen::MatrixXf>& tensors) = 0;
    virtual double all_reduce_mean(double value) = 0;

    // True on every worker if any worker passed true
    virtual bool any(bool flag) = 0;

    virtual void barrier() = 0;

    // Releases peers blocked in a collective after this worker failed
    virtual void abort() = 0;
};

// World of one
class LocalCommunicator : public Communicator {
public:
    int rank() const override { return 0; }
    int world_size() const override { return 1; }

    void all_reduce_mean(std::vector<Eigen::MatrixXf>&) override {}
    double all_reduce_mean(double value) override { return value; }
    bool any(bool flag) override { return flag; }
    void barrier() override {}
    void abort() override {}
};

} // namespace distributed
} // namespace tinylm
