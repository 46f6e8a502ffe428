// include/tinylm/distributed/mpi_communicator.hpp
#pragma once

#include "communicator.hpp"

namespace tinylm {
namespace distributed {

// True when the process was started by an MPI launcher (mpirun/srun)
bool launched_under_mpi();

// Initializes MPI for the lifetime of the object
class MpiEnvironment {
public:
    MpiEnvironment(int* argc, char*** argv);
    ~MpiEnvironment();

    MpiEnvironment(const MpiEnvironment&) = delete;
    MpiEnvironment& operator=(const MpiEnvironment&) = delete;
};

// One OS process per rank over MPI_COMM_WORLD
class MpiCommunicator : public Communicator {
public:
    MpiCommunicator();

    int rank() const override { return rank_; }
    int world_size() const override { return world_size_; }

    void all_reduce_mean(std::vector<Eigen::MatrixXf>& tensors) override;
    double all_reduce_mean(double value) override;
    bool any(bool flag) override;
    void barrier() override;
    void abort() override;

private:
    int rank_ = 0;
    int world_size_ = 1;
};

} // namespace distributed
} // namespace tinylm
