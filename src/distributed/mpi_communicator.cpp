// src/distributed/mpi_communicator.cpp
#include "tinylm/distributed/mpi_communicator.hpp"
#include <mpi.h>
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace tinylm {
namespace distributed {

namespace {

void mpi_check(int rc, const char* what) {
    if (rc != MPI_SUCCESS) {
        char message[MPI_MAX_ERROR_STRING];
        int length = 0;
        MPI_Error_string(rc, message, &length);
        throw std::runtime_error(std::string(what) + " failed: " + std::string(message, length));
    }
}

} // namespace

bool launched_under_mpi() {
    return std::getenv("OMPI_COMM_WORLD_SIZE") != nullptr || std::getenv("PMI_SIZE") != nullptr;
}

MpiEnvironment::MpiEnvironment(int* argc, char*** argv) {
    mpi_check(MPI_Init(argc, argv), "MPI_Init");
    // Errors come back as return codes instead of aborting the job
    mpi_check(MPI_Comm_set_errhandler(MPI_COMM_WORLD, MPI_ERRORS_RETURN), "MPI_Comm_set_errhandler");
}

MpiEnvironment::~MpiEnvironment() {
    int finalized = 0;
    MPI_Finalized(&finalized);
    if (!finalized) {
        MPI_Finalize();
    }
}

MpiCommunicator::MpiCommunicator() {
    mpi_check(MPI_Comm_rank(MPI_COMM_WORLD, &rank_), "MPI_Comm_rank");
    mpi_check(MPI_Comm_size(MPI_COMM_WORLD, &world_size_), "MPI_Comm_size");
}

void MpiCommunicator::all_reduce_mean(std::vector<Eigen::MatrixXf>& tensors) {
    size_t total = 0;
    for (const auto& t : tensors) {
        total += static_cast<size_t>(t.size());
    }

    std::vector<float> buffer(total);
    size_t offset = 0;
    for (const auto& t : tensors) {
        std::copy(t.data(), t.data() + t.size(), buffer.begin() + offset);
        offset += static_cast<size_t>(t.size());
    }

    mpi_check(MPI_Allreduce(MPI_IN_PLACE, buffer.data(), static_cast<int>(total),
                            MPI_FLOAT, MPI_SUM, MPI_COMM_WORLD), "MPI_Allreduce");

    const float inv = 1.0f / static_cast<float>(world_size_);
    offset = 0;
    for (auto& t : tensors) {
        for (Eigen::Index i = 0; i < t.size(); ++i) {
            t.data()[i] = buffer[offset + i] * inv;
        }
        offset += static_cast<size_t>(t.size());
    }
}

double MpiCommunicator::all_reduce_mean(double value) {
    double sum = 0.0;
    mpi_check(MPI_Allreduce(&value, &sum, 1, MPI_DOUBLE, MPI_SUM, MPI_COMM_WORLD), "MPI_Allreduce");
    return sum / static_cast<double>(world_size_);
}

bool MpiCommunicator::any(bool flag) {
    int local = flag ? 1 : 0;
    int global = 0;
    mpi_check(MPI_Allreduce(&local, &global, 1, MPI_INT, MPI_LOR, MPI_COMM_WORLD), "MPI_Allreduce");
    return global != 0;
}

void MpiCommunicator::barrier() {
    mpi_check(MPI_Barrier(MPI_COMM_WORLD), "MPI_Barrier");
}

void MpiCommunicator::abort() {
    std::cerr << "Rank " << rank_ << " aborting MPI job" << std::endl;
    MPI_Abort(MPI_COMM_WORLD, 1);
}

} // namespace distributed
} // namespace tinylm
