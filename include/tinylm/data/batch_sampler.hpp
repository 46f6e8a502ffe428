// include/tinylm/data/batch_sampler.hpp
#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <Eigen/Dense>
#include "token_stream.hpp"

namespace tinylm {

using TokenMatrix = Eigen::Matrix<TokenID, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// batch_size rows of block_size tokens; targets are inputs shifted by one
struct Batch {
    TokenMatrix inputs;
    TokenMatrix targets;

    size_t batch_size() const { return static_cast<size_t>(inputs.rows()); }
    size_t block_size() const { return static_cast<size_t>(inputs.cols()); }
};

class BatchSampler {
public:
    // Throws InsufficientDataError when the stream is shorter than block_size + 1
    BatchSampler(const TokenStream& stream, const std::string& split,
                 size_t block_size, size_t batch_size);

    // Window starts are uniform over [0, len - block_size - 1]
    Batch sample(std::mt19937_64& rng) const;

    // Generator for one (seed, step, rank) triple, independent of any
    // earlier draws, so a resumed run sees the same batches.
    static std::mt19937_64 step_rng(uint64_t seed, uint64_t step, uint64_t rank);

private:
    const TokenStream& stream_;
    size_t block_size_;
    size_t batch_size_;
};

} // namespace tinylm
