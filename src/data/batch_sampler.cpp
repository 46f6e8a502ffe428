// src/data/batch_sampler.cpp
#include "tinylm/data/batch_sampler.hpp"
#include "tinylm/data/dataset.hpp"
#include <stdexcept>

namespace tinylm {

BatchSampler::BatchSampler(const TokenStream& stream, const std::string& split,
                           size_t block_size, size_t batch_size)
    : stream_(stream), block_size_(block_size), batch_size_(batch_size) {
    if (block_size == 0 || batch_size == 0) {
        throw std::invalid_argument("block_size and batch_size must be positive");
    }
    require_sufficient_tokens(stream, split, block_size);
}

Batch BatchSampler::sample(std::mt19937_64& rng) const {
    std::uniform_int_distribution<size_t> start_dist(0, stream_.size() - block_size_ - 1);

    Batch batch;
    batch.inputs.resize(batch_size_, block_size_);
    batch.targets.resize(batch_size_, block_size_);

    const auto& tokens = stream_.tokens();
    for (size_t b = 0; b < batch_size_; ++b) {
        size_t start = start_dist(rng);
        for (size_t t = 0; t < block_size_; ++t) {
            batch.inputs(b, t) = tokens[start + t];
            batch.targets(b, t) = tokens[start + t + 1];
        }
    }
    return batch;
}

std::mt19937_64 BatchSampler::step_rng(uint64_t seed, uint64_t step, uint64_t rank) {
    std::seed_seq seq{
        static_cast<uint32_t>(seed), static_cast<uint32_t>(seed >> 32),
        static_cast<uint32_t>(step), static_cast<uint32_t>(step >> 32),
        static_cast<uint32_t>(rank), static_cast<uint32_t>(rank >> 32)
    };
    return std::mt19937_64(seq);
}

} // namespace tinylm
