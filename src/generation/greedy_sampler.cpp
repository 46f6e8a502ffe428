// src/generation/greedy_sampler.cpp
#include "tinylm/generation/greedy_sampler.hpp"
#include <stdexcept>

namespace tinylm {

GreedySampler::GreedySampler() = default;

GreedySampler::~GreedySampler() = default;

TokenID GreedySampler::sample(const Eigen::VectorXf& logits) {
    if (logits.size() == 0) {
        throw std::invalid_argument("GreedySampler expects non-empty logits");
    }

    Eigen::Index best_index = 0;
    float best_value = logits(0);

    for (Eigen::Index i = 1; i < logits.size(); i++) {
        if (logits(i) > best_value) {
            best_value = logits(i);
            best_index = i;
        }
    }

    return static_cast<TokenID>(best_index);
}

} // namespace tinylm
