// src/generation/topk_sampler.cpp
// Limits the sampling to the top K most probable tokens
#include "tinylm/generation/topk_sampler.hpp"
#include "tinylm/generation/temperature_sampler.hpp"
#include <algorithm>
#include <stdexcept>

namespace tinylm {

TopKSampler::TopKSampler(size_t k, float temperature, uint64_t seed)
    : k_(k), temperature_(temperature), rng_(seed) {
    if (k == 0) {
        throw std::invalid_argument("K must be positive");
    }
    if (!(temperature > 0.0f)) {
        throw std::invalid_argument("Temperature must be positive");
    }
}

TokenID TopKSampler::sample(const Eigen::VectorXf& logits) {
    Eigen::VectorXf probs = softmax_with_temperature(logits, temperature_);
    const size_t vocab_size = static_cast<size_t>(probs.size());
    const size_t k = std::min(k_, vocab_size);

    std::vector<TokenProbability> token_probs;
    token_probs.reserve(vocab_size);
    for (size_t i = 0; i < vocab_size; i++) {
        token_probs.push_back({static_cast<TokenID>(i), probs(static_cast<Eigen::Index>(i))});
    }

    std::partial_sort(token_probs.begin(), token_probs.begin() + static_cast<std::ptrdiff_t>(k), token_probs.end());
    token_probs.resize(k);

    // Renormalize probabilities
    double top_k_sum = 0.0;
    for (const auto& tp : token_probs) {
        top_k_sum += tp.probability;
    }

    std::uniform_real_distribution<double> dist(0.0, top_k_sum);
    const double random_value = dist(rng_);
    double cumulative_prob = 0.0;

    for (const auto& tp : token_probs) {
        cumulative_prob += tp.probability;
        if (random_value < cumulative_prob) {
            return tp.token_id;
        }
    }

    // Fallback: return the least probable candidate reached by rounding
    return token_probs.back().token_id;
}

} // namespace tinylm
