// src/generation/temperature_sampler.cpp
#include "tinylm/generation/temperature_sampler.hpp"
#include <cmath>
#include <stdexcept>

namespace tinylm {

Eigen::VectorXf softmax_with_temperature(const Eigen::VectorXf& logits, float temperature) {
    if (logits.size() == 0) {
        throw std::invalid_argument("Cannot sample from empty logits");
    }
    Eigen::VectorXf scaled = logits / temperature;
    if (!scaled.allFinite()) {
        // 1 / temperature overflowed: all mass on the first maximal logit
        Eigen::Index best = 0;
        logits.maxCoeff(&best);
        return Eigen::VectorXf::Unit(logits.size(), best);
    }
    const float max_logit = scaled.maxCoeff();
    Eigen::VectorXf probs = (scaled.array() - max_logit).exp().matrix();
    return probs / probs.sum();
}

TemperatureSampler::TemperatureSampler(float temperature, uint64_t seed)
    : temperature_(temperature), rng_(seed) {
    if (!(temperature > 0.0f)) {
        throw std::invalid_argument("Temperature must be positive");
    }
}

TokenID TemperatureSampler::sample(const Eigen::VectorXf& logits) {
    Eigen::VectorXf probs = softmax_with_temperature(logits, temperature_);

    // Sample from the distribution
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    const double random_value = dist(rng_);
    double cumulative_prob = 0.0;

    Eigen::Index last_nonzero = 0;
    for (Eigen::Index i = 0; i < probs.size(); i++) {
        if (probs(i) <= 0.0f) {
            continue;
        }
        last_nonzero = i;
        cumulative_prob += probs(i);
        if (random_value < cumulative_prob) {
            return static_cast<TokenID>(i);
        }
    }

    // Rounding left the cumulative sum just below 1
    return static_cast<TokenID>(last_nonzero);
}

} // namespace tinylm
