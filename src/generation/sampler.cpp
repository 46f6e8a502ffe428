// src/generation/sampler.cpp
#include "tinylm/generation/sampler.hpp"
#include "tinylm/generation/greedy_sampler.hpp"
#include "tinylm/generation/temperature_sampler.hpp"
#include "tinylm/generation/topk_sampler.hpp"
#include <cmath>
#include <stdexcept>

namespace tinylm {

std::unique_ptr<Sampler> make_sampler(double temperature, std::optional<size_t> top_k, uint64_t seed) {
    if (!std::isfinite(temperature) || temperature < 0.0) {
        throw std::invalid_argument("temperature must be a non-negative number");
    }
    if (top_k && *top_k == 0) {
        throw std::invalid_argument("top_k must be positive");
    }

    // Temperatures below float resolution behave as greedy decoding
    if (static_cast<float>(temperature) == 0.0f) {
        return std::make_unique<GreedySampler>();
    }
    if (top_k) {
        return std::make_unique<TopKSampler>(*top_k, static_cast<float>(temperature), seed);
    }
    return std::make_unique<TemperatureSampler>(static_cast<float>(temperature), seed);
}

} // namespace tinylm
