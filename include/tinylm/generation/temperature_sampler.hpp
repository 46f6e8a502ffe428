// include/tinylm/generation/temperature_sampler.hpp
#pragma once

#include <random>
#include <vector>
#include "sampler.hpp"

namespace tinylm {

class TemperatureSampler : public Sampler {
public:
    TemperatureSampler(float temperature, uint64_t seed);
    ~TemperatureSampler() override = default;

    TokenID sample(const Eigen::VectorXf& logits) override;

private:
    float temperature_;
    std::mt19937_64 rng_;
};

// Softmax of logits / temperature; one-hot at the argmax when the
// scaled logits overflow
Eigen::VectorXf softmax_with_temperature(const Eigen::VectorXf& logits, float temperature);

} // namespace tinylm
