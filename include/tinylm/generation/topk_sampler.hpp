// include/tinylm/generation/topk_sampler.hpp
#pragma once

#include <random>
#include <vector>
#include "sampler.hpp"

namespace tinylm {

class TopKSampler : public Sampler {
public:
    TopKSampler(size_t k, float temperature, uint64_t seed);
    ~TopKSampler() override = default;

    TokenID sample(const Eigen::VectorXf& logits) override;

private:
    size_t k_;
    float temperature_;
    std::mt19937_64 rng_;

    struct TokenProbability {
        TokenID token_id;
        float probability;

        bool operator<(const TokenProbability& other) const {
            if (probability != other.probability) {
                return probability > other.probability; // Sort descending
            }
            return token_id < other.token_id;
        }
    };
};

} // namespace tinylm
