// include/tinylm/generation/sampler.hpp
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <Eigen/Dense>
#include "../tokenizer/token_types.hpp"

namespace tinylm {

class Sampler {
public:
    virtual ~Sampler() = default;
    virtual TokenID sample(const Eigen::VectorXf& logits) = 0;
};

// temperature 0 selects greedy decoding; top_k restricts the candidates
// of the stochastic samplers. Throws std::invalid_argument for a negative
// temperature or top_k of 0.
std::unique_ptr<Sampler> make_sampler(double temperature, std::optional<size_t> top_k, uint64_t seed);

} // namespace tinylm
