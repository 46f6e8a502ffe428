// include/tinylm/generation/greedy_sampler.hpp
#pragma once

#include "sampler.hpp"

namespace tinylm {

// Always picks the highest logit; ties go to the lowest id
class GreedySampler : public Sampler {
public:
    GreedySampler();
    ~GreedySampler() override;

    TokenID sample(const Eigen::VectorXf& logits) override;
};

} // namespace tinylm
