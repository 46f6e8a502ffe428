// include/tinylm/optimizers/adam.hpp
#pragma once

#include <vector>
#include <Eigen/Dense>
#include <cereal/types/vector.hpp>
#include <cereal/archives/binary.hpp>
#include "../core/eigen_serialization.hpp"

namespace tinylm {

// Adam with decoupled weight decay. Decay applies to matrices with more
// than one row; bias rows are left alone.
class AdamOptimizer {
private:
    std::vector<Eigen::MatrixXf> m;  // First moment vector
    std::vector<Eigen::MatrixXf> v;  // Second moment vector
    size_t t;                        // Timestep
    float beta1;
    float beta2;
    float epsilon;
    float weight_decay;
    float learning_rate;

public:
    AdamOptimizer(float lr = 1e-3f, float b1 = 0.9f, float b2 = 0.999f,
                  float eps = 1e-8f, float wd = 0.0f);

    void update(std::vector<Eigen::MatrixXf>& parameters,
                const std::vector<Eigen::MatrixXf>& gradients);

    // Initialize moment vectors for parameters
    void initialize_moments(const std::vector<Eigen::MatrixXf>& parameters);

    // Reset the optimizer state
    void reset();

    // Cereal serialization
    template <class Archive>
    void serialize(Archive& archive) {
        archive(
            cereal::make_nvp("m", m),
            cereal::make_nvp("v", v),
            cereal::make_nvp("t", t),
            cereal::make_nvp("beta1", beta1),
            cereal::make_nvp("beta2", beta2),
            cereal::make_nvp("epsilon", epsilon),
            cereal::make_nvp("weight_decay", weight_decay),
            cereal::make_nvp("learning_rate", learning_rate)
        );
    }

    // Getters for state inspection
    size_t get_timestep() const { return t; }
    float get_learning_rate() const { return learning_rate; }
    void set_learning_rate(float lr) { learning_rate = lr; }
    float get_weight_decay() const { return weight_decay; }
    const std::vector<Eigen::MatrixXf>& first_moments() const { return m; }
    const std::vector<Eigen::MatrixXf>& second_moments() const { return v; }
};

// Rescales gradients in place so their global L2 norm is at most max_norm;
// a max_norm of 0 leaves them alone. Returns the norm before clipping.
float clip_grad_norm(std::vector<Eigen::MatrixXf>& gradients, float max_norm);

} // namespace tinylm
