// src/optimizers/adam.cpp
#include "tinylm/optimizers/adam.hpp"
#include <cmath>
#include <stdexcept>

namespace tinylm {

AdamOptimizer::AdamOptimizer(float lr, float b1, float b2, float eps, float wd)
    : t(0), beta1(b1), beta2(b2), epsilon(eps), weight_decay(wd), learning_rate(lr) {
    if (b1 < 0.0f || b1 >= 1.0f || b2 < 0.0f || b2 >= 1.0f) {
        throw std::invalid_argument("Adam betas must be in [0, 1)");
    }
    if (wd < 0.0f) {
        throw std::invalid_argument("weight_decay must be non-negative");
    }
}

void AdamOptimizer::initialize_moments(const std::vector<Eigen::MatrixXf>& parameters) {
    m.clear();
    v.clear();

    for (const auto& param : parameters) {
        m.push_back(Eigen::MatrixXf::Zero(param.rows(), param.cols()));
        v.push_back(Eigen::MatrixXf::Zero(param.rows(), param.cols()));
    }
}

void AdamOptimizer::update(std::vector<Eigen::MatrixXf>& parameters,
                           const std::vector<Eigen::MatrixXf>& gradients) {
    if (parameters.size() != gradients.size()) {
        throw std::invalid_argument("Parameter and gradient counts differ");
    }

    // Initialize moments if needed
    if (m.empty() || v.empty()) {
        initialize_moments(parameters);
    }
    if (m.size() != parameters.size()) {
        throw std::invalid_argument("Optimizer state does not match the parameter list");
    }

    t++;

    const float bias_correction1 = 1.0f - std::pow(beta1, static_cast<float>(t));
    const float bias_correction2 = 1.0f - std::pow(beta2, static_cast<float>(t));

    for (size_t i = 0; i < parameters.size(); i++) {
        // Update biased first moment estimate
        m[i] = beta1 * m[i] + (1.0f - beta1) * gradients[i];

        // Update biased second raw moment estimate
        v[i] = beta2 * v[i] + (1.0f - beta2) * gradients[i].cwiseProduct(gradients[i]);

        Eigen::ArrayXXf m_hat = m[i].array() / bias_correction1;
        Eigen::ArrayXXf v_hat = v[i].array() / bias_correction2;

        // Decoupled weight decay
        if (weight_decay > 0.0f && parameters[i].rows() > 1) {
            parameters[i] *= (1.0f - learning_rate * weight_decay);
        }

        // Update parameters
        parameters[i].array() -= learning_rate * m_hat / (v_hat.sqrt() + epsilon);
    }
}

void AdamOptimizer::reset() {
    m.clear();
    v.clear();
    t = 0;
}

float clip_grad_norm(std::vector<Eigen::MatrixXf>& gradients, float max_norm) {
    double squared = 0.0;
    for (const auto& g : gradients) {
        squared += static_cast<double>(g.squaredNorm());
    }
    float norm = static_cast<float>(std::sqrt(squared));

    if (max_norm > 0.0f && norm > max_norm) {
        float scale = max_norm / (norm + 1e-6f);
        for (auto& g : gradients) {
            g *= scale;
        }
    }
    return norm;
}

} // namespace tinylm
