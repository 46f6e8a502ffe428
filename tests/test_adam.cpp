// tests/test_adam.cpp
#include "tinylm/optimizers/adam.hpp"
#include "test_utils.hpp"
#include <cmath>
#include <limits>
#include <sstream>
#include <vector>
#include <cereal/archives/binary.hpp>

using namespace tinylm;
using namespace tinylm_test;

int main() {
    std::cout << "Testing AdamOptimizer..." << std::endl;

    try {
        section("Test 1: minimizing a quadratic");
        std::vector<Eigen::MatrixXf> params = {Eigen::MatrixXf::Constant(2, 2, 3.0f)};
        AdamOptimizer optimizer(0.1f, 0.9f, 0.999f);
        for (int i = 0; i < 200; ++i) {
            // d/dp of p^2
            std::vector<Eigen::MatrixXf> grads = {2.0f * params[0]};
            optimizer.update(params, grads);
        }
        check(params[0].cwiseAbs().maxCoeff() < 0.1f, "parameters driven towards zero");
        check(optimizer.get_timestep() == 200, "one timestep per update");

        section("Test 2: first step size equals the learning rate");
        std::vector<Eigen::MatrixXf> p = {Eigen::MatrixXf::Constant(1, 3, 1.0f)};
        AdamOptimizer fresh(0.01f);
        fresh.update(p, {Eigen::MatrixXf::Constant(1, 3, 5.0f)});
        check(std::fabs(p[0](0, 0) - 0.99f) < 1e-5f, "bias-corrected step of lr");

        section("Test 3: weight decay skips bias rows");
        std::vector<Eigen::MatrixXf> decayed = {Eigen::MatrixXf::Constant(3, 2, 1.0f), Eigen::MatrixXf::Constant(1, 2, 1.0f)};
        std::vector<Eigen::MatrixXf> zero = {Eigen::MatrixXf::Zero(3, 2), Eigen::MatrixXf::Zero(1, 2)};
        AdamOptimizer with_decay(0.1f, 0.9f, 0.999f, 1e-8f, 0.5f);
        with_decay.update(decayed, zero);
        check(std::fabs(decayed[0](0, 0) - 0.95f) < 1e-6f, "matrix shrinks by lr * weight_decay");
        check(decayed[1](0, 0) == 1.0f, "bias row untouched");

        section("Test 4: state persistence");
        std::stringstream buffer;
        {
            cereal::BinaryOutputArchive out(buffer);
            out(optimizer);
        }
        AdamOptimizer restored;
        {
            cereal::BinaryInputArchive in(buffer);
            in(restored);
        }
        check(restored.get_timestep() == optimizer.get_timestep(), "timestep restored");
        check(restored.first_moments().size() == 1 && restored.first_moments()[0] == optimizer.first_moments()[0],
              "first moments restored");
        check(restored.second_moments()[0] == optimizer.second_moments()[0], "second moments restored");
        check(restored.get_learning_rate() == optimizer.get_learning_rate(), "learning rate restored");

        optimizer.reset();
        check(optimizer.get_timestep() == 0 && optimizer.first_moments().empty(), "reset clears the state");

        section("Test 5: gradient clipping");
        std::vector<Eigen::MatrixXf> g = {Eigen::MatrixXf::Constant(1, 1, 3.0f), Eigen::MatrixXf::Constant(1, 1, 4.0f)};
        float norm = clip_grad_norm(g, 1.0f);
        check(std::fabs(norm - 5.0f) < 1e-5f, "norm before clipping returned");
        check(std::fabs(std::sqrt(g[0].squaredNorm() + g[1].squaredNorm()) - 1.0f) < 1e-4f, "clipped to max_norm");

        std::vector<Eigen::MatrixXf> measured = {Eigen::MatrixXf::Constant(1, 1, 3.0f), Eigen::MatrixXf::Constant(1, 1, 4.0f)};
        check(std::fabs(clip_grad_norm(measured, 0.0f) - 5.0f) < 1e-5f && measured[0](0, 0) == 3.0f,
              "max_norm 0 measures without clipping");
        measured[1](0, 0) = std::numeric_limits<float>::quiet_NaN();
        check(!std::isfinite(clip_grad_norm(measured, 0.0f)), "NaN gradients give a non-finite norm");
        std::vector<Eigen::MatrixXf> small = {Eigen::MatrixXf::Constant(1, 1, 0.5f)};
        clip_grad_norm(small, 1.0f);
        check(small[0](0, 0) == 0.5f, "small gradients untouched");

        section("Test 6: invalid settings");
        check(throws<std::invalid_argument>([] { AdamOptimizer bad(0.1f, 1.0f); }), "beta1 of 1 rejected");
        check(throws<std::invalid_argument>([] { AdamOptimizer bad(0.1f, 0.9f, 0.999f, 1e-8f, -1.0f); }),
              "negative weight decay rejected");
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return finish("test_adam");
}
