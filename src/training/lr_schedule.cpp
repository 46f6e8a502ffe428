// src/training/lr_schedule.cpp
#include "tinylm/training/lr_schedule.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace tinylm {
namespace training {

namespace {
constexpr double kPi = 3.14159265358979323846;
}

std::string to_string(LrSchedulerKind kind) {
    switch (kind) {
        case LrSchedulerKind::None:               return "none";
        case LrSchedulerKind::Cosine:             return "cosine";
        case LrSchedulerKind::ConstantWithWarmup: return "constant_with_warmup";
        case LrSchedulerKind::Linear:             return "linear";
        case LrSchedulerKind::Step:               return "step";
        case LrSchedulerKind::Polynomial:         return "polynomial";
    }
    return "none";
}

LrSchedulerKind lr_scheduler_from_string(const std::string& name) {
    if (name == "none") return LrSchedulerKind::None;
    if (name == "cosine") return LrSchedulerKind::Cosine;
    if (name == "constant_with_warmup") return LrSchedulerKind::ConstantWithWarmup;
    if (name == "linear") return LrSchedulerKind::Linear;
    if (name == "step") return LrSchedulerKind::Step;
    if (name == "polynomial") return LrSchedulerKind::Polynomial;
    throw std::invalid_argument("Unknown lr_scheduler: '" + name + "'");
}

LrSchedule::LrSchedule(const LrScheduleOptions& options) : options_(options) {
    if (!(options_.learning_rate > 0.0)) {
        throw std::invalid_argument("learning_rate must be positive");
    }
    if (options_.min_lr < 0.0) {
        throw std::invalid_argument("min_lr must be non-negative");
    }

    bool decays = options_.kind == LrSchedulerKind::Cosine ||
                  options_.kind == LrSchedulerKind::Linear ||
                  options_.kind == LrSchedulerKind::Polynomial;
    if (decays && options_.lr_decay_steps <= options_.warmup_steps) {
        throw std::invalid_argument("lr_decay_steps must exceed warmup_steps for the " +
                                    to_string(options_.kind) + " schedule");
    }
    if (options_.kind == LrSchedulerKind::Step && options_.step_size == 0) {
        throw std::invalid_argument("step_size must be positive for the step schedule");
    }
}

double LrSchedule::operator()(size_t step) const {
    const auto& o = options_;
    const double it = static_cast<double>(step);
    const double warmup = static_cast<double>(o.warmup_steps);
    const double decay = static_cast<double>(o.lr_decay_steps);

    if (step < o.warmup_steps) {
        return o.learning_rate * (it + 1.0) / (warmup + 1.0);
    }

    switch (o.kind) {
        case LrSchedulerKind::None:
        case LrSchedulerKind::ConstantWithWarmup:
            return o.learning_rate;

        case LrSchedulerKind::Cosine: {
            if (step > o.lr_decay_steps) return o.min_lr;
            double ratio = (it - warmup) / (decay - warmup);
            double coeff = 0.5 * (1.0 + std::cos(kPi * ratio));
            return o.min_lr + coeff * (o.learning_rate - o.min_lr);
        }

        case LrSchedulerKind::Linear: {
            if (step > o.lr_decay_steps) return o.min_lr;
            double ratio = (it - warmup) / (decay - warmup);
            return o.learning_rate + (o.min_lr - o.learning_rate) * ratio;
        }

        case LrSchedulerKind::Step: {
            size_t n_decay = (step - o.warmup_steps) / o.step_size;
            double lr = o.learning_rate * std::pow(o.step_gamma, static_cast<double>(n_decay));
            return std::max(lr, o.min_lr);
        }

        case LrSchedulerKind::Polynomial: {
            if (step > o.lr_decay_steps) return o.min_lr;
            double progress = (it - warmup) / (decay - warmup);
            double poly = std::pow(1.0 - progress, o.polynomial_power);
            return (o.learning_rate - o.min_lr) * poly + o.min_lr;
        }
    }
    return o.learning_rate;
}

} // namespace training
} // namespace tinylm
