// include/tinylm/training/lr_schedule.hpp
#pragma once

#include <cstddef>
#include <string>

namespace tinylm {
namespace training {

enum class LrSchedulerKind {
    None,
    Cosine,
    ConstantWithWarmup,
    Linear,
    Step,
    Polynomial
};

std::string to_string(LrSchedulerKind kind);
LrSchedulerKind lr_scheduler_from_string(const std::string& name);

struct LrScheduleOptions {
    LrSchedulerKind kind = LrSchedulerKind::Cosine;
    double learning_rate = 1e-3;
    double min_lr = 1e-4;
    size_t warmup_steps = 0;
    size_t lr_decay_steps = 5000;
    size_t step_size = 1000;
    double step_gamma = 0.1;
    double polynomial_power = 2.0;
};

// Linear warmup over the first warmup_steps, then the selected decay.
class LrSchedule {
public:
    explicit LrSchedule(const LrScheduleOptions& options);

    double operator()(size_t step) const;

    const LrScheduleOptions& options() const { return options_; }

private:
    LrScheduleOptions options_;
};

} // namespace training
} // namespace tinylm
