// include/tinylm/training/evaluator.hpp
#pragma once

#include <atomic>
#include <cstdint>
#include <random>
#include <string>
#include <vector>
#include "../config.hpp"
#include "../data/token_stream.hpp"
#include "../models/language_model.hpp"
#include "progress.hpp"

namespace tinylm {
namespace training {

struct EvaluationOptions {
    size_t block_size = 128;
    size_t batch_size = 16;
    size_t eval_iters = 20;
    size_t num_seeds = 1;
    uint64_t seed = 1337;
};

struct EvaluationResult {
    double mean_loss = 0.0;
    std::vector<double> per_seed_losses;
    std::vector<uint64_t> seeds;
};

class Evaluator {
public:
    explicit Evaluator(EvaluationOptions options);

    // One loss per seed, each the mean over eval_iters random batches.
    // Throws InsufficientDataError before sampling if the split is too short.
    EvaluationResult evaluate(const LanguageModel& model, const TokenStream& split,
                              const std::string& split_name = "validation") const;

    double estimate_loss(const LanguageModel& model, const TokenStream& split,
                         const std::string& split_name, std::mt19937_64& rng) const;
    double estimate_loss(const LanguageModel& model, const TokenStream& split,
                         const std::string& split_name, uint64_t seed) const;

    // seed when num_seeds <= 1, otherwise seed + 1 .. seed + num_seeds
    std::vector<uint64_t> seeds() const;

    const EvaluationOptions& options() const { return options_; }

private:
    EvaluationOptions options_;
};

EvaluationResult evaluate(const LanguageModel& model, const TokenStream& split,
                          const EvaluationOptions& options);

// Scores a stored checkpoint on the validation split, one event per seed.
class EvaluationRun {
public:
    EvaluationRun(const Config& config, std::string checkpoint_path, ProgressChannel& channel);

    // Throws CancellationError when cancelled between seeds
    EvaluationResult run();
    void cancel() { cancel_requested_ = true; }

private:
    Config config_;
    std::string checkpoint_path_;
    ProgressChannel& channel_;
    std::atomic<bool> cancel_requested_{false};
};

} // namespace training
} // namespace tinylm
