// src/training/evaluator.cpp
#include "tinylm/training/evaluator.hpp"
#include "tinylm/checkpoint/checkpoint_store.hpp"
#include "tinylm/data/batch_sampler.hpp"
#include "tinylm/data/dataset.hpp"
#include "tinylm/errors.hpp"
#include <chrono>
#include <iostream>
#include <numeric>
#include <stdexcept>

namespace tinylm {
namespace training {

Evaluator::Evaluator(EvaluationOptions options) : options_(options) {
    if (options_.block_size == 0 || options_.batch_size == 0 || options_.eval_iters == 0) {
        throw std::invalid_argument("block_size, batch_size and eval_iters must be positive");
    }
}

std::vector<uint64_t> Evaluator::seeds() const {
    if (options_.num_seeds <= 1) {
        return {options_.seed};
    }
    std::vector<uint64_t> seeds;
    seeds.reserve(options_.num_seeds);
    for (size_t i = 1; i <= options_.num_seeds; ++i) {
        seeds.push_back(options_.seed + i);
    }
    return seeds;
}

double Evaluator::estimate_loss(const LanguageModel& model, const TokenStream& split,
                                const std::string& split_name, std::mt19937_64& rng) const {
    BatchSampler sampler(split, split_name, options_.block_size, options_.batch_size);

    double total = 0.0;
    for (size_t i = 0; i < options_.eval_iters; ++i) {
        total += static_cast<double>(model.loss(sampler.sample(rng)));
    }
    return total / static_cast<double>(options_.eval_iters);
}

double Evaluator::estimate_loss(const LanguageModel& model, const TokenStream& split,
                                const std::string& split_name, uint64_t seed) const {
    auto rng = BatchSampler::step_rng(seed, 0, 0);
    return estimate_loss(model, split, split_name, rng);
}

EvaluationResult Evaluator::evaluate(const LanguageModel& model, const TokenStream& split,
                                     const std::string& split_name) const {
    require_sufficient_tokens(split, split_name, options_.block_size);

    EvaluationResult result;
    result.seeds = seeds();
    for (uint64_t seed : result.seeds) {
        result.per_seed_losses.push_back(estimate_loss(model, split, split_name, seed));
    }
    result.mean_loss = std::accumulate(result.per_seed_losses.begin(), result.per_seed_losses.end(), 0.0) /
                       static_cast<double>(result.per_seed_losses.size());
    return result;
}

EvaluationResult evaluate(const LanguageModel& model, const TokenStream& split,
                          const EvaluationOptions& options) {
    return Evaluator(options).evaluate(model, split);
}

EvaluationRun::EvaluationRun(const Config& config, std::string checkpoint_path, ProgressChannel& channel)
    : config_(config), checkpoint_path_(std::move(checkpoint_path)), channel_(channel) {}

EvaluationResult EvaluationRun::run() {
    const auto start = std::chrono::steady_clock::now();
    auto elapsed = [&] {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    };

    Dataset dataset = Dataset::load(config_.data.data_dir);
    if (!dataset.has_validation()) {
        throw std::runtime_error("val.bin not found in " + config_.data.data_dir + ", can't evaluate");
    }
    require_sufficient_tokens(dataset.validation(), "validation", config_.model.block_size);

    ModelConfig model_config = config_.model;
    model_config.vocab_size = dataset.tokenizer().vocab_size();

    ModelCheckpoint checkpoint = CheckpointStore::load(checkpoint_path_, LoadMode::Weights, model_config);
    LanguageModel model(model_config, config_.training.seed);
    model.set_parameters(std::move(checkpoint.parameters));

    EvaluationOptions options;
    options.block_size = model_config.block_size;
    options.batch_size = config_.training.batch_size;
    options.eval_iters = config_.training.eval_iters;
    options.num_seeds = config_.training.num_eval_seeds;
    options.seed = config_.training.seed;
    Evaluator evaluator(options);

    EvaluationResult result;
    result.seeds = evaluator.seeds();
    const size_t total = result.seeds.size();

    for (size_t i = 0; i < total; ++i) {
        if (cancel_requested_) {
            ProgressEvent event;
            event.kind = EventKind::Cancelled;
            event.step = i;
            event.max_steps = total;
            event.elapsed_seconds = elapsed();
            event.message = "Evaluation stopped after " + std::to_string(i) + " of " + std::to_string(total) + " seeds";
            event.checkpoint_path = checkpoint_path_;
            CancellationError error(i);
            event.error = error.to_json();
            channel_.publish(std::move(event));
            throw error;
        }

        double loss = evaluator.estimate_loss(model, dataset.validation(), "validation", result.seeds[i]);
        result.per_seed_losses.push_back(loss);

        ProgressEvent event;
        event.kind = EventKind::Evaluation;
        event.step = i + 1;
        event.max_steps = total;
        event.val_loss = loss;
        event.seed = result.seeds[i];
        event.elapsed_seconds = elapsed();
        event.eta_seconds = event.elapsed_seconds / static_cast<double>(i + 1) * static_cast<double>(total - i - 1);
        event.message = "Seed " + std::to_string(result.seeds[i]) + " validation loss " + std::to_string(loss);
        event.checkpoint_path = checkpoint_path_;
        channel_.publish(std::move(event));
    }

    result.mean_loss = std::accumulate(result.per_seed_losses.begin(), result.per_seed_losses.end(), 0.0) /
                       static_cast<double>(total);

    ProgressEvent done;
    done.kind = EventKind::Completed;
    done.step = total;
    done.max_steps = total;
    done.val_loss = result.mean_loss;
    done.elapsed_seconds = elapsed();
    done.message = "Mean validation loss over " + std::to_string(total) + " seeds: " + std::to_string(result.mean_loss);
    done.checkpoint_path = checkpoint_path_;
    channel_.publish(std::move(done));

    return result;
}

} // namespace training
} // namespace tinylm
