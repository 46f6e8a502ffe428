#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "data/dataset.hpp"
#include "models/language_model.hpp"
#include "training/lr_schedule.hpp"

namespace tinylm {

enum class InitMode {
    Fresh,
    Resume,
    Pretrained
};

std::string to_string(InitMode mode);
InitMode init_mode_from_string(const std::string& name);

struct DataConfig {
    std::string input_path;             // raw text for `prepare`
    std::string data_dir = "data";
    EncodingKind tokenizer_kind = EncodingKind::Char;
    std::string subword_vocab_path;
    size_t subword_vocab_size = 1024;   // target size for `vocab`
    bool use_validation_split = true;
    double validation_fraction = 0.1;

    DatasetOptions dataset_options() const;
};

struct TrainingConfig {
    size_t batch_size = 16;             // per micro-batch
    size_t gradient_accumulation_steps = 1;  // micro-batches per update, summed over workers
    double learning_rate = 1e-3;
    size_t max_steps = 2000;
    size_t eval_interval = 250;
    size_t eval_iters = 20;
    size_t log_interval = 10;
    size_t save_interval = 0;           // 0 disables step_<N> snapshots
    bool save_best_val_checkpoint = true;
    InitMode init_mode = InitMode::Fresh;
    std::string pretrained_path;
    std::string output_dir = "out";
    size_t distributed_world_size = 1;
    size_t num_eval_seeds = 1;
    uint64_t seed = 1337;

    // Optimizer
    double weight_decay = 0.1;
    double beta1 = 0.9;
    double beta2 = 0.95;
    double grad_clip = 1.0;             // 0 disables clipping

    // Learning rate schedule
    training::LrSchedulerKind lr_scheduler = training::LrSchedulerKind::Cosine;
    size_t warmup_steps = 100;
    size_t lr_decay_steps = 2000;
    double min_lr = 1e-4;
    size_t step_size = 1000;
    double step_gamma = 0.1;
    double polynomial_power = 2.0;

    size_t event_queue_capacity = 1024;
    bool verbose = false;

    training::LrScheduleOptions lr_schedule() const;
};

struct GenerationConfig {
    std::string checkpoint;             // defaults to <output_dir>/ckpt.bin
    std::string prompt;
    size_t max_new_tokens = 200;
    double temperature = 0.8;
    std::optional<size_t> top_k;
    uint64_t seed = 1337;
};

// Everything the CLI reads from its JSON config file
struct Config {
    DataConfig data;
    ModelConfig model;                  // vocab_size comes from the dataset
    TrainingConfig training;
    GenerationConfig generation;

    // Throws std::invalid_argument naming the offending key
    void validate() const;

    nlohmann::json to_json() const;
    static Config from_json(const nlohmann::json& j);

    static Config load(const std::string& path);
    void save(const std::string& path) const;

    // "section.key=value"; value is parsed as JSON, falling back to a string
    void apply_override(const std::string& assignment);

    void print() const;
};

} // namespace tinylm
