#include "tinylm/config.hpp"
#include <fstream>
#include <iostream>
#include <set>
#include <stdexcept>
#include <type_traits>

namespace tinylm {

namespace {

std::invalid_argument key_error(const std::string& section, const std::string& key, const std::string& what) {
    return std::invalid_argument("Config key '" + section + "." + key + "' " + what);
}

template <typename T>
void read_key(const nlohmann::json& section, const std::string& section_name, const std::string& key, T& out) {
    if (!section.contains(key)) {
        return;
    }
    const auto& value = section.at(key);

    if constexpr (std::is_same_v<T, bool>) {
        if (!value.is_boolean()) throw key_error(section_name, key, "must be true or false");
    } else if constexpr (std::is_integral_v<T> && std::is_unsigned_v<T>) {
        if (!value.is_number_unsigned()) throw key_error(section_name, key, "must be a non-negative integer");
    } else if constexpr (std::is_floating_point_v<T>) {
        if (!value.is_number()) throw key_error(section_name, key, "must be a number");
    } else if constexpr (std::is_same_v<T, std::string>) {
        if (!value.is_string()) throw key_error(section_name, key, "must be a string");
    }
    out = value.get<T>();
}

void reject_unknown_keys(const nlohmann::json& section, const std::string& section_name,
                         const std::set<std::string>& known) {
    if (!section.is_object()) {
        throw std::invalid_argument("Config section '" + section_name + "' must be an object");
    }
    for (const auto& item : section.items()) {
        if (!known.count(item.key())) {
            throw key_error(section_name, item.key(), "is not a recognized option");
        }
    }
}

const nlohmann::json& section_or_empty(const nlohmann::json& j, const char* name) {
    static const nlohmann::json empty = nlohmann::json::object();
    return j.contains(name) ? j.at(name) : empty;
}

template <typename Parse>
auto parse_enum(const nlohmann::json& section, const std::string& section_name, const std::string& key,
                Parse parse) -> std::optional<decltype(parse(std::string()))> {
    std::string name;
    read_key(section, section_name, key, name);
    if (name.empty()) {
        return std::nullopt;
    }
    try {
        return parse(name);
    } catch (const std::invalid_argument&) {
        throw key_error(section_name, key, "has unknown value '" + name + "'");
    }
}

} // namespace

std::string to_string(InitMode mode) {
    switch (mode) {
        case InitMode::Fresh:      return "fresh";
        case InitMode::Resume:     return "resume";
        case InitMode::Pretrained: return "pretrained";
    }
    return "fresh";
}

InitMode init_mode_from_string(const std::string& name) {
    if (name == "fresh" || name == "scratch") return InitMode::Fresh;
    if (name == "resume") return InitMode::Resume;
    if (name == "pretrained") return InitMode::Pretrained;
    throw std::invalid_argument("Unknown init_mode: '" + name + "'");
}

DatasetOptions DataConfig::dataset_options() const {
    DatasetOptions options;
    options.tokenizer_kind = tokenizer_kind;
    options.subword_vocab_path = subword_vocab_path;
    options.use_validation_split = use_validation_split;
    options.validation_fraction = validation_fraction;
    return options;
}

training::LrScheduleOptions TrainingConfig::lr_schedule() const {
    training::LrScheduleOptions options;
    options.kind = lr_scheduler;
    options.learning_rate = learning_rate;
    options.min_lr = min_lr;
    options.warmup_steps = warmup_steps;
    options.lr_decay_steps = lr_decay_steps;
    options.step_size = step_size;
    options.step_gamma = step_gamma;
    options.polynomial_power = polynomial_power;
    return options;
}

void Config::validate() const {
    // data
    if (data.use_validation_split && !(data.validation_fraction > 0.0 && data.validation_fraction < 1.0)) {
        throw key_error("data", "validation_fraction", "must be in (0, 1)");
    }
    if (data.tokenizer_kind == EncodingKind::Subword && data.subword_vocab_path.empty()) {
        throw key_error("data", "subword_vocab_path", "is required when tokenizer_kind is 'subword'");
    }
    if (data.data_dir.empty()) {
        throw key_error("data", "data_dir", "must not be empty");
    }

    // model
    if (model.block_size == 0) throw key_error("model", "block_size", "must be positive");
    if (model.n_embd == 0) throw key_error("model", "n_embd", "must be positive");
    if (model.n_hidden == 0) throw key_error("model", "n_hidden", "must be positive");

    // training
    const auto& t = training;
    if (t.batch_size == 0) throw key_error("training", "batch_size", "must be positive");
    if (t.gradient_accumulation_steps == 0) {
        throw key_error("training", "gradient_accumulation_steps", "must be positive");
    }
    if (!(t.learning_rate > 0.0)) throw key_error("training", "learning_rate", "must be positive");
    if (t.max_steps == 0) throw key_error("training", "max_steps", "must be positive");
    if (t.eval_interval == 0) throw key_error("training", "eval_interval", "must be positive");
    if (t.eval_iters == 0) throw key_error("training", "eval_iters", "must be positive");
    if (t.log_interval == 0) throw key_error("training", "log_interval", "must be positive");
    if (t.distributed_world_size == 0) throw key_error("training", "distributed_world_size", "must be at least 1");
    if (t.gradient_accumulation_steps % t.distributed_world_size != 0) {
        throw key_error("training", "gradient_accumulation_steps", "must be divisible by distributed_world_size");
    }
    if (t.event_queue_capacity == 0) throw key_error("training", "event_queue_capacity", "must be positive");
    if (t.output_dir.empty()) throw key_error("training", "output_dir", "must not be empty");
    if (t.weight_decay < 0.0) throw key_error("training", "weight_decay", "must be non-negative");
    if (t.beta1 < 0.0 || t.beta1 >= 1.0) throw key_error("training", "beta1", "must be in [0, 1)");
    if (t.beta2 < 0.0 || t.beta2 >= 1.0) throw key_error("training", "beta2", "must be in [0, 1)");
    if (t.grad_clip < 0.0) throw key_error("training", "grad_clip", "must be non-negative");
    if (t.min_lr < 0.0) throw key_error("training", "min_lr", "must be non-negative");
    if (t.init_mode == InitMode::Pretrained && t.pretrained_path.empty()) {
        throw key_error("training", "pretrained_path", "is required when init_mode is 'pretrained'");
    }
    bool decays = t.lr_scheduler == training::LrSchedulerKind::Cosine ||
                  t.lr_scheduler == training::LrSchedulerKind::Linear ||
                  t.lr_scheduler == training::LrSchedulerKind::Polynomial;
    if (decays && t.lr_decay_steps <= t.warmup_steps) {
        throw key_error("training", "lr_decay_steps", "must exceed warmup_steps");
    }
    if (t.lr_scheduler == training::LrSchedulerKind::Step && t.step_size == 0) {
        throw key_error("training", "step_size", "must be positive");
    }

    // generation
    if (generation.temperature < 0.0) throw key_error("generation", "temperature", "must be non-negative");
    if (generation.top_k && *generation.top_k == 0) throw key_error("generation", "top_k", "must be positive");
}

nlohmann::json Config::to_json() const {
    nlohmann::json j;
    j["data"] = {
        {"input_path", data.input_path},
        {"data_dir", data.data_dir},
        {"tokenizer_kind", tinylm::to_string(data.tokenizer_kind)},
        {"subword_vocab_path", data.subword_vocab_path},
        {"subword_vocab_size", data.subword_vocab_size},
        {"use_validation_split", data.use_validation_split},
        {"validation_fraction", data.validation_fraction}
    };
    j["model"] = {
        {"block_size", model.block_size},
        {"n_embd", model.n_embd},
        {"n_hidden", model.n_hidden}
    };

    const auto& t = training;
    j["training"] = {
        {"batch_size", t.batch_size},
        {"gradient_accumulation_steps", t.gradient_accumulation_steps},
        {"learning_rate", t.learning_rate},
        {"max_steps", t.max_steps},
        {"eval_interval", t.eval_interval},
        {"eval_iters", t.eval_iters},
        {"log_interval", t.log_interval},
        {"save_interval", t.save_interval},
        {"save_best_val_checkpoint", t.save_best_val_checkpoint},
        {"init_mode", tinylm::to_string(t.init_mode)},
        {"pretrained_path", t.pretrained_path},
        {"output_dir", t.output_dir},
        {"distributed_world_size", t.distributed_world_size},
        {"num_eval_seeds", t.num_eval_seeds},
        {"seed", t.seed},
        {"weight_decay", t.weight_decay},
        {"beta1", t.beta1},
        {"beta2", t.beta2},
        {"grad_clip", t.grad_clip},
        {"lr_scheduler", training::to_string(t.lr_scheduler)},
        {"warmup_steps", t.warmup_steps},
        {"lr_decay_steps", t.lr_decay_steps},
        {"min_lr", t.min_lr},
        {"step_size", t.step_size},
        {"step_gamma", t.step_gamma},
        {"polynomial_power", t.polynomial_power},
        {"event_queue_capacity", t.event_queue_capacity},
        {"verbose", t.verbose}
    };

    j["generation"] = {
        {"checkpoint", generation.checkpoint},
        {"prompt", generation.prompt},
        {"max_new_tokens", generation.max_new_tokens},
        {"temperature", generation.temperature},
        {"seed", generation.seed}
    };
    j["generation"]["top_k"] = generation.top_k ? nlohmann::json(*generation.top_k) : nlohmann::json(nullptr);
    return j;
}

Config Config::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Config root must be a JSON object");
    }
    for (const auto& item : j.items()) {
        if (item.key() != "data" && item.key() != "model" && item.key() != "training" && item.key() != "generation") {
            throw std::invalid_argument("Unknown config section '" + item.key() + "'");
        }
    }

    Config config;

    const auto& d = section_or_empty(j, "data");
    reject_unknown_keys(d, "data", {"input_path", "data_dir", "tokenizer_kind", "subword_vocab_path",
                                    "subword_vocab_size", "use_validation_split", "validation_fraction"});
    read_key(d, "data", "input_path", config.data.input_path);
    read_key(d, "data", "data_dir", config.data.data_dir);
    if (auto kind = parse_enum(d, "data", "tokenizer_kind", encoding_kind_from_string)) {
        config.data.tokenizer_kind = *kind;
    }
    read_key(d, "data", "subword_vocab_path", config.data.subword_vocab_path);
    read_key(d, "data", "subword_vocab_size", config.data.subword_vocab_size);
    read_key(d, "data", "use_validation_split", config.data.use_validation_split);
    read_key(d, "data", "validation_fraction", config.data.validation_fraction);

    const auto& m = section_or_empty(j, "model");
    reject_unknown_keys(m, "model", {"block_size", "n_embd", "n_hidden"});
    read_key(m, "model", "block_size", config.model.block_size);
    read_key(m, "model", "n_embd", config.model.n_embd);
    read_key(m, "model", "n_hidden", config.model.n_hidden);

    const auto& t = section_or_empty(j, "training");
    auto& tc = config.training;
    reject_unknown_keys(t, "training", {
        "batch_size", "gradient_accumulation_steps", "learning_rate", "max_steps", "eval_interval",
        "eval_iters", "log_interval",
        "save_interval", "save_best_val_checkpoint", "init_mode", "pretrained_path", "output_dir",
        "distributed_world_size", "num_eval_seeds", "seed", "weight_decay", "beta1", "beta2",
        "grad_clip", "lr_scheduler", "warmup_steps", "lr_decay_steps", "min_lr", "step_size",
        "step_gamma", "polynomial_power", "event_queue_capacity", "verbose"});
    read_key(t, "training", "batch_size", tc.batch_size);
    read_key(t, "training", "gradient_accumulation_steps", tc.gradient_accumulation_steps);
    read_key(t, "training", "learning_rate", tc.learning_rate);
    read_key(t, "training", "max_steps", tc.max_steps);
    read_key(t, "training", "eval_interval", tc.eval_interval);
    read_key(t, "training", "eval_iters", tc.eval_iters);
    read_key(t, "training", "log_interval", tc.log_interval);
    read_key(t, "training", "save_interval", tc.save_interval);
    read_key(t, "training", "save_best_val_checkpoint", tc.save_best_val_checkpoint);
    if (auto mode = parse_enum(t, "training", "init_mode", init_mode_from_string)) {
        tc.init_mode = *mode;
    }
    read_key(t, "training", "pretrained_path", tc.pretrained_path);
    read_key(t, "training", "output_dir", tc.output_dir);
    read_key(t, "training", "distributed_world_size", tc.distributed_world_size);
    read_key(t, "training", "num_eval_seeds", tc.num_eval_seeds);
    read_key(t, "training", "seed", tc.seed);
    read_key(t, "training", "weight_decay", tc.weight_decay);
    read_key(t, "training", "beta1", tc.beta1);
    read_key(t, "training", "beta2", tc.beta2);
    read_key(t, "training", "grad_clip", tc.grad_clip);
    if (auto kind = parse_enum(t, "training", "lr_scheduler", training::lr_scheduler_from_string)) {
        tc.lr_scheduler = *kind;
    }
    read_key(t, "training", "warmup_steps", tc.warmup_steps);
    read_key(t, "training", "lr_decay_steps", tc.lr_decay_steps);
    read_key(t, "training", "min_lr", tc.min_lr);
    read_key(t, "training", "step_size", tc.step_size);
    read_key(t, "training", "step_gamma", tc.step_gamma);
    read_key(t, "training", "polynomial_power", tc.polynomial_power);
    read_key(t, "training", "event_queue_capacity", tc.event_queue_capacity);
    read_key(t, "training", "verbose", tc.verbose);

    const auto& g = section_or_empty(j, "generation");
    reject_unknown_keys(g, "generation", {"checkpoint", "prompt", "max_new_tokens", "temperature", "top_k", "seed"});
    read_key(g, "generation", "checkpoint", config.generation.checkpoint);
    read_key(g, "generation", "prompt", config.generation.prompt);
    read_key(g, "generation", "max_new_tokens", config.generation.max_new_tokens);
    read_key(g, "generation", "temperature", config.generation.temperature);
    read_key(g, "generation", "seed", config.generation.seed);
    if (g.contains("top_k") && !g.at("top_k").is_null()) {
        size_t k = 0;
        read_key(g, "generation", "top_k", k);
        config.generation.top_k = k;
    }

    config.validate();
    return config;
}

Config Config::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(f);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Malformed config file " + path + ": " + e.what());
    }
    return from_json(j);
}

void Config::save(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write config file: " + path);
    }
    file << to_json().dump(2);
}

void Config::apply_override(const std::string& assignment) {
    auto eq = assignment.find('=');
    auto dot = assignment.find('.');
    if (eq == std::string::npos || dot == std::string::npos || dot > eq) {
        throw std::invalid_argument("Override must look like section.key=value, got '" + assignment + "'");
    }
    std::string section = assignment.substr(0, dot);
    std::string key = assignment.substr(dot + 1, eq - dot - 1);
    std::string raw = assignment.substr(eq + 1);

    nlohmann::json value;
    try {
        value = nlohmann::json::parse(raw);
    } catch (const nlohmann::json::parse_error&) {
        value = raw;
    }

    nlohmann::json j = to_json();
    if (!j.contains(section)) {
        throw std::invalid_argument("Unknown config section '" + section + "'");
    }
    j[section][key] = value;
    *this = from_json(j);
}

void Config::print() const {
    std::cout << "=== tinylm configuration ===" << std::endl;
    std::cout << to_json().dump(2) << std::endl;
    std::cout << "============================" << std::endl;
}

} // namespace tinylm
