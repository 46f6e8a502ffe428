// tests/test_config.cpp
#include "tinylm/config.hpp"
#include "test_utils.hpp"

using namespace tinylm;
using namespace tinylm_test;

namespace {

// True when f throws std::invalid_argument whose message names `key`
template <typename F>
bool rejects_key(F&& f, const std::string& key) {
    try {
        f();
    } catch (const std::invalid_argument& e) {
        return std::string(e.what()).find(key) != std::string::npos;
    }
    return false;
}

} // namespace

int main() {
    std::cout << "Testing Config..." << std::endl;

    try {
        section("Test 1: defaults");
        {
            Config config;
            config.validate();
            check(config.training.lr_scheduler == training::LrSchedulerKind::Cosine, "cosine schedule by default");
            check(config.training.init_mode == InitMode::Fresh, "fresh start by default");
            check(config.data.tokenizer_kind == EncodingKind::Char, "char tokenizer by default");
            check(!config.generation.top_k.has_value(), "no top_k by default");
        }

        section("Test 2: JSON round trip");
        {
            Config config;
            config.model.n_embd = 48;
            config.training.gradient_accumulation_steps = 4;
            config.training.lr_scheduler = training::LrSchedulerKind::Step;
            config.training.init_mode = InitMode::Resume;
            config.generation.top_k = 12;
            Config back = Config::from_json(config.to_json());
            check(back.model.n_embd == 48, "model field");
            check(back.training.gradient_accumulation_steps == 4, "accumulation steps");
            check(back.training.lr_scheduler == training::LrSchedulerKind::Step, "scheduler");
            check(back.training.init_mode == InitMode::Resume, "init mode");
            check(back.generation.top_k == std::optional<size_t>(12), "top_k");
            check(back.to_json() == config.to_json(), "identical JSON");
        }

        section("Test 3: partial files keep defaults");
        {
            Config config = Config::from_json(nlohmann::json::parse(R"({"training": {"max_steps": 50}})"));
            check(config.training.max_steps == 50, "given key applied");
            check(config.training.batch_size == Config().training.batch_size, "missing key keeps default");

            Config scratch = Config::from_json(nlohmann::json::parse(R"({"training": {"init_mode": "scratch"}})"));
            check(scratch.training.init_mode == InitMode::Fresh, "scratch is an alias of fresh");
        }

        section("Test 4: rejected inputs name the key");
        {
            check(rejects_key([] { Config::from_json(nlohmann::json::parse(R"({"training": {"max_stpes": 5}})")); },
                              "training.max_stpes"), "unknown key");
            check(rejects_key([] { Config::from_json(nlohmann::json::parse(R"({"training": {"max_steps": "many"}})")); },
                              "training.max_steps"), "wrong type");
            check(rejects_key([] { Config::from_json(nlohmann::json::parse(R"({"training": {"batch_size": -4}})")); },
                              "training.batch_size"), "negative size");
            check(rejects_key([] { Config::from_json(nlohmann::json::parse(R"({"training": {"lr_scheduler": "exp"}})")); },
                              "training.lr_scheduler"), "unknown scheduler");
            check(rejects_key([] { Config::from_json(nlohmann::json::parse(R"({"optim": {}})")); }, "optim"),
                  "unknown section");

            Config config;
            config.training.learning_rate = 0.0;
            check(rejects_key([&] { config.validate(); }, "training.learning_rate"), "zero learning rate");

            Config schedule;
            schedule.training.warmup_steps = 500;
            schedule.training.lr_decay_steps = 400;
            check(rejects_key([&] { schedule.validate(); }, "training.lr_decay_steps"), "decay ends before warmup");

            Config pretrained;
            pretrained.training.init_mode = InitMode::Pretrained;
            check(rejects_key([&] { pretrained.validate(); }, "training.pretrained_path"), "pretrained needs a path");

            Config accumulate;
            accumulate.training.gradient_accumulation_steps = 0;
            check(rejects_key([&] { accumulate.validate(); }, "training.gradient_accumulation_steps"),
                  "zero accumulation steps");
            accumulate.training.gradient_accumulation_steps = 3;
            accumulate.training.distributed_world_size = 2;
            check(rejects_key([&] { accumulate.validate(); }, "training.gradient_accumulation_steps"),
                  "accumulation steps not divisible by the world size");
            accumulate.training.gradient_accumulation_steps = 4;
            accumulate.validate();

            Config subword;
            subword.data.tokenizer_kind = EncodingKind::Subword;
            check(rejects_key([&] { subword.validate(); }, "data.subword_vocab_path"), "subword needs a vocabulary");
        }

        section("Test 5: command line overrides");
        {
            Config config;
            config.apply_override("training.max_steps=500");
            check(config.training.max_steps == 500, "number parsed");
            config.apply_override("training.lr_scheduler=linear");
            check(config.training.lr_scheduler == training::LrSchedulerKind::Linear, "bare word taken as a string");
            config.apply_override("generation.prompt=hello there");
            check(config.generation.prompt == "hello there", "text with spaces");
            config.apply_override("data.use_validation_split=false");
            check(!config.data.use_validation_split, "boolean parsed");

            check(throws<std::invalid_argument>([&] { config.apply_override("max_steps=5"); }), "missing section");
            check(throws<std::invalid_argument>([&] { config.apply_override("training.max_steps"); }), "missing value");
            check(rejects_key([&] { config.apply_override("training.nope=1"); }, "training.nope"), "unknown key");
            check(config.training.max_steps == 500, "failed override leaves the config alone");
        }

        section("Test 6: files");
        {
            auto dir = fresh_dir("config");
            Config config;
            config.training.output_dir = (dir / "out").string();
            config.training.seed = 99;
            const std::string path = (dir / "config.json").string();
            config.save(path);
            Config loaded = Config::load(path);
            check(loaded.training.seed == 99 && loaded.training.output_dir == config.training.output_dir, "saved and loaded");

            write_file(dir / "broken.json", "{ \"training\": ");
            check(throws<std::runtime_error>([&] { Config::load((dir / "broken.json").string()); }), "malformed file");
            check(throws<std::runtime_error>([&] { Config::load((dir / "absent.json").string()); }), "missing file");
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return finish("test_config");
}
