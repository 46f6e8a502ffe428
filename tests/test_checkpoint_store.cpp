// tests/test_checkpoint_store.cpp
#include "tinylm/checkpoint/checkpoint_store.hpp"
#include "tinylm/errors.hpp"
#include "test_utils.hpp"
#include <filesystem>
#include <limits>

using namespace tinylm;
using namespace tinylm_test;
namespace fs = std::filesystem;

namespace {

ModelCheckpoint make_checkpoint(const ModelConfig& config, size_t step) {
    LanguageModel model(config, 11);
    ModelCheckpoint checkpoint;
    checkpoint.model_config = config;
    checkpoint.parameters = model.parameters();
    checkpoint.optimizer = AdamOptimizer(1e-3f);
    // One update so the optimizer has moments to persist
    checkpoint.optimizer.update(checkpoint.parameters, model.zero_gradients());
    checkpoint.step = step;
    checkpoint.best_val_loss = 2.5;
    checkpoint.training.seed = 1337;
    checkpoint.training.learning_rate = 1e-3;
    checkpoint.training.batch_size = 8;
    checkpoint.training.lr_scheduler = "cosine";
    return checkpoint;
}

} // namespace

int main() {
    std::cout << "Testing CheckpointStore..." << std::endl;

    ModelConfig config;
    config.vocab_size = 11;
    config.block_size = 8;
    config.n_embd = 4;
    config.n_hidden = 8;

    try {
        auto dir = fresh_dir("checkpoint_store");
        CheckpointStore store(dir.string());

        section("Test 1: layout");
        check(store.latest_path() == (dir / "ckpt.bin").string(), "latest checkpoint path");
        check(store.best_path() == (dir / "best" / "ckpt.bin").string(), "best checkpoint path");
        check(store.step_path(500) == (dir / "step_500" / "ckpt.bin").string(), "step snapshot path");

        section("Test 2: resume restores everything");
        ModelCheckpoint saved = make_checkpoint(config, 40);
        std::string path = store.save_latest(saved);
        check(fs::exists(path), "checkpoint written");
        check(!fs::exists(path + ".tmp"), "no temporary file left behind");
        ModelCheckpoint resumed = CheckpointStore::load(path, LoadMode::Resume, config);
        check(resumed.step == 40, "step restored");
        check(resumed.best_val_loss == 2.5, "best validation loss restored");
        check(resumed.parameters.size() == saved.parameters.size() &&
                  resumed.parameters[LanguageModel::kOutputWeight] == saved.parameters[LanguageModel::kOutputWeight],
              "parameters restored bit for bit");
        check(resumed.optimizer.get_timestep() == 1, "optimizer timestep restored");
        check(resumed.optimizer.first_moments()[0] == saved.optimizer.first_moments()[0], "optimizer moments restored");
        check(resumed.training.batch_size == 8 && resumed.training.lr_scheduler == "cosine", "training options restored");

        section("Test 3: pretrained and weights-only loads reset training state");
        for (LoadMode mode : {LoadMode::Pretrained, LoadMode::Weights}) {
            ModelCheckpoint c = CheckpointStore::load(path, mode, config);
            check(c.step == 0, to_string(mode) + ": step reset");
            check(c.optimizer.get_timestep() == 0 && c.optimizer.first_moments().empty(),
                  to_string(mode) + ": fresh optimizer");
            check(c.best_val_loss == std::numeric_limits<double>::infinity(), to_string(mode) + ": best loss reset");
            check(c.parameters[0] == saved.parameters[0], to_string(mode) + ": weights kept");
        }

        section("Test 4: failures");
        check(throws<CheckpointNotFoundError>([&] {
                  CheckpointStore::load((dir / "nowhere" / "ckpt.bin").string(), LoadMode::Resume, config);
              }),
              "missing checkpoint reported");
        ModelConfig other = config;
        other.vocab_size = 12;
        bool mismatch = false;
        try {
            CheckpointStore::load(path, LoadMode::Resume, other);
        } catch (const ConfigMismatchError& e) {
            mismatch = e.field() == "vocab_size";
        }
        check(mismatch, "architecture mismatch names vocab_size");
        write_file(dir / "garbage.bin", "definitely not a checkpoint");
        check(throws<std::runtime_error>([&] { CheckpointStore::read((dir / "garbage.bin").string()); }),
              "corrupt file rejected");

        section("Test 5: best and step checkpoints");
        check(!store.best_val_loss().has_value(), "no best checkpoint yet");
        ModelCheckpoint best = make_checkpoint(config, 20);
        best.best_val_loss = 1.75;
        store.save_best(best);
        check(store.best_val_loss() == 1.75, "best validation loss read back");
        std::string snapshot = store.save_step(best);
        check(snapshot == store.step_path(20) && fs::exists(snapshot), "step snapshot named after its step");

        section("Test 6: overwriting keeps a readable file");
        ModelCheckpoint later = make_checkpoint(config, 80);
        store.save_latest(later);
        check(CheckpointStore::read(store.latest_path()).step == 80, "latest replaced");

        section("Test 7: loss log");
        check(store.load_loss_log().train_steps.empty(), "missing log reads as empty");
        LossLog log;
        log.record_train(10, 3.0);
        log.record_train(20, 2.5);
        log.record_val(20, 2.7);
        log.record_train(30, 2.2);
        log.record_val(30, 2.4);
        store.save_loss_log(log);
        LossLog read_back = store.load_loss_log();
        check(read_back.train_losses == log.train_losses && read_back.val_steps == log.val_steps, "log persisted");
        read_back.truncate_after(20);
        check(read_back.train_steps.size() == 2 && read_back.val_steps.size() == 1, "points after step 20 dropped");
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return finish("test_checkpoint_store");
}
