// src/checkpoint/checkpoint_store.cpp
#include "tinylm/checkpoint/checkpoint_store.hpp"
#include "tinylm/errors.hpp"
#include <cereal/archives/binary.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace tinylm {

namespace {

// "TLMCKPT1" little endian
constexpr uint64_t kCheckpointMagic = 0x3154504B434D4C54ULL;
constexpr uint32_t kCheckpointVersion = 1;
const char* kCheckpointFile = "ckpt.bin";

// Writes through a sibling temporary file and renames it into place
template <typename Writer>
void write_atomically(const fs::path& path, Writer&& writer, std::ios::openmode mode) {
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }
    fs::path tmp = path;
    tmp += ".tmp";

    try {
        {
            std::ofstream ofs(tmp, mode);
            if (!ofs.is_open()) {
                throw std::runtime_error("Cannot open " + tmp.string() + " for writing");
            }
            writer(ofs);
            ofs.flush();
            if (!ofs) {
                throw std::runtime_error("Write to " + tmp.string() + " failed");
            }
        }
        fs::rename(tmp, path);
    } catch (const std::exception&) {
        std::error_code ec;
        fs::remove(tmp, ec);
        throw;
    }
}

} // namespace

std::string to_string(LoadMode mode) {
    switch (mode) {
        case LoadMode::Resume:     return "resume";
        case LoadMode::Pretrained: return "pretrained";
        case LoadMode::Weights:    return "weights";
    }
    return "weights";
}

void LossLog::record_train(size_t step, double loss) {
    train_steps.push_back(step);
    train_losses.push_back(loss);
}

void LossLog::record_val(size_t step, double loss) {
    val_steps.push_back(step);
    val_losses.push_back(loss);
}

void LossLog::truncate_after(size_t step) {
    while (!train_steps.empty() && train_steps.back() > step) {
        train_steps.pop_back();
        train_losses.pop_back();
    }
    while (!val_steps.empty() && val_steps.back() > step) {
        val_steps.pop_back();
        val_losses.pop_back();
    }
}

nlohmann::json LossLog::to_json() const {
    return nlohmann::json{
        {"train_steps", train_steps},
        {"train_losses", train_losses},
        {"val_steps", val_steps},
        {"val_losses", val_losses}
    };
}

LossLog LossLog::from_json(const nlohmann::json& j) {
    LossLog log;
    log.train_steps = j.value("train_steps", std::vector<size_t>{});
    log.train_losses = j.value("train_losses", std::vector<double>{});
    log.val_steps = j.value("val_steps", std::vector<size_t>{});
    log.val_losses = j.value("val_losses", std::vector<double>{});
    if (log.train_steps.size() != log.train_losses.size() || log.val_steps.size() != log.val_losses.size()) {
        throw std::runtime_error("Loss log has mismatched step and loss arrays");
    }
    return log;
}

CheckpointStore::CheckpointStore(std::string output_dir) : output_dir_(std::move(output_dir)) {
    if (output_dir_.empty()) {
        throw std::invalid_argument("output_dir must not be empty");
    }
}

void CheckpointStore::save(const ModelCheckpoint& checkpoint, const std::string& path) {
    write_atomically(fs::path(path), [&](std::ofstream& ofs) {
        cereal::BinaryOutputArchive archive(ofs);
        archive(kCheckpointMagic, kCheckpointVersion);
        archive(checkpoint);
    }, std::ios::binary | std::ios::trunc);
}

ModelCheckpoint CheckpointStore::read(const std::string& path) {
    if (!exists(path)) {
        throw CheckpointNotFoundError(path);
    }

    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.is_open()) {
        throw std::runtime_error("Cannot open checkpoint " + path);
    }

    ModelCheckpoint checkpoint;
    try {
        cereal::BinaryInputArchive archive(ifs);
        uint64_t magic = 0;
        uint32_t version = 0;
        archive(magic, version);
        if (magic != kCheckpointMagic) {
            throw std::runtime_error("not a tinylm checkpoint");
        }
        if (version != kCheckpointVersion) {
            throw std::runtime_error("unsupported checkpoint version " + std::to_string(version));
        }
        archive(checkpoint);
    } catch (const cereal::Exception& e) {
        throw std::runtime_error("Corrupt checkpoint " + path + ": " + e.what());
    } catch (const std::exception& e) {
        throw std::runtime_error("Cannot read checkpoint " + path + ": " + e.what());
    }
    return checkpoint;
}

ModelCheckpoint CheckpointStore::load(const std::string& path, LoadMode mode, const ModelConfig& expected) {
    ModelCheckpoint checkpoint = read(path);
    check_compatible(checkpoint.model_config, expected);

    switch (mode) {
        case LoadMode::Resume:
            break;
        case LoadMode::Pretrained:
        case LoadMode::Weights:
            checkpoint.optimizer.reset();
            checkpoint.step = 0;
            checkpoint.best_val_loss = std::numeric_limits<double>::infinity();
            break;
    }
    return checkpoint;
}

bool CheckpointStore::exists(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

std::string CheckpointStore::latest_path() const {
    return (fs::path(output_dir_) / kCheckpointFile).string();
}

std::string CheckpointStore::best_path() const {
    return (fs::path(output_dir_) / "best" / kCheckpointFile).string();
}

std::string CheckpointStore::step_path(size_t step) const {
    return (fs::path(output_dir_) / ("step_" + std::to_string(step)) / kCheckpointFile).string();
}

std::string CheckpointStore::loss_log_path() const {
    return (fs::path(output_dir_) / "loss_log.json").string();
}

std::string CheckpointStore::save_latest(const ModelCheckpoint& checkpoint) const {
    std::string path = latest_path();
    save(checkpoint, path);
    return path;
}

std::string CheckpointStore::save_best(const ModelCheckpoint& checkpoint) const {
    std::string path = best_path();
    save(checkpoint, path);
    return path;
}

std::string CheckpointStore::save_step(const ModelCheckpoint& checkpoint) const {
    std::string path = step_path(checkpoint.step);
    save(checkpoint, path);
    return path;
}

std::optional<double> CheckpointStore::best_val_loss() const {
    if (!exists(best_path())) {
        return std::nullopt;
    }
    return read(best_path()).best_val_loss;
}

LossLog CheckpointStore::load_loss_log() const {
    std::ifstream file(loss_log_path());
    if (!file.is_open()) {
        return LossLog{};
    }
    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Malformed loss log " + loss_log_path() + ": " + e.what());
    }
    return LossLog::from_json(j);
}

void CheckpointStore::save_loss_log(const LossLog& log) const {
    write_atomically(fs::path(loss_log_path()), [&](std::ofstream& ofs) {
        ofs << log.to_json().dump(2);
    }, std::ios::trunc);
}

} // namespace tinylm
