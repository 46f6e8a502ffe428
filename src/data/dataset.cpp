// src/data/dataset.cpp
#include "tinylm/data/dataset.hpp"
#include "tinylm/tokenizer/char_tokenizer.hpp"
#include "tinylm/tokenizer/bpe_tokenizer.hpp"
#include "tinylm/errors.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace tinylm {

namespace {

const char* kTrainFile = "train.bin";
const char* kValFile = "val.bin";
const char* kTokenizerFile = "tokenizer.json";
const char* kMetaFile = "meta.json";

nlohmann::json read_json(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open " + path.string());
    }
    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Malformed JSON in " + path.string() + ": " + e.what());
    }
    return j;
}

} // namespace

nlohmann::json DatasetManifest::to_json() const {
    return nlohmann::json{
        {"tokenizer_kind", to_string(tokenizer_kind)},
        {"vocab_size", vocab_size},
        {"train_tokens", train_tokens},
        {"val_tokens", val_tokens},
        {"has_validation", has_validation},
        {"validation_fraction", validation_fraction},
        {"dtype", dtype}
    };
}

DatasetManifest DatasetManifest::from_json(const nlohmann::json& j) {
    DatasetManifest manifest;
    manifest.tokenizer_kind = encoding_kind_from_string(j.at("tokenizer_kind").get<std::string>());
    manifest.vocab_size = j.at("vocab_size").get<size_t>();
    manifest.train_tokens = j.at("train_tokens").get<size_t>();
    manifest.val_tokens = j.at("val_tokens").get<size_t>();
    manifest.has_validation = j.at("has_validation").get<bool>();
    manifest.validation_fraction = j.value("validation_fraction", 0.0);
    manifest.dtype = j.value("dtype", std::string("uint32"));
    if (manifest.dtype != "uint32") {
        throw std::runtime_error("Unsupported token dtype in manifest: " + manifest.dtype);
    }
    return manifest;
}

void require_sufficient_tokens(const TokenStream& stream, const std::string& split, size_t block_size) {
    if (stream.size() < block_size + 1) {
        throw InsufficientDataError(split, block_size + 1, stream.size());
    }
}

Dataset::Dataset(std::shared_ptr<const Tokenizer> tokenizer, TokenStream train,
                 std::optional<TokenStream> validation)
    : tokenizer_(std::move(tokenizer)), train_(std::move(train)), validation_(std::move(validation)) {
    if (!tokenizer_) {
        throw std::invalid_argument("Dataset requires a tokenizer");
    }
    size_t total = train_.size() + (validation_ ? validation_->size() : 0);
    if (validation_ && total > 0) {
        validation_fraction_ = static_cast<double>(validation_->size()) / static_cast<double>(total);
    }
}

const TokenStream& Dataset::validation() const {
    if (!validation_) {
        throw std::logic_error("Dataset has no validation split");
    }
    return *validation_;
}

const TokenStream& Dataset::split(const std::string& name) const {
    if (name == "train") return train_;
    if (name == "validation" || name == "val") return validation();
    throw std::invalid_argument("Unknown dataset split: '" + name + "'");
}

DatasetManifest Dataset::manifest() const {
    DatasetManifest manifest;
    manifest.tokenizer_kind = tokenizer_->kind();
    manifest.vocab_size = tokenizer_->vocab_size();
    manifest.train_tokens = train_.size();
    manifest.val_tokens = validation_ ? validation_->size() : 0;
    manifest.has_validation = validation_.has_value();
    manifest.validation_fraction = validation_fraction_;
    return manifest;
}

void Dataset::require_sufficient(size_t block_size) const {
    require_sufficient_tokens(train_, "train", block_size);
    if (validation_) {
        require_sufficient_tokens(*validation_, "validation", block_size);
    }
}

void Dataset::save(const std::string& data_dir) const {
    fs::path dir(data_dir);
    fs::create_directories(dir);

    train_.write((dir / kTrainFile).string());
    if (validation_) {
        validation_->write((dir / kValFile).string());
    } else if (fs::exists(dir / kValFile)) {
        // Stale split from an earlier build must not be picked up
        fs::remove(dir / kValFile);
    }
    tokenizer_->save((dir / kTokenizerFile).string());

    nlohmann::json meta = manifest().to_json();
    meta["vocabulary"] = tokenizer_->to_json();
    std::ofstream file(dir / kMetaFile);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write " + (dir / kMetaFile).string());
    }
    file << meta.dump(2);
}

Dataset Dataset::load(const std::string& data_dir) {
    fs::path dir(data_dir);
    for (const char* name : {kTrainFile, kTokenizerFile, kMetaFile}) {
        if (!fs::exists(dir / name)) {
            throw std::runtime_error(std::string(name) + " not found in " + data_dir);
        }
    }

    DatasetManifest manifest = DatasetManifest::from_json(read_json(dir / kMetaFile));
    std::shared_ptr<const Tokenizer> tokenizer = Tokenizer::load((dir / kTokenizerFile).string());

    if (tokenizer->vocab_size() != manifest.vocab_size) {
        throw std::runtime_error("tokenizer.json vocabulary size " + std::to_string(tokenizer->vocab_size()) +
                                 " disagrees with meta.json (" + std::to_string(manifest.vocab_size) + ")");
    }

    TokenStream train = TokenStream::read((dir / kTrainFile).string(), manifest.vocab_size, manifest.tokenizer_kind);

    std::optional<TokenStream> validation;
    if (manifest.has_validation) {
        if (!fs::exists(dir / kValFile)) {
            throw std::runtime_error(std::string(kValFile) + " not found in " + data_dir);
        }
        validation = TokenStream::read((dir / kValFile).string(), manifest.vocab_size, manifest.tokenizer_kind);
    }

    Dataset dataset(std::move(tokenizer), std::move(train), std::move(validation));
    dataset.validation_fraction_ = manifest.validation_fraction;
    return dataset;
}

DatasetBuilder::DatasetBuilder(DatasetOptions options) : options_(std::move(options)) {
    if (options_.use_validation_split &&
        !(options_.validation_fraction > 0.0 && options_.validation_fraction < 1.0)) {
        throw std::invalid_argument("validation_fraction must be in (0, 1), got " +
                                    std::to_string(options_.validation_fraction));
    }
    if (options_.tokenizer_kind == EncodingKind::Subword && options_.subword_vocab_path.empty()) {
        throw std::invalid_argument("subword_vocab_path is required for the subword tokenizer");
    }
}

std::shared_ptr<const Tokenizer> DatasetBuilder::make_tokenizer(const std::string& text) const {
    switch (options_.tokenizer_kind) {
        case EncodingKind::Char:
            return std::make_shared<CharTokenizer>(CharTokenizer::build(text));
        case EncodingKind::Subword:
            return std::make_shared<BPETokenizer>(BPETokenizer::load_vocabulary(options_.subword_vocab_path));
    }
    throw std::invalid_argument("Unsupported tokenizer kind");
}

Dataset DatasetBuilder::build(const std::string& text) const {
    if (text.empty()) {
        throw std::invalid_argument("Cannot build a dataset from empty text");
    }

    auto tokenizer = make_tokenizer(text);
    std::vector<TokenID> ids = tokenizer->encode(text);
    TokenStream all(std::move(ids), tokenizer->vocab_size(), tokenizer->kind());

    const size_t total = all.size();
    if (!options_.use_validation_split) {
        Dataset dataset(std::move(tokenizer), std::move(all), std::nullopt);
        return dataset;
    }

    size_t val_len = static_cast<size_t>(std::llround(options_.validation_fraction * static_cast<double>(total)));
    size_t train_len = total - val_len;

    Dataset dataset(std::move(tokenizer), all.slice(0, train_len), all.slice(train_len, total));
    dataset.validation_fraction_ = options_.validation_fraction;

    std::cout << "Tokenized " << total << " tokens: " << train_len << " train, "
              << val_len << " validation" << std::endl;
    return dataset;
}

Dataset DatasetBuilder::build_and_save(const std::string& text, const std::string& data_dir) const {
    Dataset dataset = build(text);
    dataset.save(data_dir);
    return dataset;
}

std::string DatasetBuilder::read_text_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open input text: " + path);
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

} // namespace tinylm
