// include/tinylm/data/dataset.hpp
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "token_stream.hpp"
#include "../tokenizer/tokenizer.hpp"

namespace tinylm {

struct DatasetOptions {
    EncodingKind tokenizer_kind = EncodingKind::Char;
    std::string subword_vocab_path;     // required for subword
    bool use_validation_split = true;
    double validation_fraction = 0.1;   // trailing share held out
};

// Contents of meta.json
struct DatasetManifest {
    EncodingKind tokenizer_kind = EncodingKind::Char;
    size_t vocab_size = 0;
    size_t train_tokens = 0;
    size_t val_tokens = 0;
    bool has_validation = false;
    double validation_fraction = 0.0;
    std::string dtype = "uint32";

    nlohmann::json to_json() const;
    static DatasetManifest from_json(const nlohmann::json& j);
};

// Throws InsufficientDataError unless the stream can yield one window of
// block_size inputs plus the shifted target.
void require_sufficient_tokens(const TokenStream& stream, const std::string& split, size_t block_size);

class Dataset {
public:
    Dataset(std::shared_ptr<const Tokenizer> tokenizer, TokenStream train,
            std::optional<TokenStream> validation);

    const TokenStream& train() const { return train_; }
    bool has_validation() const { return validation_.has_value(); }
    const TokenStream& validation() const;

    // "train" or "validation"
    const TokenStream& split(const std::string& name) const;

    const Tokenizer& tokenizer() const { return *tokenizer_; }
    std::shared_ptr<const Tokenizer> shared_tokenizer() const { return tokenizer_; }

    DatasetManifest manifest() const;

    // Checks train and, when present, validation
    void require_sufficient(size_t block_size) const;

    void save(const std::string& data_dir) const;
    static Dataset load(const std::string& data_dir);

private:
    std::shared_ptr<const Tokenizer> tokenizer_;
    TokenStream train_;
    std::optional<TokenStream> validation_;
    double validation_fraction_ = 0.0;

    friend class DatasetBuilder;
};

class DatasetBuilder {
public:
    explicit DatasetBuilder(DatasetOptions options);

    // Tokenizes once and splits off the trailing validation share
    Dataset build(const std::string& text) const;
    Dataset build_and_save(const std::string& text, const std::string& data_dir) const;

    const DatasetOptions& options() const { return options_; }

    static std::string read_text_file(const std::string& path);

private:
    DatasetOptions options_;

    std::shared_ptr<const Tokenizer> make_tokenizer(const std::string& text) const;
};

} // namespace tinylm
