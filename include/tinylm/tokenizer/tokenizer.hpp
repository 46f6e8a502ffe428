#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "token_types.hpp"

namespace tinylm {

// Common interface of the character and subword tokenizers. A tokenizer is
// immutable after construction and may be shared between threads.
class Tokenizer {
public:
    virtual ~Tokenizer() = default;

    virtual std::vector<TokenID> encode(const std::string& text) const = 0;
    virtual std::string decode(const std::vector<TokenID>& tokens) const = 0;

    virtual size_t vocab_size() const = 0;
    virtual EncodingKind kind() const = 0;
    virtual std::optional<TokenID> eos_token_id() const = 0;

    // Vocabulary description, tagged with "type"
    virtual nlohmann::json to_json() const = 0;

    void save(const std::string& path) const;

    static std::unique_ptr<Tokenizer> from_json(const nlohmann::json& j);
    static std::unique_ptr<Tokenizer> load(const std::string& path);
};

} // namespace tinylm
