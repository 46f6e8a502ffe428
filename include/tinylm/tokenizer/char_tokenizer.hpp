#pragma once

#include <string>
#include <unordered_map>
#include <vector>
#include "tokenizer.hpp"

namespace tinylm {

// One token per Unicode code point. The vocabulary is the sorted set of
// code points seen in the corpus the tokenizer was built from.
class CharTokenizer : public Tokenizer {
public:
    explicit CharTokenizer(std::vector<std::string> symbols);

    static CharTokenizer build(const std::string& corpus);
    static CharTokenizer from_json(const nlohmann::json& j);

    std::vector<TokenID> encode(const std::string& text) const override;
    std::string decode(const std::vector<TokenID>& tokens) const override;

    size_t vocab_size() const override { return symbols_.size(); }
    EncodingKind kind() const override { return EncodingKind::Char; }
    std::optional<TokenID> eos_token_id() const override { return std::nullopt; }

    nlohmann::json to_json() const override;

    const std::vector<std::string>& symbols() const { return symbols_; }

private:
    std::vector<std::string> symbols_;
    std::unordered_map<std::string, TokenID> ids_;
};

} // namespace tinylm
