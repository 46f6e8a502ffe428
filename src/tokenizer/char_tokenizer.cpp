#include "tinylm/tokenizer/char_tokenizer.hpp"
#include "tinylm/tokenizer/unicode_utils.hpp"
#include "tinylm/errors.hpp"
#include <algorithm>
#include <set>
#include <stdexcept>

namespace tinylm {

CharTokenizer::CharTokenizer(std::vector<std::string> symbols)
    : symbols_(std::move(symbols)) {
    ids_.reserve(symbols_.size());
    for (size_t i = 0; i < symbols_.size(); ++i) {
        auto code_points = unicode::to_code_points(symbols_[i]);
        if (code_points.size() != 1) {
            throw std::invalid_argument("Character vocabulary entry " + std::to_string(i) +
                                        " is not a single code point");
        }
        if (!ids_.emplace(symbols_[i], static_cast<TokenID>(i)).second) {
            throw std::invalid_argument("Duplicate character in vocabulary: '" + symbols_[i] + "'");
        }
    }
}

CharTokenizer CharTokenizer::build(const std::string& corpus) {
    // Sort by code point value, not by UTF-8 bytes
    std::set<uint32_t> seen;
    std::unordered_map<uint32_t, std::string> utf8;
    for (auto& cp : unicode::to_code_points(corpus)) {
        if (seen.insert(cp.value).second) {
            utf8.emplace(cp.value, std::move(cp.utf8));
        }
    }

    std::vector<std::string> symbols;
    symbols.reserve(seen.size());
    for (uint32_t value : seen) {
        symbols.push_back(utf8.at(value));
    }
    return CharTokenizer(std::move(symbols));
}

CharTokenizer CharTokenizer::from_json(const nlohmann::json& j) {
    if (j.at("type").get<std::string>() != "char") {
        throw std::invalid_argument("Not a character vocabulary: type=" + j.at("type").get<std::string>());
    }
    return CharTokenizer(j.at("symbols").get<std::vector<std::string>>());
}

std::vector<TokenID> CharTokenizer::encode(const std::string& text) const {
    auto code_points = unicode::to_code_points(text);

    std::vector<TokenID> tokens;
    tokens.reserve(code_points.size());
    for (size_t position = 0; position < code_points.size(); ++position) {
        auto it = ids_.find(code_points[position].utf8);
        if (it == ids_.end()) {
            throw UnknownSymbolError(code_points[position].utf8, position);
        }
        tokens.push_back(it->second);
    }
    return tokens;
}

std::string CharTokenizer::decode(const std::vector<TokenID>& tokens) const {
    std::string text;
    text.reserve(tokens.size());
    for (TokenID id : tokens) {
        if (id >= symbols_.size()) {
            throw UnknownSymbolError(static_cast<uint64_t>(id), symbols_.size());
        }
        text += symbols_[id];
    }
    return text;
}

nlohmann::json CharTokenizer::to_json() const {
    return nlohmann::json{
        {"type", to_string(kind())},
        {"vocab_size", symbols_.size()},
        {"symbols", symbols_}
    };
}

} // namespace tinylm
