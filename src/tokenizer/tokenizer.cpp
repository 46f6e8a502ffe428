#include "tinylm/tokenizer/tokenizer.hpp"
#include "tinylm/tokenizer/char_tokenizer.hpp"
#include "tinylm/tokenizer/bpe_tokenizer.hpp"
#include <fstream>
#include <stdexcept>

namespace tinylm {

void Tokenizer::save(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open tokenizer file for writing: " + path);
    }
    file << to_json().dump(2);
    if (!file) {
        throw std::runtime_error("Failed to write tokenizer file: " + path);
    }
}

std::unique_ptr<Tokenizer> Tokenizer::from_json(const nlohmann::json& j) {
    EncodingKind kind = encoding_kind_from_string(j.at("type").get<std::string>());
    switch (kind) {
        case EncodingKind::Char:
            return std::make_unique<CharTokenizer>(CharTokenizer::from_json(j));
        case EncodingKind::Subword:
            return std::make_unique<BPETokenizer>(BPETokenizer::from_json(j));
    }
    throw std::invalid_argument("Unsupported tokenizer type");
}

std::unique_ptr<Tokenizer> Tokenizer::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open tokenizer file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Malformed tokenizer file " + path + ": " + e.what());
    }
    return from_json(j);
}

} // namespace tinylm
