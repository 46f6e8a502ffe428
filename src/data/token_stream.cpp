// src/data/token_stream.cpp
#include "tinylm/data/token_stream.hpp"
#include <fstream>
#include <stdexcept>

namespace tinylm {

TokenStream::TokenStream(std::vector<TokenID> tokens, size_t vocab_size, EncodingKind kind)
    : tokens_(std::move(tokens)), vocab_size_(vocab_size), kind_(kind) {
    for (size_t i = 0; i < tokens_.size(); ++i) {
        if (tokens_[i] >= vocab_size_) {
            throw std::out_of_range("Token " + std::to_string(tokens_[i]) + " at index " + std::to_string(i) +
                                    " is outside the vocabulary of size " + std::to_string(vocab_size_));
        }
    }
}

TokenStream TokenStream::slice(size_t begin, size_t end) const {
    if (begin > end || end > tokens_.size()) {
        throw std::out_of_range("Invalid token slice [" + std::to_string(begin) + ", " +
                                std::to_string(end) + ") of " + std::to_string(tokens_.size()));
    }
    return TokenStream(std::vector<TokenID>(tokens_.begin() + begin, tokens_.begin() + end), vocab_size_, kind_);
}

void TokenStream::write(const std::string& path) const {
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open token file for writing: " + path);
    }

    std::vector<unsigned char> buffer(tokens_.size() * 4);
    for (size_t i = 0; i < tokens_.size(); ++i) {
        TokenID id = tokens_[i];
        buffer[4 * i + 0] = static_cast<unsigned char>(id & 0xFF);
        buffer[4 * i + 1] = static_cast<unsigned char>((id >> 8) & 0xFF);
        buffer[4 * i + 2] = static_cast<unsigned char>((id >> 16) & 0xFF);
        buffer[4 * i + 3] = static_cast<unsigned char>((id >> 24) & 0xFF);
    }
    file.write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    if (!file) {
        throw std::runtime_error("Failed to write token file: " + path);
    }
}

TokenStream TokenStream::read(const std::string& path, size_t vocab_size, EncodingKind kind) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open token file: " + path);
    }

    std::streamsize bytes = file.tellg();
    if (bytes % 4 != 0) {
        throw std::runtime_error("Token file " + path + " is not a whole number of uint32 words");
    }
    file.seekg(0);

    std::vector<unsigned char> buffer(static_cast<size_t>(bytes));
    if (!file.read(reinterpret_cast<char*>(buffer.data()), bytes)) {
        throw std::runtime_error("Failed to read token file: " + path);
    }

    std::vector<TokenID> tokens(buffer.size() / 4);
    for (size_t i = 0; i < tokens.size(); ++i) {
        tokens[i] = static_cast<TokenID>(buffer[4 * i]) |
                    (static_cast<TokenID>(buffer[4 * i + 1]) << 8) |
                    (static_cast<TokenID>(buffer[4 * i + 2]) << 16) |
                    (static_cast<TokenID>(buffer[4 * i + 3]) << 24);
    }
    return TokenStream(std::move(tokens), vocab_size, kind);
}

} // namespace tinylm
