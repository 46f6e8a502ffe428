// include/tinylm/data/token_stream.hpp
#pragma once

#include <string>
#include <vector>
#include "../tokenizer/token_types.hpp"

namespace tinylm {

// Ordered token ids of one dataset split. Every id is below vocab_size.
class TokenStream {
public:
    TokenStream() = default;
    TokenStream(std::vector<TokenID> tokens, size_t vocab_size, EncodingKind kind);

    const std::vector<TokenID>& tokens() const { return tokens_; }
    size_t size() const { return tokens_.size(); }
    bool empty() const { return tokens_.empty(); }
    size_t vocab_size() const { return vocab_size_; }
    EncodingKind kind() const { return kind_; }

    TokenID operator[](size_t index) const { return tokens_[index]; }

    // Copy of [begin, end)
    TokenStream slice(size_t begin, size_t end) const;

    // Raw little-endian uint32 words
    void write(const std::string& path) const;
    static TokenStream read(const std::string& path, size_t vocab_size, EncodingKind kind);

private:
    std::vector<TokenID> tokens_;
    size_t vocab_size_ = 0;
    EncodingKind kind_ = EncodingKind::Char;
};

} // namespace tinylm
