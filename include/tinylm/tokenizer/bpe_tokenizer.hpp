#pragma once

#include <string>
#include <vector>
#include <memory>
#include "tokenizer.hpp"

namespace tinylm {

// Byte-level BPE over a fixed vocabulary. Ids 0-255 are raw bytes, each
// merge adds one id in rank order, and "<eos>" takes the last id.
class BPETokenizer : public Tokenizer {
public:
    BPETokenizer();
    ~BPETokenizer() override;
    BPETokenizer(BPETokenizer&& other) noexcept;
    BPETokenizer& operator=(BPETokenizer&& other) noexcept;

    // Training methods
    void train(const std::vector<std::string>& corpus, size_t vocab_size);

    // Encoding/decoding methods
    std::vector<TokenID> encode(const std::string& text) const override;
    std::string decode(const std::vector<TokenID>& tokens) const override;

    // Vocabulary methods
    size_t vocab_size() const override;
    size_t merge_count() const;
    EncodingKind kind() const override { return EncodingKind::Subword; }
    std::optional<TokenID> eos_token_id() const override;

    // Serialization methods
    nlohmann::json to_json() const override;
    static BPETokenizer from_json(const nlohmann::json& j);
    static BPETokenizer load_vocabulary(const std::string& path);

    // Debug methods
    void enable_debug_logging(bool enable);
    void dump_merges() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace tinylm
