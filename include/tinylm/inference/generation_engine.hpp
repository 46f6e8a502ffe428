// include/tinylm/inference/generation_engine.hpp
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "../models/language_model.hpp"
#include "../tokenizer/tokenizer.hpp"

namespace tinylm {

struct GenerationOptions {
    size_t max_new_tokens = 200;
    double temperature = 1.0;          // 0 is greedy
    std::optional<size_t> top_k;
    uint64_t seed = 1337;
};

struct GenerationResult {
    std::vector<TokenID> tokens;       // prompt followed by the continuation
    std::string text;
    size_t new_tokens = 0;
    bool stopped_at_eos = false;
};

// Autoregressive sampling from a trained model
class GenerationEngine {
public:
    GenerationEngine(std::shared_ptr<const Tokenizer> tokenizer, LanguageModel model);

    // Reads weights only; throws ConfigMismatchError when the checkpoint
    // was trained with a different architecture or vocabulary.
    static GenerationEngine from_checkpoint(const std::string& checkpoint_path,
                                            std::shared_ptr<const Tokenizer> tokenizer,
                                            const ModelConfig& expected);

    // Throws std::invalid_argument for a negative temperature or a top_k
    // of 0, and UnknownSymbolError when the prompt cannot be encoded.
    GenerationResult generate(const std::string& prompt, const GenerationOptions& options) const;
    GenerationResult generate(const std::string& prompt, size_t max_new_tokens, double temperature,
                              std::optional<size_t> top_k, uint64_t seed) const;

    const Tokenizer& tokenizer() const { return *tokenizer_; }
    const LanguageModel& model() const { return model_; }

private:
    std::shared_ptr<const Tokenizer> tokenizer_;
    LanguageModel model_;
};

} // namespace tinylm
