// src/inference/generation_engine.cpp
#include "tinylm/inference/generation_engine.hpp"
#include "tinylm/checkpoint/checkpoint_store.hpp"
#include "tinylm/generation/sampler.hpp"
#include <stdexcept>

namespace tinylm {

GenerationEngine::GenerationEngine(std::shared_ptr<const Tokenizer> tokenizer, LanguageModel model)
    : tokenizer_(std::move(tokenizer)), model_(std::move(model)) {
    if (!tokenizer_) {
        throw std::invalid_argument("GenerationEngine requires a tokenizer");
    }
    if (tokenizer_->vocab_size() != model_.config().vocab_size) {
        throw std::invalid_argument("Tokenizer vocabulary (" + std::to_string(tokenizer_->vocab_size()) +
                                    ") does not match the model (" + std::to_string(model_.config().vocab_size) + ")");
    }
}

GenerationEngine GenerationEngine::from_checkpoint(const std::string& checkpoint_path,
                                                   std::shared_ptr<const Tokenizer> tokenizer,
                                                   const ModelConfig& expected) {
    ModelCheckpoint checkpoint = CheckpointStore::load(checkpoint_path, LoadMode::Weights, expected);
    LanguageModel model(checkpoint.model_config, 0);
    model.set_parameters(std::move(checkpoint.parameters));
    return GenerationEngine(std::move(tokenizer), std::move(model));
}

GenerationResult GenerationEngine::generate(const std::string& prompt, size_t max_new_tokens, double temperature,
                                            std::optional<size_t> top_k, uint64_t seed) const {
    GenerationOptions options;
    options.max_new_tokens = max_new_tokens;
    options.temperature = temperature;
    options.top_k = top_k;
    options.seed = seed;
    return generate(prompt, options);
}

GenerationResult GenerationEngine::generate(const std::string& prompt, const GenerationOptions& options) const {
    auto sampler = make_sampler(options.temperature, options.top_k, options.seed);

    std::vector<TokenID> context = tokenizer_->encode(prompt);
    // An empty prompt is seeded with token 0, which is not part of the output
    const bool seeded = context.empty();
    if (seeded) {
        context.push_back(0);
    }

    const std::optional<TokenID> eos = tokenizer_->eos_token_id();

    GenerationResult result;
    for (size_t i = 0; i < options.max_new_tokens; ++i) {
        TokenID next = sampler->sample(model_.next_token_logits(context));
        if (eos && next == *eos) {
            result.stopped_at_eos = true;
            break;
        }
        context.push_back(next);
        ++result.new_tokens;
    }

    if (seeded) {
        context.erase(context.begin());
    }
    result.tokens = std::move(context);
    result.text = tokenizer_->decode(result.tokens);
    return result;
}

} // namespace tinylm
