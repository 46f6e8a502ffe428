// include/tinylm/models/language_model.hpp
#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <Eigen/Dense>
#include <cereal/cereal.hpp>
#include <nlohmann/json.hpp>
#include "../tokenizer/token_types.hpp"
#include "../data/batch_sampler.hpp"

namespace tinylm {

// Architecture of the model. Checkpoints refuse to load into a model
// whose configuration differs in any of these fields.
struct ModelConfig {
    size_t vocab_size = 0;
    size_t block_size = 128;
    size_t n_embd = 64;
    size_t n_hidden = 128;

    void validate() const;

    template <class Archive>
    void serialize(Archive& archive) {
        archive(
            cereal::make_nvp("vocab_size", vocab_size),
            cereal::make_nvp("block_size", block_size),
            cereal::make_nvp("n_embd", n_embd),
            cereal::make_nvp("n_hidden", n_hidden)
        );
    }
};

void to_json(nlohmann::json& j, const ModelConfig& config);
void from_json(const nlohmann::json& j, ModelConfig& config);

// Throws ConfigMismatchError naming the first field that differs
void check_compatible(const ModelConfig& stored, const ModelConfig& requested);

// Small causal language model. Each position sees its own token and
// position embedding plus the running mean of the prefix embeddings,
// followed by one tanh hidden layer and a projection to the vocabulary.
class LanguageModel {
public:
    enum ParameterIndex {
        kTokenEmbedding = 0,
        kPositionEmbedding,
        kHiddenWeight,
        kHiddenBias,
        kOutputWeight,
        kOutputBias,
        kParameterCount
    };

    // Weights drawn from N(0, 0.02) with the given seed, biases zero
    LanguageModel(const ModelConfig& config, uint64_t seed);

    const ModelConfig& config() const { return config_; }

    std::vector<Eigen::MatrixXf>& parameters() { return params_; }
    const std::vector<Eigen::MatrixXf>& parameters() const { return params_; }
    void set_parameters(std::vector<Eigen::MatrixXf> params);

    static const std::vector<std::string>& parameter_names();
    size_t num_parameters() const;

    std::vector<Eigen::MatrixXf> zero_gradients() const;

    // Mean cross-entropy over every position of the batch
    float loss(const Batch& batch) const;

    // Same loss; gradients are written into grads (resized as needed)
    float forward_backward(const Batch& batch, std::vector<Eigen::MatrixXf>& grads) const;

    // Logits for the token following context; only the last block_size
    // tokens are used.
    Eigen::VectorXf next_token_logits(const std::vector<TokenID>& context) const;

private:
    struct Activations {
        Eigen::MatrixXf z;       // T x n_embd
        Eigen::MatrixXf hidden;  // T x n_hidden
        Eigen::MatrixXf logits;  // T x vocab
    };

    ModelConfig config_;
    std::vector<Eigen::MatrixXf> params_;

    Activations forward_sequence(const TokenID* tokens, size_t length) const;
    double sequence_loss(const Activations& acts, const TokenID* targets, size_t length,
                         Eigen::MatrixXf* grad_logits) const;
    void backward_sequence(const TokenID* tokens, size_t length, const Activations& acts,
                           const Eigen::MatrixXf& grad_logits, std::vector<Eigen::MatrixXf>& grads) const;
};

} // namespace tinylm
