// src/models/language_model.cpp
#include "tinylm/models/language_model.hpp"
#include "tinylm/errors.hpp"
#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>

namespace tinylm {

namespace {

constexpr float kInitStd = 0.02f;

Eigen::MatrixXf normal_matrix(Eigen::Index rows, Eigen::Index cols, std::mt19937& rng) {
    std::normal_distribution<float> dist(0.0f, kInitStd);
    Eigen::MatrixXf m(rows, cols);
    // Fill in row-major order so the draw sequence does not depend on storage order
    for (Eigen::Index r = 0; r < rows; ++r) {
        for (Eigen::Index c = 0; c < cols; ++c) {
            m(r, c) = dist(rng);
        }
    }
    return m;
}

} // namespace

void ModelConfig::validate() const {
    if (vocab_size == 0) throw std::invalid_argument("model.vocab_size must be positive");
    if (block_size == 0) throw std::invalid_argument("model.block_size must be positive");
    if (n_embd == 0) throw std::invalid_argument("model.n_embd must be positive");
    if (n_hidden == 0) throw std::invalid_argument("model.n_hidden must be positive");
}

void to_json(nlohmann::json& j, const ModelConfig& config) {
    j = nlohmann::json{
        {"vocab_size", config.vocab_size},
        {"block_size", config.block_size},
        {"n_embd", config.n_embd},
        {"n_hidden", config.n_hidden}
    };
}

void from_json(const nlohmann::json& j, ModelConfig& config) {
    config.vocab_size = j.value("vocab_size", config.vocab_size);
    config.block_size = j.value("block_size", config.block_size);
    config.n_embd = j.value("n_embd", config.n_embd);
    config.n_hidden = j.value("n_hidden", config.n_hidden);
}

void check_compatible(const ModelConfig& stored, const ModelConfig& requested) {
    auto check = [](const char* field, size_t a, size_t b) {
        if (a != b) {
            throw ConfigMismatchError(field, std::to_string(a), std::to_string(b));
        }
    };
    check("vocab_size", stored.vocab_size, requested.vocab_size);
    check("block_size", stored.block_size, requested.block_size);
    check("n_embd", stored.n_embd, requested.n_embd);
    check("n_hidden", stored.n_hidden, requested.n_hidden);
}

LanguageModel::LanguageModel(const ModelConfig& config, uint64_t seed) : config_(config) {
    config_.validate();

    std::mt19937 rng(static_cast<std::mt19937::result_type>(seed));
    const auto V = static_cast<Eigen::Index>(config_.vocab_size);
    const auto T = static_cast<Eigen::Index>(config_.block_size);
    const auto d = static_cast<Eigen::Index>(config_.n_embd);
    const auto h = static_cast<Eigen::Index>(config_.n_hidden);

    params_.resize(kParameterCount);
    params_[kTokenEmbedding] = normal_matrix(V, d, rng);
    params_[kPositionEmbedding] = normal_matrix(T, d, rng);
    params_[kHiddenWeight] = normal_matrix(d, h, rng);
    params_[kHiddenBias] = Eigen::MatrixXf::Zero(1, h);
    params_[kOutputWeight] = normal_matrix(h, V, rng);
    params_[kOutputBias] = Eigen::MatrixXf::Zero(1, V);
}

const std::vector<std::string>& LanguageModel::parameter_names() {
    static const std::vector<std::string> names = {
        "token_embedding", "position_embedding",
        "hidden_weight", "hidden_bias",
        "output_weight", "output_bias"
    };
    return names;
}

void LanguageModel::set_parameters(std::vector<Eigen::MatrixXf> params) {
    if (params.size() != params_.size()) {
        throw std::invalid_argument("Expected " + std::to_string(params_.size()) +
                                    " parameter tensors, got " + std::to_string(params.size()));
    }
    for (size_t i = 0; i < params.size(); ++i) {
        if (params[i].rows() != params_[i].rows() || params[i].cols() != params_[i].cols()) {
            throw std::invalid_argument("Shape mismatch for parameter " + parameter_names()[i]);
        }
    }
    params_ = std::move(params);
}

size_t LanguageModel::num_parameters() const {
    size_t total = 0;
    for (const auto& p : params_) {
        total += static_cast<size_t>(p.size());
    }
    return total;
}

std::vector<Eigen::MatrixXf> LanguageModel::zero_gradients() const {
    std::vector<Eigen::MatrixXf> grads;
    grads.reserve(params_.size());
    for (const auto& p : params_) {
        grads.push_back(Eigen::MatrixXf::Zero(p.rows(), p.cols()));
    }
    return grads;
}

LanguageModel::Activations LanguageModel::forward_sequence(const TokenID* tokens, size_t length) const {
    if (length == 0 || length > config_.block_size) {
        throw std::invalid_argument("Sequence length " + std::to_string(length) +
                                    " outside [1, " + std::to_string(config_.block_size) + "]");
    }

    const auto& tok_emb = params_[kTokenEmbedding];
    const auto& pos_emb = params_[kPositionEmbedding];
    const auto T = static_cast<Eigen::Index>(length);
    const auto d = tok_emb.cols();

    Activations acts;
    acts.z.resize(T, d);

    Eigen::RowVectorXf prefix_sum = Eigen::RowVectorXf::Zero(d);
    for (Eigen::Index t = 0; t < T; ++t) {
        if (tokens[t] >= config_.vocab_size) {
            throw std::out_of_range("Token " + std::to_string(tokens[t]) + " outside vocabulary of size " +
                                    std::to_string(config_.vocab_size));
        }
        prefix_sum += tok_emb.row(tokens[t]);
        acts.z.row(t) = tok_emb.row(tokens[t]) + pos_emb.row(t) + prefix_sum / static_cast<float>(t + 1);
    }

    acts.hidden = acts.z * params_[kHiddenWeight];
    acts.hidden.rowwise() += params_[kHiddenBias].row(0);
    acts.hidden = acts.hidden.array().tanh().matrix();

    acts.logits = acts.hidden * params_[kOutputWeight];
    acts.logits.rowwise() += params_[kOutputBias].row(0);
    return acts;
}

double LanguageModel::sequence_loss(const Activations& acts, const TokenID* targets, size_t length,
                                    Eigen::MatrixXf* grad_logits) const {
    double total = 0.0;
    if (grad_logits) {
        grad_logits->resize(acts.logits.rows(), acts.logits.cols());
    }

    for (Eigen::Index t = 0; t < static_cast<Eigen::Index>(length); ++t) {
        if (targets[t] >= config_.vocab_size) {
            throw std::out_of_range("Target " + std::to_string(targets[t]) + " outside vocabulary of size " +
                                    std::to_string(config_.vocab_size));
        }
        auto row = acts.logits.row(t);
        float max_logit = row.maxCoeff();
        float log_sum = max_logit + std::log((row.array() - max_logit).exp().sum());
        total += static_cast<double>(log_sum - row(targets[t]));

        if (grad_logits) {
            grad_logits->row(t) = (row.array() - log_sum).exp().matrix();
            (*grad_logits)(t, targets[t]) -= 1.0f;
        }
    }
    return total;
}

void LanguageModel::backward_sequence(const TokenID* tokens, size_t length, const Activations& acts,
                                      const Eigen::MatrixXf& grad_logits,
                                      std::vector<Eigen::MatrixXf>& grads) const {
    const auto T = static_cast<Eigen::Index>(length);

    // Output projection
    grads[kOutputWeight].noalias() += acts.hidden.transpose() * grad_logits;
    grads[kOutputBias] += grad_logits.colwise().sum();

    // tanh hidden layer
    Eigen::MatrixXf grad_hidden = (grad_logits * params_[kOutputWeight].transpose()).array() *
                                  (1.0f - acts.hidden.array().square());
    grads[kHiddenWeight].noalias() += acts.z.transpose() * grad_hidden;
    grads[kHiddenBias] += grad_hidden.colwise().sum();

    Eigen::MatrixXf grad_z = grad_hidden * params_[kHiddenWeight].transpose();

    grads[kPositionEmbedding].topRows(T) += grad_z;

    // Token t contributes to its own position directly and to every later
    // position s through the prefix mean with weight 1 / (s + 1).
    Eigen::RowVectorXf suffix = Eigen::RowVectorXf::Zero(grad_z.cols());
    for (Eigen::Index t = T - 1; t >= 0; --t) {
        suffix += grad_z.row(t) / static_cast<float>(t + 1);
        grads[kTokenEmbedding].row(tokens[t]) += grad_z.row(t) + suffix;
    }
}

float LanguageModel::loss(const Batch& batch) const {
    const size_t B = batch.batch_size();
    const size_t T = batch.block_size();

    double total = 0.0;
    for (size_t b = 0; b < B; ++b) {
        const TokenID* inputs = batch.inputs.row(b).data();
        const TokenID* targets = batch.targets.row(b).data();
        Activations acts = forward_sequence(inputs, T);
        total += sequence_loss(acts, targets, T, nullptr);
    }
    return static_cast<float>(total / static_cast<double>(B * T));
}

float LanguageModel::forward_backward(const Batch& batch, std::vector<Eigen::MatrixXf>& grads) const {
    const size_t B = batch.batch_size();
    const size_t T = batch.block_size();
    const float scale = 1.0f / static_cast<float>(B * T);

    grads = zero_gradients();

    double total = 0.0;
    Eigen::MatrixXf grad_logits;
    for (size_t b = 0; b < B; ++b) {
        const TokenID* inputs = batch.inputs.row(b).data();
        const TokenID* targets = batch.targets.row(b).data();
        Activations acts = forward_sequence(inputs, T);
        total += sequence_loss(acts, targets, T, &grad_logits);
        grad_logits *= scale;
        backward_sequence(inputs, T, acts, grad_logits, grads);
    }
    return static_cast<float>(total / static_cast<double>(B * T));
}

Eigen::VectorXf LanguageModel::next_token_logits(const std::vector<TokenID>& context) const {
    if (context.empty()) {
        throw std::invalid_argument("next_token_logits requires a non-empty context");
    }
    size_t length = std::min(context.size(), config_.block_size);
    const TokenID* window = context.data() + (context.size() - length);

    Activations acts = forward_sequence(window, length);
    return acts.logits.row(static_cast<Eigen::Index>(length) - 1).transpose();
}

} // namespace tinylm
