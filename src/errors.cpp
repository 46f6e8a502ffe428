// src/errors.cpp
#include "tinylm/errors.hpp"
#include <sstream>

namespace tinylm {

std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnknownSymbol:        return "UnknownSymbolError";
        case ErrorKind::InsufficientData:     return "InsufficientDataError";
        case ErrorKind::ConfigMismatch:       return "ConfigMismatchError";
        case ErrorKind::NumericalInstability: return "NumericalInstabilityError";
        case ErrorKind::Cancellation:         return "CancellationError";
        case ErrorKind::CheckpointNotFound:   return "CheckpointNotFoundError";
    }
    return "Error";
}

Error::Error(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

nlohmann::json Error::to_json() const {
    return nlohmann::json{
        {"kind", to_string(kind_)},
        {"message", what()}
    };
}

namespace {

std::string unknown_symbol_message(const std::string& symbol, size_t position) {
    std::ostringstream oss;
    oss << "Unknown symbol '" << symbol << "' at position " << position
        << ": it is not part of the tokenizer vocabulary";
    return oss.str();
}

std::string unknown_token_message(uint64_t token_id, size_t vocab_size) {
    std::ostringstream oss;
    oss << "Unknown token id " << token_id << ": vocabulary size is " << vocab_size;
    return oss.str();
}

std::string insufficient_data_message(const std::string& split, size_t required, size_t actual) {
    std::ostringstream oss;
    oss << "Dataset too small: " << split << " split has " << actual
        << " tokens, but at least " << required << " (block_size + 1) are required. "
        << "Either reduce block size or add more data.";
    return oss.str();
}

} // namespace

UnknownSymbolError::UnknownSymbolError(const std::string& symbol, size_t position)
    : Error(ErrorKind::UnknownSymbol, unknown_symbol_message(symbol, position)),
      symbol_(symbol), position_(position) {}

UnknownSymbolError::UnknownSymbolError(uint64_t token_id, size_t vocab_size)
    : Error(ErrorKind::UnknownSymbol, unknown_token_message(token_id, vocab_size)),
      symbol_(std::to_string(token_id)), position_(0) {}

nlohmann::json UnknownSymbolError::to_json() const {
    auto j = Error::to_json();
    j["symbol"] = symbol_;
    j["position"] = position_;
    return j;
}

InsufficientDataError::InsufficientDataError(const std::string& split, size_t required, size_t actual)
    : Error(ErrorKind::InsufficientData, insufficient_data_message(split, required, actual)),
      split_(split), required_(required), actual_(actual) {}

nlohmann::json InsufficientDataError::to_json() const {
    auto j = Error::to_json();
    j["split"] = split_;
    j["required"] = required_;
    j["actual"] = actual_;
    return j;
}

ConfigMismatchError::ConfigMismatchError(const std::string& field, const std::string& stored,
                                         const std::string& requested)
    : Error(ErrorKind::ConfigMismatch,
            "Checkpoint was produced with " + field + "=" + stored +
            " but " + field + "=" + requested + " was requested"),
      field_(field), stored_(stored), requested_(requested) {}

nlohmann::json ConfigMismatchError::to_json() const {
    auto j = Error::to_json();
    j["field"] = field_;
    j["stored"] = stored_;
    j["requested"] = requested_;
    return j;
}

NumericalInstabilityError::NumericalInstabilityError(size_t step, double loss, const std::string& quantity)
    : Error(ErrorKind::NumericalInstability,
            quantity == "loss" ? "Non-finite loss (" + std::to_string(loss) + ") at step " + std::to_string(step)
                               : "Non-finite " + quantity + " at step " + std::to_string(step) +
                                     " (loss " + std::to_string(loss) + ")"),
      step_(step), loss_(loss), quantity_(quantity) {}

nlohmann::json NumericalInstabilityError::to_json() const {
    auto j = Error::to_json();
    j["step"] = step_;
    // json has no NaN/inf literals
    j["loss"] = std::to_string(loss_);
    j["quantity"] = quantity_;
    return j;
}

CancellationError::CancellationError(size_t step)
    : Error(ErrorKind::Cancellation, "Stopped by user after step " + std::to_string(step)),
      step_(step) {}

nlohmann::json CancellationError::to_json() const {
    auto j = Error::to_json();
    j["step"] = step_;
    return j;
}

CheckpointNotFoundError::CheckpointNotFoundError(const std::string& path)
    : Error(ErrorKind::CheckpointNotFound, "Checkpoint not found: " + path),
      path_(path) {}

nlohmann::json CheckpointNotFoundError::to_json() const {
    auto j = Error::to_json();
    j["path"] = path_;
    return j;
}

} // namespace tinylm
