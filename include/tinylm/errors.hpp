// include/tinylm/errors.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace tinylm {

enum class ErrorKind {
    UnknownSymbol,
    InsufficientData,
    ConfigMismatch,
    NumericalInstability,
    Cancellation,
    CheckpointNotFound
};

std::string to_string(ErrorKind kind);

// Base of every structured error surfaced to callers. to_json() carries
// the kind, the message and the kind-specific fields.
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message);

    ErrorKind kind() const noexcept { return kind_; }
    virtual nlohmann::json to_json() const;

private:
    ErrorKind kind_;
};

class UnknownSymbolError : public Error {
public:
    // Symbol not in the character vocabulary at the given code point offset
    UnknownSymbolError(const std::string& symbol, size_t position);
    // Token id outside the vocabulary while decoding
    UnknownSymbolError(uint64_t token_id, size_t vocab_size);

    const std::string& symbol() const { return symbol_; }
    size_t position() const { return position_; }

    nlohmann::json to_json() const override;

private:
    std::string symbol_;
    size_t position_;
};

class InsufficientDataError : public Error {
public:
    InsufficientDataError(const std::string& split, size_t required, size_t actual);

    const std::string& split() const { return split_; }
    size_t required() const { return required_; }
    size_t actual() const { return actual_; }

    nlohmann::json to_json() const override;

private:
    std::string split_;
    size_t required_;
    size_t actual_;
};

class ConfigMismatchError : public Error {
public:
    ConfigMismatchError(const std::string& field, const std::string& stored,
                        const std::string& requested);

    const std::string& field() const { return field_; }
    const std::string& stored() const { return stored_; }
    const std::string& requested() const { return requested_; }

    nlohmann::json to_json() const override;

private:
    std::string field_;
    std::string stored_;
    std::string requested_;
};

class NumericalInstabilityError : public Error {
public:
    // quantity names what went non-finite: "loss", "gradient norm", ...
    NumericalInstabilityError(size_t step, double loss, const std::string& quantity = "loss");

    size_t step() const { return step_; }
    double loss() const { return loss_; }
    const std::string& quantity() const { return quantity_; }

    nlohmann::json to_json() const override;

private:
    size_t step_;
    double loss_;
    std::string quantity_;
};

class CancellationError : public Error {
public:
    explicit CancellationError(size_t step);

    size_t step() const { return step_; }

    nlohmann::json to_json() const override;

private:
    size_t step_;
};

class CheckpointNotFoundError : public Error {
public:
    explicit CheckpointNotFoundError(const std::string& path);

    const std::string& path() const { return path_; }

    nlohmann::json to_json() const override;

private:
    std::string path_;
};

} // namespace tinylm
