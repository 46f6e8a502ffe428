#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace tinylm {

using TokenID = uint32_t;

enum class EncodingKind {
    Char,
    Subword
};

std::string to_string(EncodingKind kind);
EncodingKind encoding_kind_from_string(const std::string& name);

} // namespace tinylm
