#include "tinylm/tokenizer/token_types.hpp"
#include <stdexcept>

namespace tinylm {

std::string to_string(EncodingKind kind) {
    switch (kind) {
        case EncodingKind::Char:    return "char";
        case EncodingKind::Subword: return "subword";
    }
    return "char";
}

EncodingKind encoding_kind_from_string(const std::string& name) {
    if (name == "char") return EncodingKind::Char;
    if (name == "subword") return EncodingKind::Subword;
    throw std::invalid_argument("Unknown tokenizer kind: '" + name + "' (expected 'char' or 'subword')");
}

} // namespace tinylm
