// src/tokenizer/unicode_utils.cpp
#include "tinylm/tokenizer/unicode_utils.hpp"
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/normlzr.h>
#include <unicode/utf8.h>
#include <stdexcept>

namespace tinylm::unicode {

bool is_whitespace(uint32_t codepoint) {
    return u_isUWhiteSpace(codepoint);
}

bool is_punctuation(uint32_t codepoint) {
    return u_ispunct(codepoint);
}

bool is_letter(uint32_t codepoint) {
    return u_isalpha(codepoint);
}

bool is_digit(uint32_t codepoint) {
    return u_isdigit(codepoint);
}

CharClass char_class(uint32_t codepoint) {
    if (is_letter(codepoint)) return CharClass::Letter;
    if (is_digit(codepoint)) return CharClass::Number;
    if (is_whitespace(codepoint)) return CharClass::Whitespace;
    if (is_punctuation(codepoint)) return CharClass::Punctuation;
    return CharClass::Other;
}

std::string normalize(const std::string& text) {
    icu::UnicodeString unicode_str = icu::UnicodeString::fromUTF8(text);
    icu::UnicodeString normalized;
    UErrorCode status = U_ZERO_ERROR;

    icu::Normalizer::normalize(unicode_str, UNORM_NFC, 0, normalized, status);

    if (U_FAILURE(status)) {
        throw std::runtime_error(std::string("Unicode normalization failed: ") + u_errorName(status));
    }

    std::string result;
    normalized.toUTF8String(result);
    return result;
}

std::vector<CodePoint> to_code_points(const std::string& text) {
    std::vector<CodePoint> code_points;
    code_points.reserve(text.size());

    const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());
    const int32_t length = static_cast<int32_t>(text.size());
    int32_t i = 0;

    while (i < length) {
        const int32_t start = i;
        UChar32 codepoint;

        // Decode UTF-8, advances i
        U8_NEXT(bytes, i, length, codepoint);

        if (codepoint < 0) {
            throw std::invalid_argument("Invalid UTF-8 sequence at byte offset " + std::to_string(start));
        }

        CodePoint cp;
        cp.value = static_cast<uint32_t>(codepoint);
        cp.utf8 = text.substr(start, i - start);
        code_points.push_back(std::move(cp));
    }

    return code_points;
}

std::string from_code_points(const std::vector<CodePoint>& code_points) {
    std::string result;
    for (const auto& cp : code_points) {
        result += cp.utf8;
    }
    return result;
}

std::vector<std::string> split_on_class_boundaries(const std::string& text) {
    std::vector<std::string> pieces;
    std::string current;
    CharClass current_class = CharClass::Other;

    for (const auto& cp : to_code_points(text)) {
        CharClass cls = char_class(cp.value);

        if (current.empty()) {
            current = cp.utf8;
            current_class = cls;
            continue;
        }

        bool leading_space = current == " " &&
            (cls == CharClass::Letter || cls == CharClass::Number);

        if (cls == current_class || leading_space) {
            current += cp.utf8;
            current_class = cls;
        } else {
            pieces.push_back(std::move(current));
            current = cp.utf8;
            current_class = cls;
        }
    }

    if (!current.empty()) {
        pieces.push_back(std::move(current));
    }
    return pieces;
}

} // namespace tinylm::unicode
