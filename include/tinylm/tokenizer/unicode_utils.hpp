//# Unicode Utilities Header File

#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace tinylm::unicode {

// Unicode character representation
struct CodePoint {
    uint32_t value;
    std::string utf8;  // UTF-8 representation
};

// Coarse character classes used to pre-split text before subword merges
enum class CharClass {
    Letter,
    Number,
    Whitespace,
    Punctuation,
    Other
};

bool is_whitespace(uint32_t codepoint);
bool is_punctuation(uint32_t codepoint);
bool is_letter(uint32_t codepoint);
bool is_digit(uint32_t codepoint);

CharClass char_class(uint32_t codepoint);

// Normalize Unicode text (NFC normalization)
std::string normalize(const std::string& text);

// Split text into Unicode code points. Throws std::invalid_argument on
// malformed UTF-8, naming the byte offset.
std::vector<CodePoint> to_code_points(const std::string& text);

// Convert code points back to UTF-8 string
std::string from_code_points(const std::vector<CodePoint>& code_points);

// Split text into runs of the same character class. A single space directly
// before a letter or digit run is kept with that run. Concatenating the
// result gives back the input.
std::vector<std::string> split_on_class_boundaries(const std::string& text);

} // namespace tinylm::unicode
