// tests/test_unicode_utils.cpp
#include "tinylm/tokenizer/unicode_utils.hpp"
#include "test_utils.hpp"
#include <stdexcept>
#include <vector>

using namespace tinylm;
using namespace tinylm_test;

int main() {
    std::cout << "Testing Unicode utilities..." << std::endl;

    try {
        section("Test 1: code point decoding");
        auto cps = unicode::to_code_points("a\xC3\xA9\xE2\x82\xAC");  // a, e-acute, euro sign
        check(cps.size() == 3, "three code points");
        check(cps[0].value == 0x61 && cps[1].value == 0xE9 && cps[2].value == 0x20AC, "code point values");
        check(unicode::from_code_points(cps) == "a\xC3\xA9\xE2\x82\xAC", "re-encoding gives the input");

        section("Test 2: malformed UTF-8");
        check(throws<std::invalid_argument>([] { unicode::to_code_points("ab\xFF"); }), "invalid byte rejected");
        check(throws<std::invalid_argument>([] { unicode::to_code_points("\xC3"); }), "truncated sequence rejected");

        section("Test 3: NFC normalization");
        // e followed by combining acute accent composes to U+00E9
        check(unicode::normalize("e\xCC\x81") == "\xC3\xA9", "combining sequence composed");
        check(unicode::normalize("plain") == "plain", "ASCII unchanged");

        section("Test 4: character classes");
        check(unicode::char_class('a') == unicode::CharClass::Letter, "letter");
        check(unicode::char_class('7') == unicode::CharClass::Number, "digit");
        check(unicode::char_class(' ') == unicode::CharClass::Whitespace, "space");
        check(unicode::char_class('!') == unicode::CharClass::Punctuation, "punctuation");

        section("Test 5: splitting on class boundaries");
        std::string text = "hello world, 42 times!";
        auto pieces = unicode::split_on_class_boundaries(text);
        std::string joined;
        for (const auto& p : pieces) {
            joined += p;
        }
        check(joined == text, "pieces concatenate back to the input");
        check(pieces.size() >= 2 && pieces[0] == "hello" && pieces[1] == " world",
              "leading space joins the following word");
        check(unicode::split_on_class_boundaries("").empty(), "empty input gives no pieces");
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return finish("test_unicode_utils");
}
