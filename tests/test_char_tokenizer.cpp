// tests/test_char_tokenizer.cpp
#include "tinylm/tokenizer/char_tokenizer.hpp"
#include "tinylm/errors.hpp"
#include "test_utils.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace tinylm;
using namespace tinylm_test;

int main() {
    std::cout << "Testing CharTokenizer..." << std::endl;

    try {
        section("Test 1: vocabulary is the sorted set of code points");
        CharTokenizer tokenizer = CharTokenizer::build("hello world");
        const auto& symbols = tokenizer.symbols();
        check(tokenizer.vocab_size() == 8, "8 distinct characters in 'hello world'");
        check(symbols.front() == " ", "space sorts first");
        check(symbols.back() == "w", "'w' sorts last");
        check(tokenizer.kind() == EncodingKind::Char, "kind is char");
        check(!tokenizer.eos_token_id().has_value(), "no end-of-sequence token");

        section("Test 2: encode then decode returns the text");
        std::string text = "hello world";
        auto ids = tokenizer.encode(text);
        check(ids.size() == text.size(), "one token per character");
        check(tokenizer.decode(ids) == text, "round trip");

        section("Test 3: multi-byte characters");
        std::string accented = "caf\xC3\xA9 na\xC3\xAFve";
        CharTokenizer unicode_tokenizer = CharTokenizer::build(accented);
        auto unicode_ids = unicode_tokenizer.encode(accented);
        check(unicode_ids.size() == 10, "code points counted, not bytes");
        check(unicode_tokenizer.decode(unicode_ids) == accented, "multi-byte round trip");

        section("Test 4: unknown symbols");
        bool reported = false;
        try {
            tokenizer.encode("hello!");
        } catch (const UnknownSymbolError& e) {
            reported = e.symbol() == "!" && e.position() == 5;
        }
        check(reported, "unknown '!' reported with its position");
        check(throws<UnknownSymbolError>([&] { tokenizer.decode({0, 99}); }), "out of range id rejected");

        section("Test 5: persistence");
        auto dir = fresh_dir("char_tokenizer");
        std::string path = (dir / "tokenizer.json").string();
        tokenizer.save(path);
        std::unique_ptr<Tokenizer> loaded = Tokenizer::load(path);
        check(loaded->kind() == EncodingKind::Char, "loaded kind");
        check(loaded->vocab_size() == tokenizer.vocab_size(), "loaded vocabulary size");
        check(loaded->encode(text) == ids, "loaded tokenizer encodes identically");

        section("Test 6: invalid vocabularies");
        check(throws<std::invalid_argument>([] { CharTokenizer(std::vector<std::string>{"a", "a"}); }), "duplicate symbol rejected");
        check(throws<std::invalid_argument>([] { CharTokenizer(std::vector<std::string>{"ab"}); }), "multi-character symbol rejected");
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return finish("test_char_tokenizer");
}
