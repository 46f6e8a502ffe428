// tests/test_bpe_tokenizer.cpp
#include "tinylm/tokenizer/bpe_tokenizer.hpp"
#include "tinylm/errors.hpp"
#include "test_utils.hpp"
#include <vector>

using namespace tinylm;
using namespace tinylm_test;

int main() {
    std::cout << "Testing BPETokenizer..." << std::endl;

    std::vector<std::string> corpus = {
        "the quick brown fox jumps over the lazy dog",
        "the lazy dog sleeps in the sun",
        "a quick brown dog outpaces the fox",
        "the the the quick quick brown"
    };

    try {
        section("Test 1: training");
        BPETokenizer tokenizer;
        tokenizer.train(corpus, 300);
        check(tokenizer.merge_count() > 0, "learned some merges");
        check(tokenizer.vocab_size() <= 300, "vocabulary within the requested size");
        check(tokenizer.vocab_size() == 256 + tokenizer.merge_count() + 1, "bytes + merges + <eos>");
        check(tokenizer.eos_token_id() == static_cast<TokenID>(tokenizer.vocab_size() - 1), "<eos> takes the last id");

        section("Test 2: merges shorten frequent text");
        std::string text = "the quick brown fox";
        auto tokens = tokenizer.encode(text);
        check(tokens.size() < text.size(), "fewer tokens than bytes");
        check(tokenizer.decode(tokens) == text, "round trip");

        section("Test 3: unseen text still encodes byte-wise");
        std::string unseen = "zebra \xC3\xA9t\xC3\xA9 42";
        check(tokenizer.decode(tokenizer.encode(unseen)) == unseen, "unseen text round trip");
        check(tokenizer.encode("").empty(), "empty text encodes to nothing");

        section("Test 4: deterministic training");
        BPETokenizer again;
        again.train(corpus, 300);
        check(again.to_json() == tokenizer.to_json(), "same corpus gives the same merges");

        section("Test 5: persistence");
        auto dir = fresh_dir("bpe_tokenizer");
        std::string path = (dir / "vocab.json").string();
        tokenizer.save(path);
        BPETokenizer loaded = BPETokenizer::load_vocabulary(path);
        check(loaded.vocab_size() == tokenizer.vocab_size(), "loaded vocabulary size");
        check(loaded.encode(text) == tokens, "loaded tokenizer encodes identically");
        auto generic = Tokenizer::load(path);
        check(generic->kind() == EncodingKind::Subword, "generic loader dispatches on type");

        section("Test 6: errors");
        check(throws<std::invalid_argument>([] { BPETokenizer t; t.train({"abc"}, 100); }),
              "vocabulary smaller than the byte alphabet rejected");
        check(throws<std::invalid_argument>([] { BPETokenizer t; t.train({}, 300); }), "empty corpus rejected");
        check(throws<UnknownSymbolError>([&] { tokenizer.decode({static_cast<TokenID>(tokenizer.vocab_size())}); }),
              "id past the vocabulary rejected");
        check(tokenizer.decode({*tokenizer.eos_token_id()}) == "<eos>", "<eos> decodes to its marker");
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return finish("test_bpe_tokenizer");
}
