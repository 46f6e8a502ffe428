// tests/test_generation.cpp
#include "tinylm/checkpoint/checkpoint_store.hpp"
#include "tinylm/errors.hpp"
#include "tinylm/generation/greedy_sampler.hpp"
#include "tinylm/generation/temperature_sampler.hpp"
#include "tinylm/generation/topk_sampler.hpp"
#include "tinylm/inference/generation_engine.hpp"
#include "tinylm/tokenizer/bpe_tokenizer.hpp"
#include "tinylm/tokenizer/char_tokenizer.hpp"
#include "test_utils.hpp"
#include <set>

using namespace tinylm;
using namespace tinylm_test;

namespace {

ModelConfig small_config(size_t vocab_size) {
    ModelConfig config;
    config.vocab_size = vocab_size;
    config.block_size = 8;
    config.n_embd = 8;
    config.n_hidden = 16;
    return config;
}

// Output bias large enough that `favored` dominates every context
LanguageModel biased_model(size_t vocab_size, TokenID favored) {
    LanguageModel model(small_config(vocab_size), 7);
    model.parameters()[LanguageModel::kOutputBias](0, favored) = 50.0f;
    return model;
}

} // namespace

int main() {
    std::cout << "Testing generation..." << std::endl;

    try {
        auto chars = std::make_shared<CharTokenizer>(CharTokenizer::build(sample_corpus(1)));
        const size_t V = chars->vocab_size();

        section("Test 1: greedy sampler");
        {
            GreedySampler greedy;
            Eigen::VectorXf logits(4);
            logits << 0.5f, 2.0f, 2.0f, -1.0f;
            check(greedy.sample(logits) == 1, "ties go to the lowest id");
        }

        section("Test 2: temperature sampler follows the softmax");
        {
            Eigen::VectorXf logits(3);
            logits << 1.0f, 0.0f, -1.0f;
            Eigen::VectorXf probs = softmax_with_temperature(logits, 1.0f);
            check(near(probs.sum(), 1.0, 1e-5), "probabilities sum to one");

            TemperatureSampler sampler(1.0f, 42);
            std::vector<size_t> counts(3, 0);
            const size_t draws = 20000;
            for (size_t i = 0; i < draws; ++i) {
                ++counts[sampler.sample(logits)];
            }
            bool close = true;
            for (size_t i = 0; i < 3; ++i) {
                close = close && std::fabs(static_cast<double>(counts[i]) / draws - probs(i)) < 0.02;
            }
            check(close, "empirical frequencies match");

            Eigen::VectorXf sharp = softmax_with_temperature(logits, 0.1f);
            check(sharp(0) > 0.99f, "low temperature concentrates the mass");
        }

        section("Test 3: top-k sampler");
        {
            Eigen::VectorXf logits(5);
            logits << 0.1f, 3.0f, 2.5f, -2.0f, 0.0f;
            TopKSampler top2(2, 1.0f, 9);
            std::set<TokenID> seen;
            for (int i = 0; i < 500; ++i) {
                seen.insert(top2.sample(logits));
            }
            check(seen == std::set<TokenID>({1, 2}), "only the two best candidates are drawn");

            TopKSampler top1(1, 1.0f, 9);
            check(top1.sample(logits) == 1, "k = 1 is argmax");
            check(throws<std::invalid_argument>([] { TopKSampler bad(0, 1.0f, 1); }), "k = 0 rejected");
        }

        section("Test 4: sampler selection and argument checks");
        {
            check(throws<std::invalid_argument>([] { make_sampler(-0.5, std::nullopt, 1); }), "negative temperature");
            check(throws<std::invalid_argument>([] { make_sampler(1.0, size_t(0), 1); }), "top_k of zero");
            check(dynamic_cast<GreedySampler*>(make_sampler(0.0, std::nullopt, 1).get()) != nullptr,
                  "temperature 0 is greedy");
            check(dynamic_cast<TopKSampler*>(make_sampler(0.8, size_t(5), 1).get()) != nullptr, "top_k selects top-k");
        }

        section("Test 5: vanishing temperatures decode greedily");
        {
            Eigen::VectorXf logits(3);
            logits << 0.5f, 2.0f, 1.0f;
            bool argmax = true;
            for (uint64_t seed = 0; seed < 20; ++seed) {
                argmax = argmax && make_sampler(1e-40, std::nullopt, seed)->sample(logits) == 1;
                argmax = argmax && make_sampler(1e-40, size_t(2), seed)->sample(logits) == 1;
            }
            check(argmax, "overflowing 1 / temperature picks the argmax");

            Eigen::VectorXf probs = softmax_with_temperature(logits, 1e-40f);
            check(probs.allFinite() && probs(1) == 1.0f && probs.sum() == 1.0f, "softmax collapses to one-hot");

            std::unique_ptr<Sampler> underflow;
            check(!throws<std::invalid_argument>([&] { underflow = make_sampler(1e-50, std::nullopt, 7); }),
                  "temperature below float resolution accepted");
            check(dynamic_cast<GreedySampler*>(underflow.get()) != nullptr, "and treated as greedy");
        }

        section("Test 6: greedy generation is deterministic");
        {
            const TokenID favored = chars->encode("e").front();
            GenerationEngine engine(chars, biased_model(V, favored));
            GenerationResult a = engine.generate("the ", 10, 0.0, std::nullopt, 1);
            GenerationResult b = engine.generate("the ", 10, 0.0, std::nullopt, 999);
            check(a.tokens == b.tokens, "seed does not matter for greedy");
            check(a.new_tokens == 10 && a.tokens.size() == 14, "prompt followed by ten tokens");
            check(a.text == "the eeeeeeeeee", "decoded text");
            check(!a.stopped_at_eos, "char tokenizer has no eos");

            GenerationResult top1 = engine.generate("the ", 10, 1.0, size_t(1), 5);
            check(top1.tokens == a.tokens, "top_k = 1 matches greedy");
        }

        section("Test 7: sampled generation is reproducible per seed");
        {
            GenerationEngine engine(chars, LanguageModel(small_config(V), 3));
            GenerationResult a = engine.generate("a small", 40, 1.0, std::nullopt, 77);
            GenerationResult b = engine.generate("a small", 40, 1.0, std::nullopt, 77);
            check(a.tokens == b.tokens, "same seed, same continuation");
            check(a.text.rfind("a small", 0) == 0, "output starts with the prompt");

            GenerationResult none = engine.generate("a small", 0, 1.0, std::nullopt, 77);
            check(none.text == "a small" && none.new_tokens == 0, "zero new tokens returns the prompt");

            GenerationResult empty = engine.generate("", 5, 1.0, std::nullopt, 77);
            check(empty.tokens.size() == 5, "empty prompt generates from scratch");

            GenerationResult long_run = engine.generate("a", 30, 0.0, std::nullopt, 1);
            check(long_run.tokens.size() == 31, "context longer than block_size is cropped, not rejected");
        }

        section("Test 8: prompt and model errors");
        {
            GenerationEngine engine(chars, LanguageModel(small_config(V), 3));
            check(throws<UnknownSymbolError>([&] { engine.generate("zebra #", 5, 1.0, std::nullopt, 1); }),
                  "unknown prompt symbol");
            check(throws<std::invalid_argument>([&] { engine.generate("the", 5, -1.0, std::nullopt, 1); }),
                  "negative temperature");
            check(throws<std::invalid_argument>([&] { GenerationEngine other(chars, LanguageModel(small_config(V + 1), 3)); }),
                  "vocabulary mismatch");
        }

        section("Test 9: generation stops at eos");
        {
            std::vector<std::string> corpus;
            for (int i = 0; i < 20; ++i) {
                corpus.push_back("hello world, hello tokens");
            }
            auto bpe = std::make_shared<BPETokenizer>();
            bpe->train(corpus, 270);
            const TokenID eos = *bpe->eos_token_id();

            GenerationEngine engine(bpe, biased_model(bpe->vocab_size(), eos));
            GenerationResult result = engine.generate("hello", 20, 1.0, std::nullopt, 3);
            check(result.stopped_at_eos, "stopped at eos");
            check(result.new_tokens == 0, "eos is not appended");
            check(result.text == "hello", "text is the prompt");
        }

        section("Test 10: loading from a checkpoint");
        {
            auto dir = fresh_dir("generation");
            const std::string path = (dir / "ckpt.bin").string();
            ModelCheckpoint checkpoint;
            checkpoint.model_config = small_config(V);
            checkpoint.parameters = biased_model(V, 2).parameters();
            CheckpointStore::save(checkpoint, path);

            GenerationEngine engine = GenerationEngine::from_checkpoint(path, chars, small_config(V));
            check(engine.model().parameters()[LanguageModel::kOutputBias](0, 2) == 50.0f, "weights restored");

            ModelConfig wider = small_config(V);
            wider.n_embd = 16;
            check(throws<ConfigMismatchError>([&] { GenerationEngine::from_checkpoint(path, chars, wider); }),
                  "architecture mismatch");
            check(throws<CheckpointNotFoundError>([&] {
                GenerationEngine::from_checkpoint((dir / "missing.bin").string(), chars, small_config(V));
            }), "missing checkpoint");
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return finish("test_generation");
}
