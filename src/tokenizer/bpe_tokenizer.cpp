#include "tinylm/tokenizer/bpe_tokenizer.hpp"
#include "tinylm/tokenizer/unicode_utils.hpp"
#include "tinylm/errors.hpp"
#include <fstream>
#include <algorithm>
#include <stdexcept>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <limits>
#include <unordered_map>

namespace tinylm {

namespace {

constexpr TokenID kByteVocabSize = 256;
const std::string kEosToken = "<eos>";

struct PairHash {
    size_t operator()(const std::pair<TokenID, TokenID>& p) const {
        return std::hash<uint64_t>()((static_cast<uint64_t>(p.first) << 32) | p.second);
    }
};

struct VectorHash {
    size_t operator()(const std::vector<TokenID>& vec) const {
        size_t seed = vec.size();
        for (const auto& token : vec) {
            seed ^= token + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        }
        return seed;
    }
};

using PairCounts = std::unordered_map<std::pair<TokenID, TokenID>, size_t, PairHash>;

std::string printable(const std::string& bytes) {
    std::ostringstream oss;
    for (unsigned char c : bytes) {
        if (c >= 32 && c <= 126) {
            oss << c;
        } else {
            oss << "\\x" << std::hex << std::setw(2) << std::setfill('0')
                << static_cast<int>(c) << std::dec;
        }
    }
    return oss.str();
}

} // namespace

struct BPETokenizer::Impl {
    std::vector<std::string> token_bytes;                  // id -> bytes, excluding <eos>
    std::vector<std::pair<TokenID, TokenID>> merges;       // rank order
    std::unordered_map<std::pair<TokenID, TokenID>, TokenID, PairHash> merge_ids;
    bool debug_logging = false;

    TokenID eos_id() const { return static_cast<TokenID>(token_bytes.size()); }

    void initialize_vocab();
    void add_merge(const std::pair<TokenID, TokenID>& pair);
    std::vector<std::string> split_text(const std::string& text) const;
    std::vector<TokenID> piece_to_token_ids(const std::string& piece) const;
    void apply_merges(std::vector<TokenID>& tokens) const;

    void get_pair_counts_from_sequences(const std::vector<std::pair<std::vector<TokenID>, size_t>>& tokenized_corpus,
                                        PairCounts& pair_counts) const;
    void perform_merge_on_sequences(const std::pair<TokenID, TokenID>& pair, TokenID new_token_id,
                                    std::vector<std::pair<std::vector<TokenID>, size_t>>& tokenized_corpus);
};

void BPETokenizer::Impl::initialize_vocab() {
    token_bytes.clear();
    merges.clear();
    merge_ids.clear();
    token_bytes.reserve(kByteVocabSize);

    // Add bytes
    for (TokenID i = 0; i < kByteVocabSize; i++) {
        token_bytes.emplace_back(1, static_cast<char>(i));
    }
}

void BPETokenizer::Impl::add_merge(const std::pair<TokenID, TokenID>& pair) {
    TokenID new_id = static_cast<TokenID>(token_bytes.size());
    if (pair.first >= new_id || pair.second >= new_id) {
        throw std::invalid_argument("Merge " + std::to_string(merges.size()) + " references undefined token (" +
                                    std::to_string(pair.first) + ", " + std::to_string(pair.second) + ")");
    }
    if (!merge_ids.emplace(pair, new_id).second) {
        throw std::invalid_argument("Duplicate merge (" + std::to_string(pair.first) + ", " +
                                    std::to_string(pair.second) + ")");
    }
    token_bytes.push_back(token_bytes[pair.first] + token_bytes[pair.second]);
    merges.push_back(pair);
}

std::vector<std::string> BPETokenizer::Impl::split_text(const std::string& text) const {
    return unicode::split_on_class_boundaries(unicode::normalize(text));
}

std::vector<TokenID> BPETokenizer::Impl::piece_to_token_ids(const std::string& piece) const {
    std::vector<TokenID> tokens;
    tokens.reserve(piece.size());
    for (unsigned char c : piece) {
        tokens.push_back(static_cast<TokenID>(c));
    }
    return tokens;
}

void BPETokenizer::Impl::apply_merges(std::vector<TokenID>& tokens) const {
    while (tokens.size() > 1) {
        // Lowest-rank pair first; merge ids grow with rank
        TokenID best_id = std::numeric_limits<TokenID>::max();
        std::pair<TokenID, TokenID> best_pair;
        for (size_t i = 0; i + 1 < tokens.size(); i++) {
            auto pair = std::make_pair(tokens[i], tokens[i + 1]);
            if (auto it = merge_ids.find(pair); it != merge_ids.end() && it->second < best_id) {
                best_id = it->second;
                best_pair = pair;
            }
        }
        if (best_id == std::numeric_limits<TokenID>::max()) {
            break;
        }

        std::vector<TokenID> merged;
        merged.reserve(tokens.size());
        for (size_t i = 0; i < tokens.size(); i++) {
            if (i + 1 < tokens.size() && tokens[i] == best_pair.first && tokens[i + 1] == best_pair.second) {
                merged.push_back(best_id);
                i++;
            } else {
                merged.push_back(tokens[i]);
            }
        }
        tokens = std::move(merged);
    }
}

void BPETokenizer::Impl::get_pair_counts_from_sequences(
    const std::vector<std::pair<std::vector<TokenID>, size_t>>& tokenized_corpus,
    PairCounts& pair_counts) const {

    pair_counts.clear();

    for (const auto& [sequence, count] : tokenized_corpus) {
        for (size_t i = 0; i + 1 < sequence.size(); i++) {
            pair_counts[std::make_pair(sequence[i], sequence[i + 1])] += count;
        }
    }
}

void BPETokenizer::Impl::perform_merge_on_sequences(
    const std::pair<TokenID, TokenID>& pair,
    TokenID new_token_id,
    std::vector<std::pair<std::vector<TokenID>, size_t>>& tokenized_corpus) {

    for (auto& [sequence, count] : tokenized_corpus) {
        std::vector<TokenID> new_sequence;
        new_sequence.reserve(sequence.size());

        for (size_t i = 0; i < sequence.size(); i++) {
            if (i + 1 < sequence.size() &&
                sequence[i] == pair.first &&
                sequence[i + 1] == pair.second) {
                new_sequence.push_back(new_token_id);
                i++; // Skip the next token
            } else {
                new_sequence.push_back(sequence[i]);
            }
        }

        sequence = std::move(new_sequence);
    }
}

BPETokenizer::BPETokenizer() : pimpl_(new Impl) {
    pimpl_->initialize_vocab();
}

BPETokenizer::~BPETokenizer() = default;
BPETokenizer::BPETokenizer(BPETokenizer&& other) noexcept = default;
BPETokenizer& BPETokenizer::operator=(BPETokenizer&& other) noexcept = default;

void BPETokenizer::train(const std::vector<std::string>& corpus, size_t vocab_size) {
    if (corpus.empty()) {
        throw std::invalid_argument("Corpus cannot be empty");
    }
    if (vocab_size < kByteVocabSize + 1) {
        throw std::invalid_argument("Subword vocabulary size must be at least " +
                                    std::to_string(kByteVocabSize + 1) + ", got " + std::to_string(vocab_size));
    }

    pimpl_->initialize_vocab();

    std::cout << "Training with corpus size: " << corpus.size() << " examples\n";
    std::cout << "Target vocabulary size: " << vocab_size << "\n";

    // Tokenize the entire corpus into byte sequences with frequencies
    std::unordered_map<std::vector<TokenID>, size_t, VectorHash> sequence_counts;
    size_t total_pieces = 0;
    for (const auto& text : corpus) {
        for (const auto& piece : pimpl_->split_text(text)) {
            auto tokens = pimpl_->piece_to_token_ids(piece);
            if (tokens.size() >= 2) {
                sequence_counts[tokens]++;
            }
            total_pieces++;
        }
    }

    std::vector<std::pair<std::vector<TokenID>, size_t>> tokenized_corpus(
        sequence_counts.begin(), sequence_counts.end());
    sequence_counts.clear();

    std::cout << "Total pieces processed: " << total_pieces << "\n";
    std::cout << "Unique mergeable pieces: " << tokenized_corpus.size() << "\n";

    // <eos> occupies the last id
    const size_t target_merges = vocab_size - kByteVocabSize - 1;
    PairCounts pair_counts;

    while (pimpl_->merges.size() < target_merges) {
        pimpl_->get_pair_counts_from_sequences(tokenized_corpus, pair_counts);

        if (pair_counts.empty()) {
            std::cout << "No more pairs to merge. Stopping early.\n";
            break;
        }

        // Most frequent pair, ties broken by the smaller pair
        auto max_pair = std::max_element(
            pair_counts.begin(), pair_counts.end(),
            [](const auto& a, const auto& b) {
                if (a.second != b.second) return a.second < b.second;
                return a.first > b.first;
            }
        );

        if (max_pair->second < 2) {
            std::cout << "No pair occurs more than once. Stopping early.\n";
            break;
        }

        auto pair = max_pair->first;
        if (pimpl_->debug_logging) {
            std::cout << "Merge " << pimpl_->merges.size()
                      << ": '" << printable(pimpl_->token_bytes[pair.first]) << "' + '"
                      << printable(pimpl_->token_bytes[pair.second])
                      << "' -> count: " << max_pair->second << std::endl;
        }

        TokenID new_id = static_cast<TokenID>(pimpl_->token_bytes.size());
        pimpl_->add_merge(pair);
        pimpl_->perform_merge_on_sequences(pair, new_id, tokenized_corpus);

        if (pimpl_->merges.size() % 100 == 0) {
            std::cout << "Progress: " << pimpl_->merges.size() << " merges\n";
        }
    }

    std::cout << "Training completed with " << pimpl_->merges.size() << " merges\n";
    std::cout << "Final vocabulary size: " << this->vocab_size() << std::endl;
}

std::vector<TokenID> BPETokenizer::encode(const std::string& text) const {
    if (text.empty()) {
        return {};
    }

    std::vector<TokenID> tokens;
    tokens.reserve(text.size());

    for (const auto& piece : pimpl_->split_text(text)) {
        auto piece_tokens = pimpl_->piece_to_token_ids(piece);
        pimpl_->apply_merges(piece_tokens);
        tokens.insert(tokens.end(), piece_tokens.begin(), piece_tokens.end());
    }

    if (pimpl_->debug_logging) {
        std::cout << "[ENCODE] " << text.size() << " bytes -> " << tokens.size() << " tokens" << std::endl;
    }
    return tokens;
}

std::string BPETokenizer::decode(const std::vector<TokenID>& tokens) const {
    std::string text;
    text.reserve(tokens.size() * 3);

    for (TokenID token_id : tokens) {
        if (token_id < pimpl_->token_bytes.size()) {
            text += pimpl_->token_bytes[token_id];
        } else if (token_id == pimpl_->eos_id()) {
            text += kEosToken;
        } else {
            throw UnknownSymbolError(static_cast<uint64_t>(token_id), vocab_size());
        }
    }

    return text;
}

size_t BPETokenizer::vocab_size() const {
    return pimpl_->token_bytes.size() + 1;
}

size_t BPETokenizer::merge_count() const {
    return pimpl_->merges.size();
}

std::optional<TokenID> BPETokenizer::eos_token_id() const {
    return pimpl_->eos_id();
}

nlohmann::json BPETokenizer::to_json() const {
    nlohmann::json merges = nlohmann::json::array();
    for (const auto& [first, second] : pimpl_->merges) {
        merges.push_back({first, second});
    }

    return nlohmann::json{
        {"type", to_string(kind())},
        {"vocab_size", vocab_size()},
        {"merges", merges},
        {"special_tokens", {{kEosToken, pimpl_->eos_id()}}}
    };
}

BPETokenizer BPETokenizer::from_json(const nlohmann::json& j) {
    if (j.at("type").get<std::string>() != "subword") {
        throw std::invalid_argument("Not a subword vocabulary: type=" + j.at("type").get<std::string>());
    }

    BPETokenizer tokenizer;
    for (const auto& merge : j.at("merges")) {
        if (!merge.is_array() || merge.size() != 2) {
            throw std::invalid_argument("Malformed merge entry: " + merge.dump());
        }
        tokenizer.pimpl_->add_merge({merge[0].get<TokenID>(), merge[1].get<TokenID>()});
    }

    if (j.contains("special_tokens")) {
        TokenID stored_eos = j.at("special_tokens").at(kEosToken).get<TokenID>();
        if (stored_eos != tokenizer.pimpl_->eos_id()) {
            throw std::invalid_argument("Vocabulary places <eos> at " + std::to_string(stored_eos) +
                                        ", expected " + std::to_string(tokenizer.pimpl_->eos_id()));
        }
    }
    return tokenizer;
}

BPETokenizer BPETokenizer::load_vocabulary(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open subword vocabulary: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Malformed subword vocabulary " + path + ": " + e.what());
    }
    return from_json(j);
}

void BPETokenizer::enable_debug_logging(bool enable) {
    pimpl_->debug_logging = enable;
}

void BPETokenizer::dump_merges() const {
    std::cout << "=== MERGES DUMP ===" << std::endl;
    std::cout << "Number of merges: " << pimpl_->merges.size() << std::endl;

    for (size_t rank = 0; rank < pimpl_->merges.size(); ++rank) {
        const auto& [first, second] = pimpl_->merges[rank];
        TokenID new_id = static_cast<TokenID>(kByteVocabSize + rank);
        std::cout << "(" << first << ":'" << printable(pimpl_->token_bytes[first]) << "', "
                  << second << ":'" << printable(pimpl_->token_bytes[second]) << "') -> "
                  << new_id << ":'" << printable(pimpl_->token_bytes[new_id]) << "'" << std::endl;
    }
    std::cout << "=== END MERGES DUMP ===" << std::endl;
}

} // namespace tinylm
