#include "similarity/tokenizer.hpp"
#include <cctype>

namespace tempo {

namespace {

bool is_word_byte(unsigned char c) {
    return std::isalnum(c) || c == '_' || c >= 0x80;
}

} // namespace

Tokenizer::Tokenizer(size_t min_token_length, bool remove_stopwords)
    : min_token_length_(min_token_length), remove_stopwords_(remove_stopwords) {}

const std::set<std::string>& Tokenizer::stopwords() {
    static const std::set<std::string> words = {
        "the", "a", "an", "and", "or", "but", "in", "on", "at", "to", "for",
        "of", "with", "by", "from", "as", "is", "was", "are", "were", "be",
        "been", "being", "have", "has", "had", "do", "does", "did", "will",
        "would", "should", "could", "may", "might", "can", "this", "that",
        "these", "those", "i", "you", "he", "she", "it", "we", "they"
    };
    return words;
}

bool Tokenizer::is_stopword(const std::string& token) const {
    return remove_stopwords_ && stopwords().count(token) > 0;
}

std::vector<std::string> Tokenizer::tokenize(const std::string& text) const {
    std::vector<std::string> tokens;
    std::string current;

    auto flush = [&]() {
        if (current.size() >= min_token_length_ && !is_stopword(current)) {
            tokens.push_back(current);
        }
        current.clear();
    };

    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (is_word_byte(c)) {
            current += static_cast<char>(c < 0x80 ? std::tolower(c) : c);
        } else if (!current.empty()) {
            flush();
        }
    }
    if (!current.empty()) {
        flush();
    }

    return tokens;
}

std::map<std::string, size_t> Tokenizer::count(const std::string& text) const {
    std::map<std::string, size_t> counts;
    for (const auto& token : tokenize(text)) {
        counts[token]++;
    }
    return counts;
}

} // namespace tempo
