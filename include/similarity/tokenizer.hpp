#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

namespace tempo {

/**
 * @brief Splits document text into lower-case word tokens
 *
 * A token is a maximal run of ASCII letters, digits, '_' or non-ASCII
 * bytes (so UTF-8 words stay whole). Tokens shorter than the minimum
 * length and, optionally, English stopwords are dropped.
 */
class Tokenizer {
public:
    explicit Tokenizer(size_t min_token_length = 3, bool remove_stopwords = true);

    std::vector<std::string> tokenize(const std::string& text) const;

    // Token -> number of occurrences in `text`
    std::map<std::string, size_t> count(const std::string& text) const;

    bool is_stopword(const std::string& token) const;

    static const std::set<std::string>& stopwords();

    size_t min_token_length() const { return min_token_length_; }

private:
    size_t min_token_length_;
    bool remove_stopwords_;
};

} // namespace tempo
