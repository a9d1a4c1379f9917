#pragma once
#include <functional>
#include <string>
#include <vector>

namespace tfidf {

using Tokenizer = std::function<std::vector<std::string>(const std::string&)>;
using Normalizer = std::function<std::string(const std::string&)>;

// Tokenizer + normalizer pair applied identically in every pass, so that a
// token seen while building the vocabulary maps to the same id at query time.
struct Analyzer {
    Tokenizer tokenize;
    Normalizer normalize; // empty = identity

    // tokens in document order, normalized; throws std::invalid_argument without a tokenizer
    std::vector<std::string> analyze(const std::string& text) const;

    // textutil::tokenize_treebank + textutil::lower
    static Analyzer treebank_lower();
};

} // namespace tfidf
