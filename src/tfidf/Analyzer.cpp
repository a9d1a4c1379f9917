#include "tfidf/Analyzer.hpp"
#include "text/TextUtil.hpp"
#include <stdexcept>

namespace tfidf {

std::vector<std::string> Analyzer::analyze(const std::string& text) const {
    if (!tokenize) throw std::invalid_argument("analyzer has no tokenizer");

    std::vector<std::string> toks = tokenize(text);
    if (normalize) {
        for (auto& t : toks) t = normalize(t);
    }
    return toks;
}

Analyzer Analyzer::treebank_lower() {
    Analyzer a;
    a.tokenize = textutil::tokenize_treebank;
    a.normalize = textutil::lower;
    return a;
}

} // namespace tfidf
