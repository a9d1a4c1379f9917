#pragma once
#include "tfidf/Analyzer.hpp"
#include "tfidf/DocFrequency.hpp"
#include "tfidf/Vocabulary.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace tfidf {

// Turns text into a dense TF-IDF vector over the vocabulary id space.
// Borrows the vocabulary, tracker and analyzer; all three must outlive it.
class Embedder {
public:
    Embedder(const Vocabulary& vocab, const DocFrequencyTracker& docs, const Analyzer& analyzer);

    // length == vocabulary size; tf = occurrences / tokens in text, weight = tf * idf
    std::vector<double> embed(const std::string& text) const;

    double inverse_document_frequency(uint32_t id) const;

    // (id, raw token) -> weight, for inspecting how a document was weighted
    std::map<std::pair<uint32_t, std::string>, double> doc_tfidf(const std::string& text) const;

    size_t dim() const { return m_vocab.size(); }

private:
    const Vocabulary& m_vocab;
    const DocFrequencyTracker& m_docs;
    const Analyzer& m_analyzer;

    void require_ready(const char* op) const;
};

} // namespace tfidf
