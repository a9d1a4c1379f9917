#pragma once
#include "tfidf/Analyzer.hpp"
#include "tfidf/Vocabulary.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace tfidf {

// Counts, per vocabulary id, how many documents contain it at least once.
// Holds a reference to the vocabulary; the vocabulary must outlive the tracker.
class DocFrequencyTracker {
public:
    // throws InvalidStateError unless vocab is finalized
    explicit DocFrequencyTracker(const Vocabulary& vocab);

    void scan(const std::string& text, const Analyzer& analyzer);
    void finalize();

    uint64_t document_frequency(uint32_t id) const;
    uint64_t total_documents() const { return m_total_docs; }
    bool is_final() const { return m_final; }
    size_t size() const { return m_df.size(); }
    const std::vector<uint64_t>& frequencies() const { return m_df; }

    // log10(N / (1 + df)), or 0.0 when df == 0
    double inverse_document_frequency(uint32_t id) const;

    // persisted state; leaves the tracker finalized
    void restore(uint64_t total_documents, std::vector<uint64_t> frequencies);

private:
    const Vocabulary& m_vocab;
    std::vector<uint64_t> m_df;
    uint64_t m_total_docs = 0;
    bool m_final = false;
};

} // namespace tfidf
