#include "tfidf/DocFrequency.hpp"
#include "tfidf/Errors.hpp"
#include <cmath>
#include <stdexcept>

namespace tfidf {

static const Vocabulary& require_final_vocab(const Vocabulary& v) {
    if (!v.is_final()) {
        throw InvalidStateError("document frequencies need a finalized vocabulary");
    }
    return v;
}

DocFrequencyTracker::DocFrequencyTracker(const Vocabulary& vocab)
    : m_vocab(require_final_vocab(vocab)), m_df(vocab.size(), 0) {}

void DocFrequencyTracker::scan(const std::string& text, const Analyzer& analyzer) {
    if (m_final) throw InvalidStateError("scan: document counts already finalized");

    // one increment per distinct id, however often it repeats in this document
    std::vector<bool> seen(m_df.size(), false);
    for (const auto& tok : analyzer.analyze(text)) {
        uint32_t id = m_vocab.lookup(tok);
        if (!seen[id]) {
            seen[id] = true;
            m_df[id] += 1;
        }
    }

    m_total_docs += 1;
}

void DocFrequencyTracker::finalize() {
    if (m_final) throw InvalidStateError("finalize: document counts already finalized");
    m_final = true;
}

uint64_t DocFrequencyTracker::document_frequency(uint32_t id) const {
    return id < m_df.size() ? m_df[id] : 0;
}

double DocFrequencyTracker::inverse_document_frequency(uint32_t id) const {
    if (!m_final) throw InvalidStateError("inverse_document_frequency: documents must be finalized");

    const uint64_t df = document_frequency(id);
    if (df == 0) return 0.0;
    return std::log10((double)m_total_docs / (1.0 + (double)df));
}

void DocFrequencyTracker::restore(uint64_t total_documents, std::vector<uint64_t> frequencies) {
    if (m_final) throw InvalidStateError("restore: document counts already finalized");
    if (frequencies.size() != m_vocab.size()) {
        throw std::runtime_error("document frequency restore: " + std::to_string(frequencies.size()) +
                                 " entries for vocabulary of " + std::to_string(m_vocab.size()));
    }
    for (uint64_t df : frequencies) {
        if (df > total_documents) {
            throw std::runtime_error("document frequency restore: frequency exceeds document count");
        }
    }

    m_df = std::move(frequencies);
    m_total_docs = total_documents;
    m_final = true;
}

} // namespace tfidf
