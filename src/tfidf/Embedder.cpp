#include "tfidf/Embedder.hpp"
#include "tfidf/Errors.hpp"
#include <stdexcept>
#include <unordered_map>

namespace tfidf {

Embedder::Embedder(const Vocabulary& vocab, const DocFrequencyTracker& docs, const Analyzer& analyzer)
    : m_vocab(vocab), m_docs(docs), m_analyzer(analyzer) {}

void Embedder::require_ready(const char* op) const {
    if (!m_vocab.is_final() || !m_docs.is_final()) {
        throw InvalidStateError(std::string(op) + ": vocabulary and documents must be finalized");
    }
}

double Embedder::inverse_document_frequency(uint32_t id) const {
    return m_docs.inverse_document_frequency(id);
}

std::vector<double> Embedder::embed(const std::string& text) const {
    require_ready("embed");

    std::vector<double> vec(m_vocab.size(), 0.0);

    const auto toks = m_analyzer.analyze(text);
    if (toks.empty()) return vec;

    std::unordered_map<uint32_t, uint32_t> tf;
    tf.reserve(toks.size());
    for (const auto& t : toks) tf[m_vocab.lookup(t)] += 1;

    const double n = (double)toks.size();
    for (const auto& kv : tf) {
        vec[kv.first] = ((double)kv.second / n) * m_docs.inverse_document_frequency(kv.first);
    }
    return vec;
}

std::map<std::pair<uint32_t, std::string>, double> Embedder::doc_tfidf(const std::string& text) const {
    require_ready("doc_tfidf");

    std::map<std::pair<uint32_t, std::string>, double> out;
    if (!m_analyzer.tokenize) throw std::invalid_argument("analyzer has no tokenizer");

    const auto raw = m_analyzer.tokenize(text);
    if (raw.empty()) return out;

    std::vector<uint32_t> ids;
    ids.reserve(raw.size());
    std::unordered_map<uint32_t, uint32_t> tf;
    for (const auto& r : raw) {
        uint32_t id = m_vocab.lookup(m_analyzer.normalize ? m_analyzer.normalize(r) : r);
        ids.push_back(id);
        tf[id] += 1;
    }

    const double n = (double)raw.size();
    for (size_t i = 0; i < raw.size(); ++i) {
        const uint32_t id = ids[i];
        out[{id, raw[i]}] = ((double)tf[id] / n) * m_docs.inverse_document_frequency(id);
    }
    return out;
}

} // namespace tfidf
