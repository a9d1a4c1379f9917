#include "tfidf/Vocabulary.hpp"
#include "tfidf/Errors.hpp"
#include <algorithm>
#include <stdexcept>

namespace tfidf {

const char* const kUnk = "<UNK>";

static const std::string& unk_string() {
    static const std::string s(kUnk);
    return s;
}

void Vocabulary::require_final(const char* op) const {
    if (!m_final) {
        throw InvalidStateError(std::string(op) + ": vocabulary must be finalized first");
    }
}

void Vocabulary::observe(const std::string& token, uint64_t count) {
    if (m_final) throw InvalidStateError("observe: trying to add new words to finalized vocab");

    m_total += count;

    if (token == unk_string()) {
        m_unk_count += count;
        return;
    }

    auto it = m_seen_index.find(token);
    if (it == m_seen_index.end()) {
        m_seen_index.emplace(token, m_seen.size());
        m_seen.push_back({token, count});
    } else {
        m_seen[it->second].count += count;
    }
}

void Vocabulary::finalize(size_t max_vocab_size, uint64_t unk_cutoff) {
    if (m_final) throw InvalidStateError("finalize: vocabulary already finalized");

    std::vector<size_t> ranked;
    ranked.reserve(m_seen.size());
    for (size_t i = 0; i < m_seen.size(); ++i) {
        if (m_seen[i].count >= unk_cutoff) ranked.push_back(i);
    }

    // m_seen is in first-seen order, so a stable sort keeps that order among equal counts
    std::stable_sort(ranked.begin(), ranked.end(), [this](size_t a, size_t b) {
        return m_seen[a].count > m_seen[b].count;
    });

    const size_t slots = max_vocab_size > 0 ? max_vocab_size - 1 : 0;
    if (ranked.size() > slots) ranked.resize(slots);

    const size_t vocab_size = ranked.size() + 1;
    if (vocab_size >= max_vocab_size) {
        throw CapacityError("finalize: vocab size too large " + std::to_string(vocab_size) +
                            " >= " + std::to_string(max_vocab_size));
    }

    std::vector<bool> kept(m_seen.size(), false);
    m_id_to_token.clear();
    m_id_count.clear();
    m_token_to_id.clear();
    m_id_to_token.reserve(vocab_size);
    m_id_count.reserve(vocab_size);
    m_token_to_id.reserve(vocab_size);

    for (size_t idx : ranked) {
        kept[idx] = true;
        m_token_to_id.emplace(m_seen[idx].token, (uint32_t)m_id_to_token.size());
        m_id_to_token.push_back(m_seen[idx].token);
        m_id_count.push_back(m_seen[idx].count);
    }

    // everything pruned is absorbed by <UNK>
    uint64_t unk = m_unk_count;
    for (size_t i = 0; i < m_seen.size(); ++i) {
        if (!kept[i]) unk += m_seen[i].count;
    }
    m_token_to_id.emplace(unk_string(), (uint32_t)m_id_to_token.size());
    m_id_to_token.push_back(unk_string());
    m_id_count.push_back(unk);

    m_final = true;
}

uint32_t Vocabulary::lookup(const std::string& token) const {
    require_final("lookup");
    auto it = m_token_to_id.find(token);
    return it != m_token_to_id.end() ? it->second : unk_id();
}

const std::string& Vocabulary::reverse_lookup(uint32_t id) const {
    if (id < m_id_to_token.size()) return m_id_to_token[id];
    return unk_string();
}

uint64_t Vocabulary::count(const std::string& token) const {
    if (m_final && token == unk_string()) return m_id_count.back();

    auto it = m_seen_index.find(token);
    if (it != m_seen_index.end()) return m_seen[it->second].count;

    // restored vocabularies carry counts only for kept tokens
    auto jt = m_token_to_id.find(token);
    return jt != m_token_to_id.end() ? m_id_count[jt->second] : 0;
}

uint64_t Vocabulary::count_by_id(uint32_t id) const {
    require_final("count_by_id");
    return id < m_id_count.size() ? m_id_count[id] : 0;
}

double Vocabulary::global_frequency(uint32_t id) const {
    require_final("global_frequency");
    if (m_total == 0 || id >= m_id_count.size()) return 0.0;
    return (double)m_id_count[id] / (double)m_total;
}

size_t Vocabulary::size() const {
    return m_id_to_token.size();
}

uint32_t Vocabulary::unk_id() const {
    require_final("unk_id");
    return (uint32_t)(m_id_to_token.size() - 1);
}

void Vocabulary::restore(std::vector<std::string> tokens, std::vector<uint64_t> counts) {
    if (m_final) throw InvalidStateError("restore: vocabulary already finalized");
    if (tokens.empty()) throw std::runtime_error("vocabulary restore: no tokens");
    if (tokens.back() != unk_string()) {
        throw std::runtime_error("vocabulary restore: last token must be " + unk_string());
    }
    if (counts.size() != tokens.size()) {
        throw std::runtime_error("vocabulary restore: " + std::to_string(tokens.size()) +
                                 " tokens but " + std::to_string(counts.size()) + " counts");
    }

    std::unordered_map<std::string, uint32_t> index;
    index.reserve(tokens.size());
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (!index.emplace(tokens[i], (uint32_t)i).second) {
            throw std::runtime_error("vocabulary restore: duplicate token '" + tokens[i] + "'");
        }
    }

    m_total = 0;
    for (uint64_t c : counts) m_total += c;

    m_seen.clear();
    m_seen_index.clear();
    m_unk_count = 0;

    m_id_to_token = std::move(tokens);
    m_id_count = std::move(counts);
    m_token_to_id = std::move(index);
    m_final = true;
}

} // namespace tfidf
