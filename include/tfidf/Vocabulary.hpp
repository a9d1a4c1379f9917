#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace tfidf {

extern const char* const kUnk; // "<UNK>"

// Token -> id mapping built in two stages: counts accumulate in first-seen
// order until finalize(), which freezes a dense id space with <UNK> last.
class Vocabulary {
public:
    // phase 1
    void observe(const std::string& token, uint64_t count = 1);

    // Keeps at most max_vocab_size - 1 tokens with count >= unk_cutoff, ranked by
    // count (ties: first seen wins), then appends <UNK>. Throws CapacityError when
    // the result is not strictly smaller than max_vocab_size.
    void finalize(size_t max_vocab_size, uint64_t unk_cutoff);

    // phase 2
    uint32_t lookup(const std::string& token) const;
    const std::string& reverse_lookup(uint32_t id) const;

    // accumulated count over all observe() calls; after finalize a pruned token
    // still reports its own count even though it maps to <UNK>
    uint64_t count(const std::string& token) const;
    uint64_t count_by_id(uint32_t id) const;
    double global_frequency(uint32_t id) const;
    uint64_t total_count() const { return m_total; }

    bool is_final() const { return m_final; }
    size_t size() const;
    uint32_t unk_id() const;
    size_t observed_types() const { return m_seen.size(); }

    const std::vector<std::string>& tokens() const { return m_id_to_token; }
    const std::vector<uint64_t>& counts() const { return m_id_count; }

    // rebuild a finalized vocabulary from persisted id-ordered tokens/counts
    void restore(std::vector<std::string> tokens, std::vector<uint64_t> counts);

private:
    struct Seen {
        std::string token;
        uint64_t count = 0;
    };

    bool m_final = false;
    uint64_t m_total = 0;

    // phase 1: first-seen order, index into m_seen
    std::vector<Seen> m_seen;
    std::unordered_map<std::string, size_t> m_seen_index;
    uint64_t m_unk_count = 0; // literal "<UNK>" observations

    // phase 2
    std::vector<std::string> m_id_to_token;
    std::vector<uint64_t> m_id_count;
    std::unordered_map<std::string, uint32_t> m_token_to_id;

    void require_final(const char* op) const;
};

} // namespace tfidf
