#pragma once
#include <string>
#include <vector>

namespace tfidf {

struct CorpusOptions {
    std::string answer_field = "page";
    bool split_by_sentence = false;

    // false keeps records without an answer, labelled ""; used for query-only files
    bool require_answer = true;
};

// (question text, answer label) pairs, index-aligned
class QaCorpus {
public:
    // JSON array of objects, or one JSON object per line
    static QaCorpus load(const std::string& path, const CorpusOptions& opts = {});
    static QaCorpus from_string(const std::string& content, const CorpusOptions& opts = {},
                                const std::string& origin = "<string>");

    const std::vector<std::string>& questions() const { return m_questions; }
    const std::vector<std::string>& answers() const { return m_answers; }
    size_t size() const { return m_questions.size(); }

    // records dropped for a null or empty answer (require_answer only)
    size_t skipped() const { return m_skipped; }

private:
    std::vector<std::string> m_questions;
    std::vector<std::string> m_answers;
    size_t m_skipped = 0;
};

} // namespace tfidf
