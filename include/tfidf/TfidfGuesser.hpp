#pragma once
#include "tfidf/Analyzer.hpp"
#include "tfidf/DocFrequency.hpp"
#include "tfidf/DocumentMatrix.hpp"
#include "tfidf/Vocabulary.hpp"
#include <cstdint>
#include <iosfwd>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace tfidf {

struct GuesserConfig {
    size_t max_vocab_size = 10000;
    uint64_t unk_cutoff = 2;

    // workers used to embed training rows; rows are independent once counts are final
    unsigned threads = 1;

    // diagnostics sink, nullptr = silent
    std::ostream* log = nullptr;
};

enum class GuesserState {
    Empty,
    VocabBuilding,
    VocabFinal,
    DocFreqScanning,
    Trained
};

const char* state_name(GuesserState s);

struct Guess {
    std::string question;   // closest training document
    std::string guess;      // its label
    double confidence = 0.0; // cosine similarity, 0..1
    size_t row = 0;
};

// Nearest-neighbour answer lookup over TF-IDF vectors of the training questions.
//
// Training is three ordered passes: count tokens, finalize vocab; count
// document frequencies, finalize docs; embed every question into the matrix.
// finalize_docs() runs the last pass, so a Trained guesser always has one
// matrix row per scanned document. A trained guesser is read-only, so
// concurrent guess() calls are safe; diagnostic lines are serialized.
class TfidfGuesser {
public:
    TfidfGuesser(GuesserConfig cfg, Analyzer analyzer);

    TfidfGuesser(TfidfGuesser&&) = default;
    TfidfGuesser& operator=(TfidfGuesser&&) = default;

    // all three passes; questions[i] is labelled answers[i]
    void train(const std::vector<std::string>& questions, const std::vector<std::string>& answers);

    // stepwise training
    void vocab_seen(const std::string& word, uint64_t count = 1);
    void finalize_vocab();
    // counts text for document frequencies and keeps (text, label) as a matrix row
    void scan_document(const std::string& text, const std::string& label);
    // throws DocumentCountMismatchError, then embeds every scanned document
    void finalize_docs(size_t expected_documents);

    Guess guess(const std::string& query) const;
    // only max_n_guesses == 1 is supported
    std::vector<Guess> guess(const std::string& query, size_t max_n_guesses) const;

    std::vector<double> embed(const std::string& text) const;
    double inv_docfreq(uint32_t id) const;
    double global_freq(uint32_t id) const;
    std::map<std::pair<uint32_t, std::string>, double> doc_tfidf(const std::string& text) const;
    uint32_t vocab_lookup(const std::string& word) const;
    const std::string& vocab_key(uint32_t id) const;

    // Rebuilds a trained guesser from persisted artifacts; only valid on an Empty guesser.
    void restore(std::vector<std::string> tokens, std::vector<uint64_t> global_counts,
                 uint64_t total_documents, std::vector<uint64_t> doc_frequencies,
                 DocumentMatrix matrix,
                 std::vector<std::string> questions, std::vector<std::string> answers);

    GuesserState state() const { return m_state; }
    const GuesserConfig& config() const { return m_cfg; }
    const Analyzer& analyzer() const { return m_analyzer; }
    const Vocabulary& vocabulary() const { return *m_vocab; }
    const DocFrequencyTracker& doc_frequencies() const;
    const DocumentMatrix& matrix() const { return m_matrix; }
    const std::vector<std::string>& questions() const { return m_questions; }
    const std::vector<std::string>& answers() const { return m_answers; }

private:
    GuesserConfig m_cfg;
    Analyzer m_analyzer;
    GuesserState m_state = GuesserState::Empty;

    // heap-held so the tracker's reference to the vocabulary survives moves
    std::unique_ptr<Vocabulary> m_vocab;
    std::unique_ptr<DocFrequencyTracker> m_docs;

    DocumentMatrix m_matrix;
    std::vector<std::string> m_questions;
    std::vector<std::string> m_answers;

    // heap-held so the guesser stays movable
    std::unique_ptr<std::mutex> m_log_mutex;

    void log_line(const std::string& line) const;
    void require_state(GuesserState want, const char* op) const;
    void build_matrix();
};

} // namespace tfidf
