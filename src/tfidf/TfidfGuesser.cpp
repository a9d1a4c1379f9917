#include "tfidf/TfidfGuesser.hpp"
#include "tfidf/Embedder.hpp"
#include "tfidf/Errors.hpp"
#include "tfidf/Similarity.hpp"
#include <algorithm>
#include <cstdio>
#include <exception>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace tfidf {

const char* state_name(GuesserState s) {
    switch (s) {
        case GuesserState::Empty: return "empty";
        case GuesserState::VocabBuilding: return "vocab-building";
        case GuesserState::VocabFinal: return "vocab-final";
        case GuesserState::DocFreqScanning: return "docfreq-scanning";
        case GuesserState::Trained: return "trained";
        default: return "unknown";
    }
}

TfidfGuesser::TfidfGuesser(GuesserConfig cfg, Analyzer analyzer)
    : m_cfg(cfg), m_analyzer(std::move(analyzer)), m_vocab(std::make_unique<Vocabulary>()),
      m_log_mutex(std::make_unique<std::mutex>()) {
    if (!m_analyzer.tokenize) throw std::invalid_argument("TfidfGuesser: analyzer has no tokenizer");
}

void TfidfGuesser::log_line(const std::string& line) const {
    if (!m_cfg.log) return;
    std::lock_guard<std::mutex> lock(*m_log_mutex);
    *m_cfg.log << line;
}

void TfidfGuesser::require_state(GuesserState want, const char* op) const {
    if (m_state != want) {
        throw InvalidStateError(std::string(op) + ": guesser is " + state_name(m_state) +
                                ", needs " + state_name(want));
    }
}

const DocFrequencyTracker& TfidfGuesser::doc_frequencies() const {
    if (!m_docs) throw InvalidStateError("doc_frequencies: vocabulary not finalized");
    return *m_docs;
}

void TfidfGuesser::vocab_seen(const std::string& word, uint64_t count) {
    if (m_state != GuesserState::Empty && m_state != GuesserState::VocabBuilding) {
        throw InvalidStateError("vocab_seen: trying to add new words to finalized vocab");
    }
    m_vocab->observe(word, count);
    m_state = GuesserState::VocabBuilding;
}

void TfidfGuesser::finalize_vocab() {
    // an empty corpus finalizes straight from Empty to a vocabulary of just <UNK>
    if (m_state != GuesserState::Empty && m_state != GuesserState::VocabBuilding) {
        throw InvalidStateError("finalize_vocab: vocabulary already finalized");
    }

    const size_t before = m_vocab->observed_types();
    m_vocab->finalize(m_cfg.max_vocab_size, m_cfg.unk_cutoff);
    m_docs = std::make_unique<DocFrequencyTracker>(*m_vocab);
    m_state = GuesserState::VocabFinal;

    if (m_cfg.log) {
        std::ostringstream log;
        log << "[vocab] " << before << " distinct tokens before pruning, "
            << m_vocab->size() << " after (max " << m_cfg.max_vocab_size
            << ", cutoff " << m_cfg.unk_cutoff << ")\n";
        log << "[vocab] including:";
        const size_t show = std::min<size_t>(m_vocab->size(), 10);
        for (size_t i = 0; i < show; ++i) log << " " << m_vocab->reverse_lookup((uint32_t)i);
        log << "\n";
        log_line(log.str());
    }
}

void TfidfGuesser::scan_document(const std::string& text, const std::string& label) {
    if (m_state != GuesserState::VocabFinal && m_state != GuesserState::DocFreqScanning) {
        throw InvalidStateError(std::string("scan_document: guesser is ") + state_name(m_state) +
                                ", needs finalized vocab and open document counts");
    }
    m_docs->scan(text, m_analyzer);
    m_questions.push_back(text);
    m_answers.push_back(label);
    m_state = GuesserState::DocFreqScanning;
}

void TfidfGuesser::finalize_docs(size_t expected_documents) {
    // skipping the scan pass is only valid for an empty corpus
    const bool empty_corpus = m_state == GuesserState::VocabFinal && m_vocab->observed_types() == 0;
    if (m_state != GuesserState::DocFreqScanning && !empty_corpus) {
        throw InvalidStateError(std::string("finalize_docs: guesser is ") + state_name(m_state) +
                                ", needs scanned documents");
    }
    if (m_docs->total_documents() != expected_documents) {
        throw DocumentCountMismatchError("finalize_docs: scanned " +
                                         std::to_string(m_docs->total_documents()) +
                                         " documents, corpus has " + std::to_string(expected_documents));
    }

    m_docs->finalize();

    if (m_cfg.log) {
        std::ostringstream log;
        log << "[docs] document counts final after " << m_docs->total_documents() << " docs\n";
        const size_t show = std::min<size_t>(m_vocab->size(), 10);
        for (size_t i = 0; i < show; ++i) {
            const uint32_t id = (uint32_t)i;
            char buf[160];
            std::snprintf(buf, sizeof(buf), "[docs] %10s (%3u): idf %0.2f global %0.4f\n",
                          m_vocab->reverse_lookup(id).c_str(), id,
                          m_docs->inverse_document_frequency(id), m_vocab->global_frequency(id));
            log << buf;
        }
        log_line(log.str());
    }

    build_matrix();
    m_state = GuesserState::Trained;
}

void TfidfGuesser::train(const std::vector<std::string>& questions, const std::vector<std::string>& answers) {
    if (m_state != GuesserState::Empty) {
        throw InvalidStateError("train: guesser already holds state, use a fresh instance to retrain");
    }
    if (questions.size() != answers.size()) {
        throw std::invalid_argument("train: " + std::to_string(questions.size()) + " questions but " +
                                    std::to_string(answers.size()) + " answers");
    }

    for (const auto& q : questions) {
        for (const auto& tok : m_analyzer.analyze(q)) vocab_seen(tok);
    }
    finalize_vocab();

    for (size_t i = 0; i < questions.size(); ++i) scan_document(questions[i], answers[i]);
    finalize_docs(questions.size());
}

void TfidfGuesser::build_matrix() {
    const Embedder emb(*m_vocab, *m_docs, m_analyzer);
    const size_t rows = m_questions.size();
    m_matrix = DocumentMatrix(rows, m_vocab->size());

    const size_t workers = std::min<size_t>(std::max(1u, m_cfg.threads), std::max<size_t>(rows, 1));
    if (workers <= 1) {
        for (size_t r = 0; r < rows; ++r) m_matrix.set_row(r, emb.embed(m_questions[r]));
    } else {
        // each worker owns rows r = id, id + workers, ...; shared inputs are read-only
        std::vector<std::exception_ptr> errors(workers);
        std::vector<std::thread> threads;
        threads.reserve(workers);
        for (size_t w = 0; w < workers; ++w) {
            threads.emplace_back([&, w]() {
                try {
                    for (size_t r = w; r < rows; r += workers) m_matrix.set_row(r, emb.embed(m_questions[r]));
                } catch (...) {
                    errors[w] = std::current_exception();
                }
            });
        }
        for (auto& t : threads) t.join();
        for (auto& e : errors) {
            if (e) std::rethrow_exception(e);
        }
    }

    if (m_cfg.log) {
        std::ostringstream log;
        log << "[matrix] document matrix is " << m_matrix.rows() << " by " << m_matrix.cols()
            << ", has " << m_matrix.nonzero_count() << " non-zero entries\n";
        log_line(log.str());
    }
}

std::vector<double> TfidfGuesser::embed(const std::string& text) const {
    if (!m_docs) throw InvalidStateError("embed: vocabulary and documents must be finalized");
    return Embedder(*m_vocab, *m_docs, m_analyzer).embed(text);
}

double TfidfGuesser::inv_docfreq(uint32_t id) const {
    if (!m_docs) throw InvalidStateError("inv_docfreq: documents must be finalized");
    return m_docs->inverse_document_frequency(id);
}

double TfidfGuesser::global_freq(uint32_t id) const {
    return m_vocab->global_frequency(id);
}

std::map<std::pair<uint32_t, std::string>, double> TfidfGuesser::doc_tfidf(const std::string& text) const {
    if (!m_docs) throw InvalidStateError("doc_tfidf: documents must be finalized");
    return Embedder(*m_vocab, *m_docs, m_analyzer).doc_tfidf(text);
}

uint32_t TfidfGuesser::vocab_lookup(const std::string& word) const {
    return m_vocab->lookup(word);
}

const std::string& TfidfGuesser::vocab_key(uint32_t id) const {
    return m_vocab->reverse_lookup(id);
}

Guess TfidfGuesser::guess(const std::string& query) const {
    require_state(GuesserState::Trained, "guess");

    const std::vector<double> q = embed(query);
    const Match m = find_best_match(q, m_matrix);

    if (m_cfg.log) {
        std::ostringstream log;
        log << "[guess] best match row " << m.row << ", similarity " << m.score << "\n";
        log_line(log.str());
    }

    Guess g;
    g.question = m_questions[m.row];
    g.guess = m_answers[m.row];
    g.confidence = std::min(1.0, std::max(0.0, m.score));
    g.row = m.row;
    return g;
}

std::vector<Guess> TfidfGuesser::guess(const std::string& query, size_t max_n_guesses) const {
    if (max_n_guesses != 1) {
        throw std::invalid_argument("guess: only the top guess is supported (max_n_guesses = 1)");
    }
    return {guess(query)};
}

void TfidfGuesser::restore(std::vector<std::string> tokens, std::vector<uint64_t> global_counts,
                           uint64_t total_documents, std::vector<uint64_t> doc_frequencies,
                           DocumentMatrix matrix,
                           std::vector<std::string> questions, std::vector<std::string> answers) {
    require_state(GuesserState::Empty, "restore");

    auto vocab = std::make_unique<Vocabulary>();
    vocab->restore(std::move(tokens), std::move(global_counts));

    auto docs = std::make_unique<DocFrequencyTracker>(*vocab);
    docs->restore(total_documents, std::move(doc_frequencies));

    if (matrix.cols() != vocab->size()) {
        throw std::runtime_error("restore: matrix has " + std::to_string(matrix.cols()) +
                                 " columns, vocabulary has " + std::to_string(vocab->size()));
    }
    if (questions.size() != matrix.rows() || answers.size() != matrix.rows()) {
        throw std::runtime_error("restore: " + std::to_string(matrix.rows()) + " matrix rows, " +
                                 std::to_string(questions.size()) + " questions, " +
                                 std::to_string(answers.size()) + " answers");
    }
    if (total_documents != matrix.rows()) {
        throw DocumentCountMismatchError("restore: " + std::to_string(total_documents) +
                                         " documents counted, matrix has " + std::to_string(matrix.rows()));
    }

    m_vocab = std::move(vocab);
    m_docs = std::move(docs);
    m_matrix = std::move(matrix);
    m_questions = std::move(questions);
    m_answers = std::move(answers);
    m_state = GuesserState::Trained;

    if (m_cfg.log) {
        std::ostringstream log;
        log << "[load] " << m_matrix.rows() << " docs with vocab size " << m_vocab->size() << "\n";
        log_line(log.str());
    }
}

} // namespace tfidf
