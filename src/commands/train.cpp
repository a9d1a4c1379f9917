#include "commands/train.hpp"
#include "corpus/QaCorpus.hpp"
#include "io/ModelStore.hpp"
#include "tfidf/TfidfGuesser.hpp"

#include <exception>
#include <iostream>
#include <string>

static bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static bool parse_count(const std::string& s, unsigned long long& out) {
    if (s.empty() || s[0] == '-') return false;
    try {
        size_t pos = 0;
        out = std::stoull(s, &pos);
        return pos == s.size();
    } catch (const std::exception&) {
        return false;
    }
}

int cmd_train(int argc, char** argv) {
    const std::string train_path = get_arg(argc, argv, "--train", "");
    const std::string model      = get_arg(argc, argv, "--model", "models/tfidf");
    const std::string max_vocab  = get_arg(argc, argv, "--max_vocab", "10000");
    const std::string unk_cutoff = get_arg(argc, argv, "--unk_cutoff", "2");
    const std::string threads    = get_arg(argc, argv, "--threads", "1");

    tfidf::CorpusOptions copts;
    copts.answer_field = get_arg(argc, argv, "--answer_field", "page");
    copts.split_by_sentence = has_flag(argc, argv, "--split_sentences");

    if (train_path.empty()) {
        std::cerr << "error: missing --train\n";
        return 1;
    }

    tfidf::GuesserConfig cfg;
    unsigned long long v = 0;
    if (!parse_count(max_vocab, v)) {
        std::cerr << "error: invalid --max_vocab\n";
        return 2;
    }
    cfg.max_vocab_size = (size_t)v;
    if (!parse_count(unk_cutoff, v)) {
        std::cerr << "error: invalid --unk_cutoff\n";
        return 2;
    }
    cfg.unk_cutoff = (uint64_t)v;
    if (!parse_count(threads, v) || v == 0) {
        std::cerr << "error: invalid --threads\n";
        return 2;
    }
    cfg.threads = (unsigned)v;
    if (has_flag(argc, argv, "--verbose")) cfg.log = &std::cerr;

    try {
        tfidf::QaCorpus corpus = tfidf::QaCorpus::load(train_path, copts);
        std::cout << "loaded " << corpus.size() << " training questions from " << train_path;
        if (corpus.skipped() > 0) std::cout << " (skipped " << corpus.skipped() << " without answers)";
        std::cout << "\n";

        tfidf::TfidfGuesser guesser(cfg, tfidf::Analyzer::treebank_lower());
        guesser.train(corpus.questions(), corpus.answers());

        const auto& m = guesser.matrix();
        std::cout << "document matrix is " << m.rows() << " by " << m.cols()
                  << ", has " << m.nonzero_count() << " non-zero entries\n";

        tfidf::save_model(guesser, model);
        std::cout << "saved: " << model << " (vocab=" << guesser.vocabulary().size() << ")\n";
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    }
    return 0;
}
