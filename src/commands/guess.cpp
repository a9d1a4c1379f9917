#include "commands/guess.hpp"
#include "corpus/QaCorpus.hpp"
#include "io/ModelStore.hpp"
#include "tfidf/TfidfGuesser.hpp"

#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

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

struct Printer {
    std::ostream* a = nullptr;
    std::ostream* b = nullptr;
    template <typename T>
    Printer& operator<<(const T& v) {
        if (a) (*a) << v;
        if (b) (*b) << v;
        return *this;
    }
};

static bool open_out(std::ofstream& out, const std::string& out_path) {
    if (out_path.empty()) return false;
    try {
        fs::path p(out_path);
        if (p.has_parent_path()) fs::create_directories(p.parent_path());
    } catch (const std::exception&) {
        return false;
    }
    out.open(out_path, std::ios::out | std::ios::trunc);
    return (bool)out;
}

static nlohmann::json guess_to_json(const std::string& query, const tfidf::Guess& g) {
    return {
        {"text", query},
        {"question", g.question},
        {"guess", g.guess},
        {"confidence", g.confidence}
    };
}

int cmd_guess(int argc, char** argv) {
    const std::string model     = get_arg(argc, argv, "--model", "models/tfidf");
    const std::string query     = get_arg(argc, argv, "--query", "");
    const std::string questions = get_arg(argc, argv, "--questions", "");
    const std::string out_path  = get_arg(argc, argv, "--out", "");

    const bool have_query = has_flag(argc, argv, "--query");
    if (have_query == !questions.empty()) {
        std::cerr << "error: pass exactly one of --query or --questions\n";
        return 1;
    }

    std::ofstream out;
    const bool write_out = !out_path.empty();
    if (write_out && !open_out(out, out_path)) {
        std::cerr << "error: failed to open --out path: " << out_path << "\n";
        return 2;
    }

    Printer pr;
    pr.a = &std::cout;
    pr.b = write_out ? (std::ostream*)&out : nullptr;

    tfidf::GuesserConfig cfg;
    if (has_flag(argc, argv, "--verbose")) cfg.log = &std::cerr;

    try {
        const tfidf::TfidfGuesser guesser = tfidf::load_model(model, cfg, tfidf::Analyzer::treebank_lower());

        if (have_query) {
            pr << guess_to_json(query, guesser.guess(query)).dump() << "\n";
            return 0;
        }

        tfidf::CorpusOptions copts;
        copts.answer_field = get_arg(argc, argv, "--answer_field", "page");
        copts.require_answer = false;
        const tfidf::QaCorpus dev = tfidf::QaCorpus::load(questions, copts);

        // every record is guessed; only labelled ones are scored
        size_t correct = 0;
        size_t scored = 0;
        for (size_t i = 0; i < dev.size(); ++i) {
            const tfidf::Guess g = guesser.guess(dev.questions()[i]);

            nlohmann::json j = guess_to_json(dev.questions()[i], g);
            const std::string& answer = dev.answers()[i];
            if (!answer.empty()) {
                ++scored;
                if (g.guess == answer) ++correct;
                j["answer"] = answer;
            }
            pr << j.dump() << "\n";
        }

        if (scored > 0) std::cerr << "accuracy: " << correct << " / " << scored << "\n";
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    }

    if (write_out) std::cout << "\nWROTE: " << out_path << "\n";
    return 0;
}
