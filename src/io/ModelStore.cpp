#include "io/ModelStore.hpp"
#include "tfidf/Errors.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace tfidf {

ModelPaths ModelPaths::from_prefix(const std::string& prefix) {
    ModelPaths p;
    p.vocab = prefix + ".vocab.json";
    p.matrix = prefix + ".tfidf.bin";
    p.doccounts = prefix + ".doccounts.json";
    p.questions = prefix + ".questions.json";
    return p;
}

static void write_json(const std::string& path, const json& j) {
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) throw std::runtime_error("failed to open output file: " + path);
    out << j.dump(2) << "\n";
    if (!out) throw std::runtime_error("failed to write: " + path);
}

static json read_json(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("failed to open model file: " + path);

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error("failed to parse JSON in " + path + ": " + e.what());
    }
    if (!j.is_object()) throw std::runtime_error(path + ": root must be an object");
    return j;
}

template <typename T>
static std::vector<T> require_array_of(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    const json& arr = j.at(key);
    if (!arr.is_array()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be an array");
    }
    try {
        return arr.get<std::vector<T>>();
    } catch (const json::exception& e) {
        std::ostringstream oss;
        oss << where << "." << key << ": " << e.what();
        throw std::runtime_error(oss.str());
    }
}

void save_model(const TfidfGuesser& guesser, const std::string& prefix) {
    if (guesser.state() != GuesserState::Trained) {
        throw InvalidStateError("save_model: guesser must be trained");
    }

    const ModelPaths paths = ModelPaths::from_prefix(prefix);
    const fs::path parent = fs::path(prefix).parent_path();
    if (!parent.empty()) fs::create_directories(parent);

    const Vocabulary& vocab = guesser.vocabulary();
    const DocFrequencyTracker& docs = guesser.doc_frequencies();

    write_json(paths.vocab, {
        {"unk", kUnk},
        {"tokens", vocab.tokens()}
    });

    if (!guesser.matrix().save(paths.matrix)) {
        throw std::runtime_error("failed to save document matrix to " + paths.matrix);
    }

    write_json(paths.doccounts, {
        {"total_documents", docs.total_documents()},
        {"document_frequency", docs.frequencies()},
        {"global_counts", vocab.counts()}
    });

    write_json(paths.questions, {
        {"questions", guesser.questions()},
        {"answers", guesser.answers()}
    });
}

TfidfGuesser load_model(const std::string& prefix, const GuesserConfig& cfg, const Analyzer& analyzer) {
    const ModelPaths paths = ModelPaths::from_prefix(prefix);

    const json vj = read_json(paths.vocab);
    auto tokens = require_array_of<std::string>(vj, "tokens", paths.vocab);
    if (vj.contains("unk") && vj.at("unk") != json(kUnk)) {
        throw std::runtime_error(paths.vocab + ": unknown-token marker is not " + std::string(kUnk));
    }

    DocumentMatrix matrix;
    if (!matrix.load(paths.matrix)) {
        throw std::runtime_error("failed to load document matrix: " + paths.matrix);
    }

    const json dj = read_json(paths.doccounts);
    if (!dj.contains("total_documents") || !dj.at("total_documents").is_number_unsigned()) {
        throw std::runtime_error(paths.doccounts + ".total_documents must be a non-negative integer");
    }
    const uint64_t total_docs = dj.at("total_documents").get<uint64_t>();
    auto df = require_array_of<uint64_t>(dj, "document_frequency", paths.doccounts);
    auto counts = require_array_of<uint64_t>(dj, "global_counts", paths.doccounts);

    const json qj = read_json(paths.questions);
    auto questions = require_array_of<std::string>(qj, "questions", paths.questions);
    auto answers = require_array_of<std::string>(qj, "answers", paths.questions);

    TfidfGuesser g(cfg, analyzer);
    g.restore(std::move(tokens), std::move(counts), total_docs, std::move(df),
              std::move(matrix), std::move(questions), std::move(answers));
    return g;
}

} // namespace tfidf
