#include "corpus/QaCorpus.hpp"
#include "text/TextUtil.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace tfidf {

static std::string read_all(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("failed to open corpus: " + path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static void add_record(const json& j, const std::string& where, const CorpusOptions& opts,
                       std::vector<std::string>& questions, std::vector<std::string>& answers,
                       size_t& skipped) {
    if (!j.is_object()) throw std::runtime_error(where + " must be an object");

    if (!j.contains("text") || !j.at("text").is_string()) {
        throw std::runtime_error(where + " missing required string field: text");
    }

    const char* field = opts.answer_field.c_str();
    std::string answer;
    if (j.contains(field) && !j.at(field).is_null()) {
        if (!j.at(field).is_string()) {
            throw std::runtime_error(where + "." + opts.answer_field + " must be a string");
        }
        answer = j.at(field).get<std::string>();
    }
    if (answer.empty() && opts.require_answer) {
        ++skipped;
        return;
    }

    const std::string text = j.at("text").get<std::string>();
    if (opts.split_by_sentence) {
        for (auto& s : textutil::split_sentences(text)) {
            questions.push_back(std::move(s));
            answers.push_back(answer);
        }
    } else {
        questions.push_back(text);
        answers.push_back(answer);
    }
}

QaCorpus QaCorpus::load(const std::string& path, const CorpusOptions& opts) {
    return from_string(read_all(path), opts, path);
}

QaCorpus QaCorpus::from_string(const std::string& content, const CorpusOptions& opts, const std::string& origin) {
    QaCorpus c;

    size_t first = content.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return c;

    if (content[first] == '[') {
        json j;
        try {
            j = json::parse(content);
        } catch (const std::exception& e) {
            throw std::runtime_error("failed to parse JSON in " + origin + ": " + e.what());
        }
        for (size_t i = 0; i < j.size(); ++i) {
            std::ostringstream oss;
            oss << origin << ": root[" << i << "]";
            add_record(j.at(i), oss.str(), opts, c.m_questions, c.m_answers, c.m_skipped);
        }
        return c;
    }

    // JSON lines
    std::istringstream in(content);
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;

        std::ostringstream oss;
        oss << origin << ": line " << line_no;
        json j;
        try {
            j = json::parse(line);
        } catch (const std::exception& e) {
            throw std::runtime_error("failed to parse " + oss.str() + ": " + e.what());
        }
        add_record(j, oss.str(), opts, c.m_questions, c.m_answers, c.m_skipped);
    }
    return c;
}

} // namespace tfidf
