#pragma once
#include "tfidf/TfidfGuesser.hpp"
#include <string>

namespace tfidf {

// Artifacts written next to each other under a path prefix:
//   <prefix>.vocab.json      token by id
//   <prefix>.tfidf.bin       document matrix
//   <prefix>.doccounts.json  document frequencies + global counts
//   <prefix>.questions.json  training questions and answers, row-aligned
struct ModelPaths {
    std::string vocab;
    std::string matrix;
    std::string doccounts;
    std::string questions;

    static ModelPaths from_prefix(const std::string& prefix);
};

// throws InvalidStateError unless the guesser is trained, std::runtime_error on I/O failure
void save_model(const TfidfGuesser& guesser, const std::string& prefix);

// throws std::runtime_error naming the artifact that failed to read or parse
TfidfGuesser load_model(const std::string& prefix, const GuesserConfig& cfg, const Analyzer& analyzer);

} // namespace tfidf
