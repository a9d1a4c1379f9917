#pragma once
#include "tfidf/DocumentMatrix.hpp"
#include <cstddef>
#include <vector>

namespace tfidf {

struct Match {
    size_t row = 0;
    double score = 0.0;
};

// dot / (|a| |b|); 0 when either vector has zero norm
double cosine_similarity(const double* a, const double* b, size_t dim);
double cosine_similarity(const std::vector<double>& a, const std::vector<double>& b);

// Top-1 row by cosine similarity, ties going to the lowest row.
// Throws EmptyCorpusError on an empty matrix, std::invalid_argument on a width mismatch.
Match find_best_match(const std::vector<double>& query, const DocumentMatrix& docs);

} // namespace tfidf
