#include "tfidf/Similarity.hpp"
#include "tfidf/Errors.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace tfidf {

double cosine_similarity(const double* a, const double* b, size_t dim) {
    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < dim; ++i) {
        double x = a[i], y = b[i];
        dot += x * y;
        na += x * x;
        nb += y * y;
    }
    if (na == 0.0 || nb == 0.0) return 0.0;
    return dot / (std::sqrt(na) * std::sqrt(nb));
}

double cosine_similarity(const std::vector<double>& a, const std::vector<double>& b) {
    if (a.size() != b.size()) {
        throw std::invalid_argument("cosine_similarity: size mismatch " + std::to_string(a.size()) +
                                    " vs " + std::to_string(b.size()));
    }
    return cosine_similarity(a.data(), b.data(), a.size());
}

Match find_best_match(const std::vector<double>& query, const DocumentMatrix& docs) {
    if (docs.rows() == 0) throw EmptyCorpusError("find_best_match: document matrix has no rows");
    if (query.size() != docs.cols()) {
        throw std::invalid_argument("find_best_match: query width " + std::to_string(query.size()) +
                                    " != " + std::to_string(docs.cols()));
    }

    Match best;
    best.score = cosine_similarity(query.data(), docs.row(0), docs.cols());
    for (size_t r = 1; r < docs.rows(); ++r) {
        double s = cosine_similarity(query.data(), docs.row(r), docs.cols());
        if (s > best.score) {
            best.row = r;
            best.score = s;
        }
    }
    return best;
}

} // namespace tfidf
