#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace tfidf {

// Dense rows x cols matrix of TF-IDF weights, one row per training document.
class DocumentMatrix {
public:
    DocumentMatrix() = default;
    DocumentMatrix(size_t rows, size_t cols);

    // throws std::invalid_argument if values.size() != cols()
    void set_row(size_t r, const std::vector<double>& values);

    const double* row(size_t r) const { return m_vals.data() + r * m_cols; }
    double at(size_t r, size_t c) const { return m_vals[r * m_cols + c]; }

    size_t rows() const { return m_rows; }
    size_t cols() const { return m_cols; }
    size_t nonzero_count() const;

    // cache I/O (binary)
    bool save(const std::string& path) const;
    bool load(const std::string& path);

    bool operator==(const DocumentMatrix& o) const {
        return m_rows == o.m_rows && m_cols == o.m_cols && m_vals == o.m_vals;
    }

private:
    size_t m_rows = 0;
    size_t m_cols = 0;
    std::vector<double> m_vals; // packed: size = rows()*cols()
};

} // namespace tfidf
