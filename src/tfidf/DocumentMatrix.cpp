#include "tfidf/DocumentMatrix.hpp"
#include <algorithm>
#include <cstdint>
#include <fstream>
#include <stdexcept>

namespace tfidf {

DocumentMatrix::DocumentMatrix(size_t rows, size_t cols)
    : m_rows(rows), m_cols(cols), m_vals(rows * cols, 0.0) {}

void DocumentMatrix::set_row(size_t r, const std::vector<double>& values) {
    if (r >= m_rows) throw std::out_of_range("document matrix row " + std::to_string(r));
    if (values.size() != m_cols) {
        throw std::invalid_argument("document matrix row width " + std::to_string(values.size()) +
                                    " != " + std::to_string(m_cols));
    }
    std::copy(values.begin(), values.end(), m_vals.begin() + (std::ptrdiff_t)(r * m_cols));
}

size_t DocumentMatrix::nonzero_count() const {
    size_t n = 0;
    for (double v : m_vals) {
        if (v != 0.0) ++n;
    }
    return n;
}

bool DocumentMatrix::save(const std::string& path) const {
    std::ofstream out(path, std::ios::binary);
    if (!out) return false;

    uint32_t rows = (uint32_t)m_rows;
    uint32_t cols = (uint32_t)m_cols;
    out.write((const char*)&rows, sizeof(rows));
    out.write((const char*)&cols, sizeof(cols));

    uint64_t count = (uint64_t)m_vals.size();
    out.write((const char*)&count, sizeof(count));
    out.write((const char*)m_vals.data(), (std::streamsize)(sizeof(double) * m_vals.size()));
    return (bool)out;
}

bool DocumentMatrix::load(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;

    uint32_t rows = 0, cols = 0;
    in.read((char*)&rows, sizeof(rows));
    in.read((char*)&cols, sizeof(cols));
    if (!in) return false;

    uint64_t count = 0;
    in.read((char*)&count, sizeof(count));
    if (!in || count != (uint64_t)rows * (uint64_t)cols) return false;

    std::vector<double> vals((size_t)count);
    in.read((char*)vals.data(), (std::streamsize)(sizeof(double) * vals.size()));
    if (!in) return false;

    m_rows = rows;
    m_cols = cols;
    m_vals = std::move(vals);
    return true;
}

} // namespace tfidf
