#pragma once
#include <stdexcept>
#include <string>

namespace tfidf {

// Base for every domain error raised by the engine. None of these are
// transient: retrying the same call gives the same failure.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Operation called before (or after) the finalize step it depends on.
class InvalidStateError : public Error {
public:
    explicit InvalidStateError(const std::string& what) : Error(what) {}
};

// Finalized vocabulary does not fit under max_vocab_size.
class CapacityError : public Error {
public:
    explicit CapacityError(const std::string& what) : Error(what) {}
};

// Similarity search against a matrix with no rows.
class EmptyCorpusError : public Error {
public:
    explicit EmptyCorpusError(const std::string& what) : Error(what) {}
};

// Document-frequency pass saw a different number of documents than the corpus holds.
class DocumentCountMismatchError : public Error {
public:
    explicit DocumentCountMismatchError(const std::string& what) : Error(what) {}
};

} // namespace tfidf
