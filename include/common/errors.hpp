#pragma once

#include <stdexcept>
#include <string>

namespace tempo {

/**
 * @brief Structural error categories raised by the engine
 */
enum class ErrorCode {
    NotFound,
    DuplicateDocument,
    UnknownDocument,
    IncomparableTimestamp,
    TimestampParse
};

std::string error_code_to_string(ErrorCode code);

/**
 * @brief Base class for every structural engine error
 *
 * Structural errors abort the single operation that raised them. They are
 * never retried internally and never turned into an empty result.
 */
class GraphError : public std::runtime_error {
public:
    GraphError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

// Unknown document id on lookup
class NotFoundError : public GraphError {
public:
    explicit NotFoundError(const std::string& doc_id)
        : GraphError(ErrorCode::NotFound, "Document not found: " + doc_id),
          doc_id_(doc_id) {}

    const std::string& doc_id() const { return doc_id_; }

private:
    std::string doc_id_;
};

// Id collision on insert
class DuplicateDocumentError : public GraphError {
public:
    explicit DuplicateDocumentError(const std::string& doc_id)
        : GraphError(ErrorCode::DuplicateDocument, "Duplicate document id: " + doc_id),
          doc_id_(doc_id) {}

    const std::string& doc_id() const { return doc_id_; }

private:
    std::string doc_id_;
};

// Relationship endpoint missing
class UnknownDocumentError : public GraphError {
public:
    explicit UnknownDocumentError(const std::string& doc_id)
        : GraphError(ErrorCode::UnknownDocument,
                     "Relationship endpoint does not exist: " + doc_id),
          doc_id_(doc_id) {}

    const std::string& doc_id() const { return doc_id_; }

private:
    std::string doc_id_;
};

// A zone-aware and a zone-naive value met in one comparison
class IncomparableTimestampError : public GraphError {
public:
    explicit IncomparableTimestampError(const std::string& message)
        : GraphError(ErrorCode::IncomparableTimestamp, message) {}
};

class TimestampParseError : public GraphError {
public:
    explicit TimestampParseError(const std::string& text)
        : GraphError(ErrorCode::TimestampParse, "Cannot parse timestamp: '" + text + "'") {}
};

/**
 * @brief Non-exception outcome of a query
 *
 * NoPath and Cancelled are ordinary results: a cancelled query still hands
 * back whatever it finished before the signal was observed.
 */
enum class ResultStatus {
    Complete,
    NoPath,
    Cancelled
};

std::string result_status_to_string(ResultStatus status);

} // namespace tempo
