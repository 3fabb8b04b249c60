#ifndef LINEAGE_ERRORS_H
#define LINEAGE_ERRORS_H

#include <stdexcept>
#include <string>
#include <vector>

// Base class for every error raised by the lineage engine.
class LineageError : public std::runtime_error {
public:
  explicit LineageError(const std::string &message)
      : std::runtime_error(message) {}
};

// SQL text that cannot be tokenized or parsed. offset is the byte position of
// the offending token inside the statement text.
class SqlParseError : public LineageError {
public:
  SqlParseError(const std::string &message, size_t offset)
      : LineageError(message + " (at offset " + std::to_string(offset) + ")"),
        offset_(offset) {}

  size_t offset() const { return offset_; }

private:
  size_t offset_;
};

// Statement kind without column lineage (DROP, DELETE, SET, ...). Always
// converted into a SkippedQuery by the extractor.
class UnsupportedStatementError : public LineageError {
public:
  UnsupportedStatementError(const std::string &statementType,
                            const std::string &reason)
      : LineageError(reason), statementType_(statementType) {}

  const std::string &statementType() const { return statementType_; }

private:
  std::string statementType_;
};

// SELECT * whose source columns are unknown while no-star mode is active.
class StarResolutionError : public LineageError {
public:
  explicit StarResolutionError(const std::string &message)
      : LineageError(message) {}
};

// Unqualified column in a multi-table scope while strict schema inference is
// active.
class SchemaResolutionError : public LineageError {
public:
  explicit SchemaResolutionError(const std::string &message)
      : LineageError(message) {}
};

// Requested item does not exist; the message lists valid candidates.
class NotFoundError : public LineageError {
public:
  NotFoundError(const std::string &message,
                const std::vector<std::string> &candidates)
      : LineageError(withCandidates(message, candidates)),
        candidates_(candidates) {}

  const std::vector<std::string> &candidates() const { return candidates_; }

private:
  static std::string withCandidates(const std::string &message,
                                    const std::vector<std::string> &candidates) {
    if (candidates.empty())
      return message;
    constexpr size_t kMaxListed = 20;
    std::string result = message + ". Available: ";
    for (size_t i = 0; i < candidates.size() && i < kMaxListed; ++i) {
      if (i > 0)
        result += ", ";
      result += candidates[i];
    }
    if (candidates.size() > kMaxListed)
      result += ", ... (" + std::to_string(candidates.size()) + " total)";
    return result;
  }

  std::vector<std::string> candidates_;
};

class ColumnNotFoundError : public NotFoundError {
public:
  ColumnNotFoundError(const std::string &column,
                      const std::vector<std::string> &candidates)
      : NotFoundError("Column '" + column + "' not found in any query",
                      candidates) {}
};

class NodeNotFoundError : public NotFoundError {
public:
  NodeNotFoundError(const std::string &column,
                    const std::vector<std::string> &candidates)
      : NotFoundError("Column '" + column + "' not found in graph",
                      candidates) {}
};

class TableNotFoundError : public NotFoundError {
public:
  TableNotFoundError(const std::string &table,
                     const std::vector<std::string> &candidates)
      : NotFoundError("Table '" + table + "' not found in graph",
                      candidates) {}
};

// Catalog provider that cannot be created or configured. Failures for a
// single table are reported per table instead.
class CatalogError : public LineageError {
public:
  explicit CatalogError(const std::string &message) : LineageError(message) {}
};

// Graph file that is not valid lineage graph JSON.
class GraphFormatError : public LineageError {
public:
  explicit GraphFormatError(const std::string &message)
      : LineageError(message) {}
};

#endif
