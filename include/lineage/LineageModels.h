#ifndef LINEAGE_MODELS_H
#define LINEAGE_MODELS_H

#include <optional>
#include <string>
#include <vector>

enum class AnalysisLevel { COLUMN, TABLE };

// Source of a literal-valued output, e.g. "<literal: 0>".
inline std::string literalMarker(const std::string &expression) {
  return "<literal: " + expression + ">";
}

// Output whose sources could not be traced.
constexpr const char *UNRESOLVED_SOURCE = "<unresolved>";

// Output name used by table-level lineage of plain queries.
constexpr const char *QUERY_RESULT_TABLE = "query_result";

inline bool isLiteralMarker(const std::string &name) {
  return name.rfind("<literal", 0) == 0;
}

struct LineageItem {
  std::string outputName;
  std::string sourceName;

  bool operator==(const LineageItem &other) const {
    return outputName == other.outputName && sourceName == other.sourceName;
  }
  bool operator<(const LineageItem &other) const {
    if (outputName != other.outputName)
      return outputName < other.outputName;
    return sourceName < other.sourceName;
  }
};

struct QueryMetadata {
  size_t queryIndex{0};
  std::string queryPreview;
};

struct QueryLineageResult {
  QueryMetadata metadata;
  std::vector<LineageItem> items;
  AnalysisLevel level{AnalysisLevel::COLUMN};
};

struct SkippedQuery {
  size_t queryIndex{0};
  std::string statementType;
  std::string reason;
  std::string queryPreview;
};

enum class TableUsage { INPUT, OUTPUT, BOTH };
enum class ObjectType { TABLE, VIEW, CTE, UNKNOWN };

struct TableInfo {
  std::string name;
  TableUsage usage{TableUsage::INPUT};
  ObjectType objectType{ObjectType::UNKNOWN};
};

struct QueryTablesResult {
  QueryMetadata metadata;
  std::vector<TableInfo> tables;
};

// What analyzeQueries computes. column selects forward lineage of one output,
// sourceColumn selects reverse lineage; both empty means every output.
struct AnalysisRequest {
  AnalysisLevel level{AnalysisLevel::COLUMN};
  std::optional<std::string> column;
  std::optional<std::string> sourceColumn;
  std::optional<std::string> tableFilter;
};

std::string toString(AnalysisLevel level);
std::string toString(TableUsage usage);
std::string toString(ObjectType type);

#endif
