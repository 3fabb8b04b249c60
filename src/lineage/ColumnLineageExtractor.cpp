#include "lineage/ColumnLineageExtractor.h"
#include "core/logger.h"
#include "lineage/LineageErrors.h"
#include "sql/ScopeResolver.h"
#include "sql/SqlParser.h"
#include "utils/string_utils.h"
#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>
#include <utility>

namespace {

std::string unsupportedReason(const std::string &statementType) {
  return "Statement type '" + statementType +
         "' does not support lineage analysis";
}

// Leading keyword of statement text, for statements that did not parse.
std::string statementKeyword(const std::string &text) {
  std::string trimmed = StringUtils::trim(text);
  return StringUtils::toUpper(trimmed.substr(0, trimmed.find_first_of(" \t\r\n(")));
}

bool hasSubquery(const sql::Expression &expr) {
  std::vector<const sql::QueryNode *> subqueries;
  sql::collectSubqueries(expr, subqueries);
  return !subqueries.empty();
}

// Qualifier for a DQL projection: the real table behind an alias, the CTE or
// derived-table name, or the single FROM source for unqualified columns.
std::string dqlQualifier(const sql::ResolvedProjection &projection,
                         const sql::SelectScope &scope) {
  if (projection.source)
    return projection.source->qualifiedName();
  if (!projection.expr->isColumn())
    return "";

  std::vector<std::string> qualifier = projection.expr->qualifier();
  if (!qualifier.empty()) {
    const sql::SourceBinding *source = scope.find(qualifier);
    if (source)
      return source->qualifiedName();
    return StringUtils::toLower(StringUtils::join(qualifier, "."));
  }
  if (scope.select->joins.empty() && scope.sources.size() == 1)
    return scope.sources.front().qualifiedName();
  return "";
}

} // namespace

bool updateHasSelect(const sql::UpdateStatement &update) {
  for (const auto &assignment : update.assignments) {
    if (hasSubquery(*assignment.value))
      return true;
  }
  if (update.where && hasSubquery(*update.where))
    return true;
  for (const auto &source : update.from) {
    if (source.kind == sql::SourceKind::Derived)
      return true;
  }
  return false;
}

std::string updateAsSelect(const sql::UpdateStatement &update) {
  std::string sql = "SELECT ";
  for (size_t i = 0; i < update.assignments.size(); ++i) {
    if (i > 0)
      sql += ", ";
    sql += update.assignments[i].value->text + " AS " +
           update.assignments[i].column;
  }
  sql += " FROM " + update.target.qualified();
  if (!update.targetAlias.empty())
    sql += " " + update.targetAlias;
  for (const auto &source : update.from)
    sql += ", " + source.text;
  if (update.where)
    sql += " WHERE " + update.where->text;
  return sql;
}

ColumnLineageExtractor::ColumnLineageExtractor(
    std::shared_ptr<sql::ILineageTracer> tracer, ExtractorOptions options)
    : tracer_(std::move(tracer)), options_(std::move(options)),
      tableExtractor_(options_.dialect) {
  if (!tracer_) {
    throw std::invalid_argument("ColumnLineageExtractor requires a tracer");
  }
}

void ColumnLineageExtractor::setInitialSchema(const sql::SchemaMap &schema) {
  initialSchema_ = schema;
  schema_.reset(initialSchema_);
}

std::vector<OutputColumn>
ColumnLineageExtractor::getOutputColumns(const sql::Statement &statement) const {
  std::vector<OutputColumn> outputs;
  const std::string statementType = statement.typeName();

  if (const auto *update = std::get_if<sql::UpdateStatement>(&statement.body)) {
    if (!updateHasSelect(*update)) {
      throw UnsupportedStatementError(statementType,
                                      unsupportedReason(statementType));
    }
    std::string target = update->target.qualified();
    for (const auto &assignment : update->assignments) {
      std::string column = StringUtils::toLower(assignment.column);
      outputs.push_back({target + "." + column, column, outputs.size()});
    }
    return outputs;
  }

  const sql::QueryNode *query = sql::lineageQuery(statement);
  if (!query) {
    throw UnsupportedStatementError(statementType,
                                    unsupportedReason(statementType));
  }
  const sql::TableName *targetName = sql::targetTable(statement);
  const std::string target = targetName ? targetName->qualified() : "";

  auto qualify = [&](const std::string &qualifier, const std::string &name) {
    if (!target.empty())
      return target + "." + name;
    return qualifier.empty() ? name : qualifier + "." + name;
  };

  // Set operations take their column names from the first branch.
  sql::ScopeResolver resolver(schema_.toMap());
  const sql::CteScope *ctes = nullptr;
  const sql::QueryNode *branch = query;
  while (true) {
    ctes = resolver.pushCtes(*branch, ctes);
    if (branch->kind != sql::QueryKind::SetOperation || !branch->left)
      break;
    branch = branch->left.get();
  }

  if (branch->kind == sql::QueryKind::Values) {
    for (const auto &name : resolver.outputColumns(*branch, nullptr))
      outputs.push_back({qualify("", name), name, outputs.size()});
    return outputs;
  }
  if (!branch->select)
    return outputs;

  sql::SelectScope scope = resolver.bind(*branch->select, ctes);
  for (const auto &projection : resolver.projections(scope)) {
    if (projection.unresolvedStar) {
      if (options_.noStar) {
        std::string star = projection.expr->path.empty()
                               ? "*"
                               : StringUtils::join(projection.expr->path, ".") +
                                     ".*";
        std::string message = "SELECT " + star + " could not be resolved to columns";
        if (!target.empty())
          message += " for target table '" + target + "'";
        throw StarResolutionError(
            message + ". Provide schema context or avoid using SELECT *.");
      }
      outputs.push_back({qualify("", "*"), "*", outputs.size()});
      continue;
    }
    outputs.push_back(
        {qualify(dqlQualifier(projection, scope), projection.name),
         projection.name, outputs.size()});
  }
  return outputs;
}

std::vector<std::string>
ColumnLineageExtractor::flatten(const sql::TraceNode &root) const {
  std::set<std::string> sources;
  std::vector<std::pair<const sql::TraceNode *, size_t>> stack;
  for (const auto &child : root.downstream)
    stack.emplace_back(&child, 1);

  while (!stack.empty()) {
    auto [node, depth] = stack.back();
    stack.pop_back();
    if (depth > options_.maxDepth) {
      throw LineageError("Lineage depth limit of " +
                         std::to_string(options_.maxDepth) + " exceeded");
    }
    if (node->isLeaf()) {
      if (node->literal)
        sources.insert(literalMarker(node->expression));
      else if (!node->name.empty())
        sources.insert(node->name);
      continue;
    }
    for (const auto &child : node->downstream)
      stack.emplace_back(&child, depth + 1);
  }
  return std::vector<std::string>(sources.begin(), sources.end());
}

std::vector<std::string>
ColumnLineageExtractor::traceSources(const OutputColumn &output,
                                     const std::string &sql,
                                     const sql::SchemaMap &schema) const {
  try {
    sql::TraceNode root =
        tracer_->traceAt(output.position, output.lineageName, sql,
                         options_.dialect, schema);
    std::vector<std::string> sources = flatten(root);
    if (sources.empty()) {
      Logger::warning(LogCategory::LINEAGE, "ColumnLineageExtractor",
                      "No sources found for column " + output.displayName);
    }
    return sources;
  } catch (const StarResolutionError &) {
    throw;
  } catch (const LineageError &e) {
    Logger::warning(LogCategory::LINEAGE, "ColumnLineageExtractor",
                    "Could not trace column " + output.displayName + ": " +
                        std::string(e.what()));
  }
  return {};
}

std::vector<LineageItem>
ColumnLineageExtractor::extractForward(const sql::Statement &statement,
                                       const std::optional<std::string> &column) const {
  std::vector<OutputColumn> outputs = getOutputColumns(statement);

  if (column) {
    std::vector<OutputColumn> matched;
    for (const auto &output : outputs) {
      if (StringUtils::equalsIgnoreCase(output.displayName, *column)) {
        matched.push_back(output);
        break;
      }
    }
    if (matched.empty())
      return {};
    outputs = std::move(matched);
  }

  std::string sql = statement.text;
  std::vector<sql::TableReference> references = sql::tableReferences(statement);
  if (const auto *update = std::get_if<sql::UpdateStatement>(&statement.body)) {
    sql = updateAsSelect(*update);
    sql::TableReference target;
    target.name = update->target;
    references.push_back(std::move(target));
  }
  sql::SchemaMap pruned = schema_.pruneTo(references);

  std::vector<LineageItem> items;
  for (const auto &output : outputs) {
    std::vector<std::string> sources = traceSources(output, sql, pruned);
    if (sources.empty())
      sources.push_back(UNRESOLVED_SOURCE);
    for (auto &source : sources) {
      LineageItem item;
      item.outputName = output.displayName;
      item.sourceName = std::move(source);
      items.push_back(std::move(item));
    }
  }
  return items;
}

std::vector<LineageItem>
ColumnLineageExtractor::extractReverse(const sql::Statement &statement,
                                       const std::string &sourceColumn) const {
  std::vector<LineageItem> forward = extractForward(statement);

  std::map<std::string, std::set<std::string>> affectedBy;
  std::set<std::string> outputs;
  for (const auto &item : forward) {
    outputs.insert(item.outputName);
    if (item.sourceName != UNRESOLVED_SOURCE)
      affectedBy[item.sourceName].insert(item.outputName);
  }

  std::string matched;
  std::set<std::string> affected;
  for (const auto &entry : affectedBy) {
    if (StringUtils::equalsIgnoreCase(entry.first, sourceColumn)) {
      matched = entry.first;
      affected = entry.second;
      break;
    }
  }
  if (matched.empty()) {
    // A column the statement produces but does not read affects itself.
    for (const auto &output : outputs) {
      if (StringUtils::equalsIgnoreCase(output, sourceColumn)) {
        matched = output;
        affected = {output};
        break;
      }
    }
  }

  std::vector<LineageItem> items;
  if (matched.empty())
    return items;
  for (const auto &output : affected) {
    LineageItem item;
    item.outputName = matched;
    item.sourceName = output;
    items.push_back(std::move(item));
  }
  return items;
}

std::vector<QueryLineageResult>
ColumnLineageExtractor::analyzeQueries(const std::string &sql,
                                       const AnalysisRequest &request) {
  sql::SqlParser parser(options_.dialect);
  std::vector<sql::StatementParseError> parseErrors;
  std::vector<sql::Statement> statements = parser.parseScript(sql, &parseErrors);

  schema_.reset(initialSchema_);
  skipped_.clear();
  for (const auto &error : parseErrors) {
    SkippedQuery skipped;
    skipped.queryIndex = error.index;
    skipped.statementType = statementKeyword(error.text);
    skipped.reason = error.message;
    skipped.queryPreview =
        TableLineageExtractor::metadataFor(error.index, error.text).queryPreview;
    Logger::warning(LogCategory::LINEAGE, "ColumnLineageExtractor",
                    "Cannot parse statement " + std::to_string(error.index) +
                        ": " + error.message);
    skipped_.push_back(std::move(skipped));
  }
  std::vector<QueryLineageResult> results;
  std::set<std::string> candidates;

  for (const auto &statement : statements) {
    if (request.tableFilter &&
        !TableLineageExtractor::referencesTable(statement, *request.tableFilter)) {
      schema_.record(statement);
      continue;
    }
    QueryMetadata metadata = TableLineageExtractor::metadataFor(statement);

    try {
      std::vector<LineageItem> items;
      if (request.level == AnalysisLevel::TABLE) {
        items = tableExtractor_.extract(statement);
      } else {
        if (request.column || request.sourceColumn) {
          for (const auto &output : getOutputColumns(statement))
            candidates.insert(output.displayName);
        }
        if (request.sourceColumn) {
          items = extractReverse(statement, *request.sourceColumn);
        } else {
          items = extractForward(statement, request.column);
        }
      }

      bool filtered = request.level == AnalysisLevel::COLUMN &&
                      (request.column || request.sourceColumn);
      if (!items.empty() || !filtered) {
        QueryLineageResult result;
        result.metadata = metadata;
        result.items = std::move(items);
        result.level = request.level;
        results.push_back(std::move(result));
      }
    } catch (const UnsupportedStatementError &e) {
      SkippedQuery skipped;
      skipped.queryIndex = statement.index;
      skipped.statementType = e.statementType();
      skipped.reason = e.what();
      skipped.queryPreview = metadata.queryPreview;
      Logger::debug(LogCategory::LINEAGE, "ColumnLineageExtractor",
                    "Skipping statement " + std::to_string(statement.index) +
                        ": " + skipped.reason);
      skipped_.push_back(std::move(skipped));
    }

    // Recorded only now so a statement never sees its own output schema.
    schema_.record(statement);
  }

  std::stable_sort(skipped_.begin(), skipped_.end(),
                   [](const SkippedQuery &a, const SkippedQuery &b) {
                     return a.queryIndex < b.queryIndex;
                   });

  if (results.empty() && request.level == AnalysisLevel::COLUMN) {
    std::vector<std::string> known(candidates.begin(), candidates.end());
    if (request.column)
      throw ColumnNotFoundError(*request.column, known);
    if (request.sourceColumn)
      throw ColumnNotFoundError(*request.sourceColumn, known);
  }
  return results;
}

const SchemaContext &ColumnLineageExtractor::extractSchema(const std::string &sql) {
  sql::SqlParser parser(options_.dialect);
  schema_.reset(initialSchema_);
  definedTables_.clear();
  std::vector<sql::StatementParseError> parseErrors;
  for (const auto &statement : parser.parseScript(sql, &parseErrors)) {
    schema_.record(statement);
    const auto *create = std::get_if<sql::CreateStatement>(&statement.body);
    if (create && create->kind != sql::CreateKind::Other &&
        !create->target.empty() && schema_.contains(create->target.qualified()))
      definedTables_.insert(StringUtils::toLower(create->target.qualified()));
    schema_.inferFromQuery(statement, options_.strictSchema);
  }
  return schema_;
}
