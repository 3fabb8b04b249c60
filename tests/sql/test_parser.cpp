#include "lineage/LineageErrors.h"
#include "sql/SqlParser.h"
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

using namespace sql;

void testSelectStructure() {
  std::cout << "Testing SqlParser - SELECT structure...\n";

  SqlParser parser("spark");
  Statement statement = parser.parseStatement(
      "SELECT o.id, c.Name AS customer_name, amount * 2 doubled "
      "FROM db.orders o LEFT JOIN customers c ON o.customer_id = c.id "
      "WHERE amount > 0 GROUP BY o.id, c.name, amount");

  assert(statement.typeName() == "SELECT");
  const auto *select = std::get_if<SelectStatement>(&statement.body);
  assert(select && select->query);
  const SelectCore &core = *select->query->select;

  assert(core.projections.size() == 3);
  assert(core.projections[0].expr->isColumn());
  assert(core.projections[0].expr->path.size() == 2);
  assert(core.projections[0].expr->columnName() == "id");
  assert(core.projections[1].alias() == "customer_name");
  assert(core.projections[2].alias() == "doubled");
  assert(core.projections[2].expr->kind == ExprKind::Binary);

  assert(core.from->table.qualified() == "db.orders");
  assert(core.from->referenceName() == "o");
  assert(core.joins.size() == 1);
  assert(core.joins[0].kind == JoinKind::Left);
  assert(core.joins[0].condition);
  assert(core.where);
  assert(core.groupBy.size() == 3);

  std::cout << "✓ SqlParser SELECT structure test passed\n";
}

void testCtesAndSetOperations() {
  std::cout << "Testing SqlParser - CTEs and set operations...\n";

  SqlParser parser("spark");
  QueryPtr query = parser.parseQuery(
      "WITH a AS (SELECT x FROM t1), b (y) AS (SELECT x FROM a) "
      "SELECT y FROM b UNION ALL SELECT z FROM t2");

  assert(query->kind == QueryKind::SetOperation);
  assert(query->setOperator == "UNION ALL");
  assert(query->ctes.size() == 2);
  assert(query->ctes[0].name == "a");
  assert(query->ctes[1].columnAliases.size() == 1);
  assert(query->ctes[1].columnAliases[0] == "y");
  assert(query->firstBranch().kind == QueryKind::Select);

  auto references = tableReferences(*query);
  size_t ctes = 0;
  size_t tables = 0;
  for (const auto &reference : references) {
    if (reference.isCte)
      ++ctes;
    else
      ++tables;
  }
  assert(ctes == 2 && "a and b are read as CTEs");
  assert(tables == 2 && "t1 and t2 are physical tables");

  std::cout << "✓ SqlParser CTE test passed\n";
}

void testWriteStatements() {
  std::cout << "Testing SqlParser - DML and DDL statements...\n";

  SqlParser parser("spark");

  Statement insert = parser.parseStatement(
      "INSERT OVERWRITE TABLE warehouse.daily (day, total) SELECT d, SUM(v) FROM raw GROUP BY d");
  const auto *ins = std::get_if<InsertStatement>(&insert.body);
  assert(ins && ins->overwrite);
  assert(ins->target.qualified() == "warehouse.daily");
  assert(ins->columns.size() == 2);
  assert(insert.typeName() == "INSERT OVERWRITE");
  assert(targetTable(insert)->qualified() == "warehouse.daily");

  Statement values = parser.parseStatement("INSERT INTO t VALUES (1, 'a'), (2, 'b')");
  const auto *vals = std::get_if<InsertStatement>(&values.body);
  assert(vals && vals->hasValues && !vals->query);
  assert(lineageQuery(values) == nullptr);

  Statement create = parser.parseStatement(
      "CREATE TABLE IF NOT EXISTS s.t (id BIGINT, name VARCHAR(20), tags ARRAY<STRING>)");
  const auto *ct = std::get_if<CreateStatement>(&create.body);
  assert(ct && ct->kind == CreateKind::Table);
  assert(ct->columns.size() == 3);
  assert(ct->columns[1].name == "name");
  assert(create.typeName() == "CREATE TABLE");

  Statement view = parser.parseStatement(
      "CREATE OR REPLACE TEMPORARY VIEW v AS SELECT a FROM t");
  const auto *cv = std::get_if<CreateStatement>(&view.body);
  assert(cv && cv->kind == CreateKind::View && cv->orReplace && cv->temporary);
  assert(cv->query);
  assert(view.typeName() == "CREATE VIEW");

  Statement update = parser.parseStatement(
      "UPDATE t SET a = (SELECT MAX(b) FROM s), c = 1 WHERE id = 3");
  const auto *up = std::get_if<UpdateStatement>(&update.body);
  assert(up && up->assignments.size() == 2);
  assert(up->assignments[0].column == "a");

  Statement del = parser.parseStatement("DELETE FROM t WHERE id = 1");
  assert(del.typeName() == "DELETE");

  std::cout << "✓ SqlParser DML/DDL test passed\n";
}

void testAdministrativeStatements() {
  std::cout << "Testing SqlParser - administrative statements...\n";

  SqlParser parser("spark");
  Statement drop = parser.parseStatement("DROP TABLE IF EXISTS t");
  assert(std::holds_alternative<AdministrativeStatement>(drop.body));
  assert(drop.typeName() == "DROP TABLE");

  Statement set = parser.parseStatement("SET spark.sql.shuffle.partitions = 10");
  assert(set.typeName() == "SET");

  Statement function = parser.parseStatement(
      "CREATE FUNCTION f AS 'com.example.F'");
  assert(std::holds_alternative<AdministrativeStatement>(function.body));
  assert(function.typeName() == "CREATE FUNCTION");

  std::cout << "✓ SqlParser administrative statement test passed\n";
}

void testScriptSplitting() {
  std::cout << "Testing SqlParser - script splitting...\n";

  SqlParser parser("spark");
  std::string script = "SELECT 1;\n;\n  SELECT ';' AS s ; DROP TABLE x";

  auto texts = parser.splitStatements(script);
  assert(texts.size() == 3 && "Empty statements are dropped");
  assert(texts[0] == "SELECT 1");
  assert(texts[1] == "SELECT ';' AS s");
  assert(texts[2] == "DROP TABLE x");

  auto statements = parser.parseScript(script);
  assert(statements.size() == 3);
  assert(statements[0].index == 0);
  assert(statements[2].index == 2);
  assert(statements[1].text == "SELECT ';' AS s");

  std::cout << "✓ SqlParser script splitting test passed\n";
}

void testLateralViewsAndFunctions() {
  std::cout << "Testing SqlParser - lateral views...\n";

  SqlParser parser("spark");
  QueryPtr query = parser.parseQuery(
      "SELECT id, item FROM orders LATERAL VIEW OUTER explode(items) e AS item");
  const SelectCore &core = *query->select;
  assert(core.lateralViews.size() == 1);
  assert(core.lateralViews[0].outer);
  assert(core.lateralViews[0].alias == "e");
  assert(core.lateralViews[0].columnAliases.size() == 1);
  assert(core.lateralViews[0].generator->name == "explode");

  std::cout << "✓ SqlParser lateral view test passed\n";
}

void testSyntaxErrors() {
  std::cout << "Testing SqlParser - syntax errors...\n";

  SqlParser parser("spark");
  bool threw = false;
  try {
    parser.parseStatement("SELECT a FROM (SELECT b FROM t");
  } catch (const SqlParseError &e) {
    threw = true;
    assert(std::string(e.what()).find("end of input") != std::string::npos);
  }
  assert(threw && "Unbalanced parentheses should fail");

  threw = false;
  try {
    parser.parseStatement("SELECT 1; SELECT 2");
  } catch (const SqlParseError &) {
    threw = true;
  }
  assert(threw && "parseStatement accepts exactly one statement");

  threw = false;
  try {
    parser.parseStatement("   ");
  } catch (const SqlParseError &) {
    threw = true;
  }
  assert(threw && "Empty input is not a statement");

  std::cout << "✓ SqlParser syntax error test passed\n";
}

void testStatementLevelErrors() {
  std::cout << "Testing SqlParser - per-statement errors and nesting...\n";

  SqlParser parser("spark");
  const std::string script = "SELECT 1;\nSELECT a FROM (SELECT;\nSELECT 2";

  std::vector<StatementParseError> errors;
  auto statements = parser.parseScript(script, &errors);
  assert(statements.size() == 2);
  assert(statements[0].index == 0);
  assert(statements[1].index == 2 && "Indexes count the failed statement");
  assert(errors.size() == 1);
  assert(errors[0].index == 1);
  assert(errors[0].text == "SELECT a FROM (SELECT");
  assert(errors[0].message.find("end of input") != std::string::npos);

  bool threw = false;
  try {
    parser.parseScript(script);
  } catch (const SqlParseError &) {
    threw = true;
  }
  assert(threw && "Without an error list the first failure propagates");

  std::string shallow =
      "SELECT " + std::string(200, '(') + "a" + std::string(200, ')') + " FROM t";
  assert(parser.parseStatement(shallow).index == 0);

  for (const std::string &open : {std::string("("), std::string("- "),
                                  std::string("NOT "), std::string("(SELECT ")}) {
    std::string deep = "SELECT ";
    for (int i = 0; i < 200000; ++i)
      deep += open;
    deep += "a";
    threw = false;
    try {
      parser.parseStatement(deep);
    } catch (const SqlParseError &e) {
      threw = true;
      assert(std::string(e.what()).find("Nesting deeper than") != std::string::npos);
    }
    assert(threw && "Deep nesting fails with a parse error");
  }

  std::cout << "✓ SqlParser statement error test passed\n";
}

int main() {
  try {
    testSelectStructure();
    testCtesAndSetOperations();
    testWriteStatements();
    testAdministrativeStatements();
    testScriptSplitting();
    testLateralViewsAndFunctions();
    testSyntaxErrors();
    testStatementLevelErrors();
    std::cout << "\n✅ All SqlParser tests passed!\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "❌ Test failed: " << e.what() << "\n";
    return 1;
  }
}
