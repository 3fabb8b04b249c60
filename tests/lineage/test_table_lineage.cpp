#include "lineage/TableLineageExtractor.h"
#include "sql/SqlParser.h"
#include <cassert>
#include <iostream>

namespace {

sql::Statement parse(const std::string &text) {
  return sql::SqlParser("spark").parseStatement(text);
}

} // namespace

void testInputTables() {
  std::cout << "Testing TableLineageExtractor - input tables...\n";

  auto inputs = TableLineageExtractor::inputTables(parse(
      "WITH c AS (SELECT id FROM Sales.Orders) "
      "SELECT * FROM c JOIN customers ON c.id = customers.id "
      "WHERE EXISTS (SELECT 1 FROM sales.orders WHERE flag)"));

  assert(inputs.size() == 2 && "CTEs are excluded and duplicates collapse");
  assert(inputs[0] == "customers");
  assert(inputs[1] == "sales.orders");

  std::cout << "✓ TableLineageExtractor input tables test passed\n";
}

void testTableUsage() {
  std::cout << "Testing TableLineageExtractor - table usage...\n";

  TableLineageExtractor extractor("spark");

  auto tables = extractor.tables(parse(
      "INSERT INTO out WITH c AS (SELECT * FROM a) "
      "SELECT * FROM c JOIN b ON c.id = b.id"));
  assert(tables.size() == 4);
  assert(tables[0].name == "a" && tables[0].usage == TableUsage::INPUT);
  assert(tables[1].name == "b");
  assert(tables[2].name == "c" && tables[2].objectType == ObjectType::CTE);
  assert(tables[3].name == "out" && tables[3].usage == TableUsage::OUTPUT);

  auto view = extractor.tables(parse("CREATE VIEW v AS SELECT x FROM t"));
  assert(view.size() == 2);
  assert(view[1].name == "v");
  assert(view[1].objectType == ObjectType::VIEW);
  assert(toString(view[1].usage) == "OUTPUT");

  auto selfJoin = extractor.tables(parse("INSERT INTO t SELECT * FROM t"));
  assert(selfJoin.size() == 1);
  assert(selfJoin[0].usage == TableUsage::BOTH);

  auto created = extractor.tables(parse("CREATE TABLE s.t (id INT)"));
  assert(created.size() == 1);
  assert(toString(created[0].objectType) == "TABLE");

  std::cout << "✓ TableLineageExtractor usage test passed\n";
}

void testTableEdges() {
  std::cout << "Testing TableLineageExtractor - table edges...\n";

  TableLineageExtractor extractor;

  auto plain = extractor.extract(parse("SELECT * FROM a JOIN b ON a.id = b.id"));
  assert(plain.size() == 2);
  assert(plain[0].outputName == QUERY_RESULT_TABLE);
  assert(plain[0].sourceName == "a");

  auto insert = extractor.extract(parse("INSERT INTO db.out SELECT x FROM src"));
  assert(insert.size() == 1);
  assert(insert[0].outputName == "db.out");
  assert(insert[0].sourceName == "src");

  std::cout << "✓ TableLineageExtractor edge test passed\n";
}

void testAnalyzeTables() {
  std::cout << "Testing TableLineageExtractor - analyze script...\n";

  TableLineageExtractor extractor("spark");
  const std::string sql =
      "INSERT INTO a SELECT x FROM staging.events;\n"
      "DROP TABLE old;\n"
      "INSERT INTO b SELECT y FROM other";

  auto all = extractor.analyzeTables(sql);
  assert(all.size() == 3);
  assert(all[1].tables.empty() && "Administrative statements touch no modelled tables");
  assert(all[2].metadata.queryIndex == 2);

  auto filtered = extractor.analyzeTables(sql, std::string("EVENTS"));
  assert(filtered.size() == 1);
  assert(filtered[0].metadata.queryIndex == 0);
  assert(filtered[0].metadata.queryPreview ==
         "INSERT INTO a SELECT x FROM staging.events");

  assert(TableLineageExtractor::referencesTable(parse("INSERT INTO b SELECT y FROM other"), "B"));

  std::cout << "✓ TableLineageExtractor analyze test passed\n";
}

int main() {
  try {
    testInputTables();
    testTableUsage();
    testTableEdges();
    testAnalyzeTables();
    std::cout << "\n✅ All TableLineageExtractor tests passed!\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "❌ Test failed: " << e.what() << "\n";
    return 1;
  }
}
