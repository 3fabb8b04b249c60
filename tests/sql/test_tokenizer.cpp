#include "lineage/LineageErrors.h"
#include "sql/SqlTokenizer.h"
#include <cassert>
#include <iostream>

using sql::SqlTokenizer;
using sql::Token;
using sql::TokenType;

void testWordsAreLowerCased() {
  std::cout << "Testing SqlTokenizer - word case folding...\n";

  SqlTokenizer tokenizer("spark");
  auto tokens = tokenizer.tokenize("SELECT Col FROM Db.Orders");

  assert(tokens.size() == 7 && "6 tokens plus End");
  assert(tokens[0].isWord("select"));
  assert(tokens[1].isWord("col"));
  assert(tokens[3].isWord("db"));
  assert(tokens[4].isSymbol("."));
  assert(tokens[5].isWord("orders"));
  assert(tokens.back().type == TokenType::End);

  std::cout << "✓ SqlTokenizer case folding test passed\n";
}

void testDoubleQuotesByDialect() {
  std::cout << "Testing SqlTokenizer - double quotes per dialect...\n";

  auto spark = SqlTokenizer("spark").tokenize("\"Hello\"");
  assert(spark[0].type == TokenType::String && "Spark double quotes are strings");
  assert(spark[0].value == "Hello");

  auto postgres = SqlTokenizer("postgres").tokenize("\"MixedCase\"");
  assert(postgres[0].type == TokenType::QuotedIdentifier);
  assert(postgres[0].value == "MixedCase" && "Quoted identifiers keep case");

  assert(SqlTokenizer("MySQL").doubleQuoteIsString());
  assert(!SqlTokenizer("snowflake").doubleQuoteIsString());

  std::cout << "✓ SqlTokenizer double quote test passed\n";
}

void testQuotedIdentifiers() {
  std::cout << "Testing SqlTokenizer - backticks and brackets...\n";

  auto backtick = SqlTokenizer("spark").tokenize("`My Col`");
  assert(backtick[0].type == TokenType::QuotedIdentifier);
  assert(backtick[0].value == "My Col");

  auto tsql = SqlTokenizer("tsql").tokenize("[Order Id]");
  assert(tsql[0].type == TokenType::QuotedIdentifier);
  assert(tsql[0].value == "Order Id");

  auto spark = SqlTokenizer("spark").tokenize("[1]");
  assert(spark[0].isSymbol("[") && "Brackets are symbols outside T-SQL");

  auto escaped = SqlTokenizer("spark").tokenize("'it''s'");
  assert(escaped[0].type == TokenType::String);
  assert(escaped[0].value == "it's");

  std::cout << "✓ SqlTokenizer quoted identifier test passed\n";
}

void testCommentsAndBom() {
  std::cout << "Testing SqlTokenizer - comments and byte order mark...\n";

  SqlTokenizer tokenizer("spark");
  auto tokens = tokenizer.tokenize("SELECT 1 -- trailing\n/* block */ , 2");
  assert(tokens.size() == 5);
  assert(tokens[1].type == TokenType::Number && tokens[1].value == "1");
  assert(tokens[2].isSymbol(","));
  assert(tokens[3].value == "2");

  auto bom = tokenizer.tokenize("\xEF\xBB\xBFSELECT x");
  assert(bom[0].isWord("select"));
  assert(bom[0].begin == 3);

  auto hash = SqlTokenizer("mysql").tokenize("SELECT x # note");
  assert(hash.size() == 3 && "MySQL # starts a comment");

  std::cout << "✓ SqlTokenizer comment test passed\n";
}

void testOperatorsNumbersAndParameters() {
  std::cout << "Testing SqlTokenizer - operators, numbers, parameters...\n";

  SqlTokenizer tokenizer("spark");
  auto tokens = tokenizer.tokenize("a <=> 1.5e3 AND b <> ? OR c = $1 || 10L");

  assert(tokens[1].isSymbol("<=>"));
  assert(tokens[2].type == TokenType::Number && tokens[2].value == "1.5e3");
  assert(tokens[5].isSymbol("<>"));
  assert(tokens[6].type == TokenType::Parameter && tokens[6].value == "?");
  assert(tokens[10].type == TokenType::Parameter && tokens[10].value == "$1");
  assert(tokens[11].isSymbol("||"));
  assert(tokens[12].value == "10L");

  std::cout << "✓ SqlTokenizer operator test passed\n";
}

void testOffsets() {
  std::cout << "Testing SqlTokenizer - token offsets...\n";

  std::string sql = "SELECT  amount";
  auto tokens = SqlTokenizer("spark").tokenize(sql);
  assert(tokens[1].begin == 8 && tokens[1].end == 14);
  assert(sql.substr(tokens[1].begin, tokens[1].end - tokens[1].begin) == "amount");
  assert(tokens.back().begin == sql.size());

  std::cout << "✓ SqlTokenizer offset test passed\n";
}

void testUnterminatedInput() {
  std::cout << "Testing SqlTokenizer - unterminated input...\n";

  SqlTokenizer tokenizer("spark");
  bool threw = false;
  try {
    tokenizer.tokenize("SELECT 'open");
  } catch (const SqlParseError &e) {
    threw = true;
    assert(e.offset() == 7);
  }
  assert(threw && "Unterminated string should raise SqlParseError");

  threw = false;
  try {
    tokenizer.tokenize("SELECT 1 /* never closed");
  } catch (const SqlParseError &) {
    threw = true;
  }
  assert(threw && "Unterminated comment should raise SqlParseError");

  std::cout << "✓ SqlTokenizer unterminated input test passed\n";
}

int main() {
  try {
    testWordsAreLowerCased();
    testDoubleQuotesByDialect();
    testQuotedIdentifiers();
    testCommentsAndBom();
    testOperatorsNumbersAndParameters();
    testOffsets();
    testUnterminatedInput();
    std::cout << "\n✅ All SqlTokenizer tests passed!\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "❌ Test failed: " << e.what() << "\n";
    return 1;
  }
}
