#include "sql/SqlTokenizer.h"
#include "lineage/LineageErrors.h"
#include "utils/string_utils.h"
#include <cctype>
#include <string_view>

namespace sql {

namespace {

bool isIdentStart(unsigned char c) {
  return std::isalpha(c) || c == '_' || c >= 0x80;
}

bool isIdentChar(unsigned char c) {
  return std::isalnum(c) || c == '_' || c == '$' || c >= 0x80;
}

// Longest operators first so that "<=>" wins over "<=" and "<".
const char *const kOperators[] = {"<=>", "<>", "<=", ">=", "!=", "==", "||",
                                  "::",  "->", "=>", "&&"};

} // namespace

SqlTokenizer::SqlTokenizer(const std::string &dialect) {
  std::string d = StringUtils::toLower(dialect);
  doubleQuoteIsString_ = d == "spark" || d == "databricks" || d == "hive" ||
                         d == "bigquery" || d == "mysql";
  bracketIdentifiers_ = d == "tsql";
  hashComments_ = d == "mysql";
}

std::vector<Token> SqlTokenizer::tokenize(const std::string &sql) const {
  std::vector<Token> tokens;
  const size_t n = sql.size();
  size_t i = 0;

  // A UTF-8 byte order mark at the start of a file is not part of the SQL.
  if (StringUtils::startsWith(sql, "\xEF\xBB\xBF"))
    i = 3;

  auto readQuoted = [&](char close, bool backslashEscapes) {
    size_t start = i;
    std::string value;
    ++i;
    while (true) {
      if (i >= n)
        throw SqlParseError("Unterminated quoted text", start);
      char c = sql[i];
      if (backslashEscapes && c == '\\' && i + 1 < n) {
        char next = sql[i + 1];
        switch (next) {
        case 'n':
          value += '\n';
          break;
        case 't':
          value += '\t';
          break;
        default:
          value += next;
        }
        i += 2;
        continue;
      }
      if (c == close) {
        if (i + 1 < n && sql[i + 1] == close) {
          value += close;
          i += 2;
          continue;
        }
        ++i;
        break;
      }
      value += c;
      ++i;
    }
    return value;
  };

  while (i < n) {
    unsigned char c = static_cast<unsigned char>(sql[i]);

    if (std::isspace(c)) {
      ++i;
      continue;
    }

    if (c == '-' && i + 1 < n && sql[i + 1] == '-') {
      while (i < n && sql[i] != '\n')
        ++i;
      continue;
    }
    if (hashComments_ && c == '#') {
      while (i < n && sql[i] != '\n')
        ++i;
      continue;
    }
    if (c == '/' && i + 1 < n && sql[i + 1] == '*') {
      size_t start = i;
      size_t close = sql.find("*/", i + 2);
      if (close == std::string::npos)
        throw SqlParseError("Unterminated block comment", start);
      i = close + 2;
      continue;
    }

    Token token;
    token.begin = i;

    if (c == '\'') {
      token.type = TokenType::String;
      token.value = readQuoted('\'', doubleQuoteIsString_);
    } else if (c == '"') {
      token.type = doubleQuoteIsString_ ? TokenType::String
                                        : TokenType::QuotedIdentifier;
      token.value = readQuoted('"', doubleQuoteIsString_);
    } else if (c == '`') {
      token.type = TokenType::QuotedIdentifier;
      token.value = readQuoted('`', false);
    } else if (c == '[' && bracketIdentifiers_) {
      token.type = TokenType::QuotedIdentifier;
      token.value = readQuoted(']', false);
    } else if (std::isdigit(c) ||
               (c == '.' && i + 1 < n &&
                std::isdigit(static_cast<unsigned char>(sql[i + 1])))) {
      token.type = TokenType::Number;
      while (i < n && std::isdigit(static_cast<unsigned char>(sql[i])))
        ++i;
      if (i < n && sql[i] == '.' &&
          !(i + 1 < n && sql[i + 1] == '.')) {
        ++i;
        while (i < n && std::isdigit(static_cast<unsigned char>(sql[i])))
          ++i;
      }
      if (i < n && (sql[i] == 'e' || sql[i] == 'E')) {
        size_t j = i + 1;
        if (j < n && (sql[j] == '+' || sql[j] == '-'))
          ++j;
        if (j < n && std::isdigit(static_cast<unsigned char>(sql[j]))) {
          i = j;
          while (i < n && std::isdigit(static_cast<unsigned char>(sql[i])))
            ++i;
        }
      }
      // Type suffixes such as 10L, 1.5D or 3BD.
      while (i < n && std::isalpha(static_cast<unsigned char>(sql[i])))
        ++i;
      token.value = sql.substr(token.begin, i - token.begin);
    } else if (isIdentStart(c)) {
      token.type = TokenType::Word;
      while (i < n && isIdentChar(static_cast<unsigned char>(sql[i])))
        ++i;
      token.value = StringUtils::toLower(sql.substr(token.begin, i - token.begin));
    } else if (c == '?') {
      token.type = TokenType::Parameter;
      token.value = "?";
      ++i;
    } else if ((c == '$' || c == '@') && i + 1 < n &&
               isIdentChar(static_cast<unsigned char>(sql[i + 1]))) {
      token.type = TokenType::Parameter;
      ++i;
      while (i < n && isIdentChar(static_cast<unsigned char>(sql[i])))
        ++i;
      token.value = sql.substr(token.begin, i - token.begin);
    } else {
      token.type = TokenType::Symbol;
      bool matched = false;
      for (const char *op : kOperators) {
        std::string_view opView(op);
        if (sql.compare(i, opView.size(), opView) == 0) {
          token.value = std::string(opView);
          i += opView.size();
          matched = true;
          break;
        }
      }
      if (!matched) {
        token.value = std::string(1, static_cast<char>(c));
        ++i;
      }
    }

    token.end = i;
    tokens.push_back(std::move(token));
  }

  Token end;
  end.type = TokenType::End;
  end.begin = n;
  end.end = n;
  tokens.push_back(end);
  return tokens;
}

} // namespace sql
