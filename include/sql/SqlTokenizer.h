#ifndef SQL_TOKENIZER_H
#define SQL_TOKENIZER_H

#include <string>
#include <vector>

namespace sql {

enum class TokenType {
  Word,             // unquoted identifier or keyword, lower-cased
  QuotedIdentifier, // "x", `x` or [x], case preserved
  String,           // 'text', unescaped
  Number,
  Parameter,        // ?, $1, @name
  Symbol,           // punctuation and operators
  End
};

struct Token {
  TokenType type{TokenType::End};
  std::string value;
  size_t begin{0};
  size_t end{0};

  bool isWord(const char *word) const {
    return type == TokenType::Word && value == word;
  }
  bool isSymbol(const char *symbol) const {
    return type == TokenType::Symbol && value == symbol;
  }
  bool isIdentifier() const {
    return type == TokenType::Word || type == TokenType::QuotedIdentifier;
  }
};

// Splits SQL text into tokens. Comments and whitespace are dropped; the final
// token is always TokenType::End. Double quotes delimit strings in the
// Hive-family and MySQL dialects and identifiers everywhere else.
class SqlTokenizer {
public:
  explicit SqlTokenizer(const std::string &dialect = "spark");

  std::vector<Token> tokenize(const std::string &sql) const;

  bool doubleQuoteIsString() const { return doubleQuoteIsString_; }

private:
  bool doubleQuoteIsString_;
  bool bracketIdentifiers_;
  bool hashComments_;
};

} // namespace sql

#endif
