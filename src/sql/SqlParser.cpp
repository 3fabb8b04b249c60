#include "sql/SqlParser.h"
#include "lineage/LineageErrors.h"
#include "utils/string_utils.h"
#include <unordered_set>

namespace sql {

namespace {

// Words that end an expression or a source list, so they are never taken as
// an implicit alias.
const std::unordered_set<std::string> kAliasReserved = {
    "from",     "where",     "group",   "having",   "order",     "limit",
    "offset",   "fetch",     "union",   "intersect", "except",   "minus",
    "join",     "inner",     "left",    "right",    "full",      "cross",
    "natural",  "outer",     "semi",    "anti",     "on",        "using",
    "lateral",  "window",    "qualify", "select",   "values",    "when",
    "then",     "else",      "end",     "and",      "or",        "not",
    "is",       "in",        "like",    "ilike",    "rlike",     "regexp",
    "between",  "as",        "set",     "into",     "with",      "tablesample",
    "pivot",    "unpivot",   "for",     "sort",     "distribute", "cluster",
    "partition", "returning", "over",   "filter",   "case",      "asc",
    "desc",     "nulls",     "apply",   "by",       "all",       "distinct",
    "escape",   "overwrite", "options", "location", "tblproperties",
    "stored",   "partitioned", "clustered", "if",   "view",      "table"};

// Words that can never start an operand.
const std::unordered_set<std::string> kExpressionReserved = {
    "from", "where", "select", "group", "having", "order", "union",
    "intersect", "except", "join", "on", "then", "else", "end", "when",
    "limit", "and", "or", "as", "by", "into"};

const std::unordered_set<std::string> kTypedLiteralPrefixes = {
    "date", "timestamp", "time", "datetime", "timestamp_ntz", "timestamp_ltz",
    "timestamptz", "x", "b", "n", "e", "r"};

const std::unordered_set<std::string> kNiladicFunctions = {
    "current_date", "current_timestamp", "current_time", "current_user",
    "localtimestamp", "localtime", "session_user", "sysdate",
    "current_catalog", "current_schema"};

const std::unordered_set<std::string> kComparisonOperators = {
    "=", "==", "<>", "!=", "<", "<=", ">", ">=", "<=>"};

const std::unordered_set<std::string> kIntervalUnits = {
    "year",   "years",   "month",       "months",       "week",
    "weeks",  "day",     "days",        "hour",         "hours",
    "minute", "minutes", "second",      "seconds",      "millisecond",
    "milliseconds", "microsecond", "microseconds", "quarter", "quarters"};

// Deepest nesting of expressions and queries the parser accepts.
constexpr size_t kMaxNestingDepth = 1000;

std::string upperWords(const std::vector<std::string> &words) {
  return StringUtils::toUpper(StringUtils::join(words, " "));
}

class Parser {
public:
  Parser(const std::string &source, std::vector<Token> tokens)
      : src_(source), toks_(std::move(tokens)) {}

  Statement parseStatement() {
    Statement statement;
    size_t begin = peek().begin;

    if (peek().isWord("with")) {
      advance();
      acceptWord("recursive");
      std::vector<CommonTableExpr> ctes = parseCteList();
      std::string withText = textFrom(begin);

      if (peek().isWord("insert")) {
        InsertStatement insert = parseInsert();
        hoistCtes(insert.query, ctes, withText);
        statement.body = std::move(insert);
      } else {
        QueryPtr query = parseQueryAfterWith(begin, std::move(ctes));
        SelectStatement select;
        select.query = std::move(query);
        statement.body = std::move(select);
      }
    } else if (isQueryStart(pos_)) {
      SelectStatement select;
      select.query = parseQuery();
      statement.body = std::move(select);
    } else if (peek().isWord("insert")) {
      statement.body = parseInsert();
    } else if (peek().isWord("create")) {
      statement.body = parseCreate();
    } else if (peek().isWord("cache")) {
      statement.body = parseCache();
    } else if (peek().isWord("merge")) {
      statement.body = parseMerge();
    } else if (peek().isWord("update")) {
      statement.body = parseUpdate();
    } else if (peek().isWord("delete")) {
      statement.body = parseDelete();
    } else {
      statement.body = parseAdministrative();
    }

    if (!atEnd()) {
      fail("Unexpected token after end of statement");
    }
    statement.text = textFrom(begin);
    return statement;
  }

  QueryPtr parseStandaloneQuery() {
    QueryPtr query = parseQuery();
    if (!atEnd()) {
      fail("Unexpected token after end of query");
    }
    return query;
  }

private:
  // Counts one level of recursion for its lifetime.
  class NestingGuard {
  public:
    explicit NestingGuard(Parser &parser) : parser_(parser) {
      if (parser_.depth_ >= kMaxNestingDepth) {
        parser_.fail("Nesting deeper than " +
                     std::to_string(kMaxNestingDepth) + " levels");
      }
      ++parser_.depth_;
    }
    ~NestingGuard() { --parser_.depth_; }

    NestingGuard(const NestingGuard &) = delete;
    NestingGuard &operator=(const NestingGuard &) = delete;

  private:
    Parser &parser_;
  };

  const std::string &src_;
  std::vector<Token> toks_;
  size_t pos_{0};
  size_t lastEnd_{0};
  size_t depth_{0};

  // ---- token helpers ----

  const Token &peek(size_t k = 0) const {
    size_t idx = pos_ + k;
    return idx < toks_.size() ? toks_[idx] : toks_.back();
  }

  const Token &tokenAt(size_t idx) const {
    return idx < toks_.size() ? toks_[idx] : toks_.back();
  }

  bool atEnd() const { return peek().type == TokenType::End; }

  const Token &advance() {
    const Token &t = toks_[pos_];
    if (t.type != TokenType::End) {
      ++pos_;
      lastEnd_ = t.end;
    }
    return t;
  }

  bool acceptWord(const char *word) {
    if (peek().isWord(word)) {
      advance();
      return true;
    }
    return false;
  }

  bool acceptSymbol(const char *symbol) {
    if (peek().isSymbol(symbol)) {
      advance();
      return true;
    }
    return false;
  }

  void expectWord(const char *word) {
    if (!acceptWord(word))
      fail("Expected " + StringUtils::toUpper(word));
  }

  void expectSymbol(const char *symbol) {
    if (!acceptSymbol(symbol))
      fail(std::string("Expected '") + symbol + "'");
  }

  [[noreturn]] void fail(const std::string &message) const {
    const Token &t = peek();
    std::string found = t.type == TokenType::End
                            ? "end of input"
                            : "'" + src_.substr(t.begin, t.end - t.begin) + "'";
    throw SqlParseError(message + ", found " + found, t.begin);
  }

  std::string textFrom(size_t begin) const {
    if (lastEnd_ <= begin)
      return "";
    return src_.substr(begin, lastEnd_ - begin);
  }

  std::string identifier() {
    const Token &t = peek();
    if (!t.isIdentifier())
      fail("Expected identifier");
    advance();
    return StringUtils::toLower(t.value);
  }

  bool isAliasCandidate(const Token &t) const {
    if (t.type == TokenType::QuotedIdentifier)
      return true;
    return t.type == TokenType::Word && kAliasReserved.count(t.value) == 0;
  }

  // True when the token at idx starts a query, looking through any number of
  // opening parentheses.
  bool isQueryStart(size_t idx) const {
    while (tokenAt(idx).isSymbol("("))
      ++idx;
    const Token &t = tokenAt(idx);
    return t.isWord("select") || t.isWord("with") || t.isWord("values");
  }

  // True when a dotted name starting at the current token is followed by '('.
  bool isCallAhead() const {
    size_t idx = pos_;
    while (tokenAt(idx).isIdentifier()) {
      if (tokenAt(idx + 1).isSymbol("("))
        return true;
      if (!tokenAt(idx + 1).isSymbol("."))
        return false;
      idx += 2;
    }
    return false;
  }

  void skipBalanced() {
    if (!peek().isSymbol("("))
      return;
    int depth = 0;
    do {
      if (atEnd())
        fail("Unbalanced parentheses");
      if (peek().isSymbol("("))
        ++depth;
      else if (peek().isSymbol(")"))
        --depth;
      advance();
    } while (depth > 0);
  }

  void skipToEnd() {
    while (!atEnd())
      advance();
  }

  // Skips tokens up to (not including) the next ',' or ')' at depth zero.
  void skipListElement() {
    int depth = 0;
    while (!atEnd()) {
      if (depth == 0 && (peek().isSymbol(",") || peek().isSymbol(")")))
        return;
      if (peek().isSymbol("("))
        ++depth;
      else if (peek().isSymbol(")"))
        --depth;
      advance();
    }
  }

  std::vector<std::string> parseIdentifierList() {
    std::vector<std::string> names;
    expectSymbol("(");
    do {
      names.push_back(identifier());
      // View column lists may carry a COMMENT per column.
      if (acceptWord("comment") && peek().type == TokenType::String)
        advance();
    } while (acceptSymbol(","));
    expectSymbol(")");
    return names;
  }

  TableName parseTableName() {
    TableName name;
    name.parts.push_back(identifier());
    while (peek().isSymbol(".") && tokenAt(pos_ + 1).isIdentifier()) {
      advance();
      name.parts.push_back(identifier());
    }
    return name;
  }

  std::string parseOptionalAlias() {
    if (acceptWord("as"))
      return identifier();
    if (isAliasCandidate(peek()))
      return identifier();
    return "";
  }

  std::string parseTypeName() {
    size_t begin = peek().begin;
    identifier();
    static const std::unordered_set<std::string> continuation = {
        "precision", "varying", "with", "without", "time", "zone",
        "unsigned",  "local"};
    while (peek().type == TokenType::Word && continuation.count(peek().value))
      advance();
    if (peek().isSymbol("("))
      skipBalanced();
    if (peek().isSymbol("<")) {
      int depth = 0;
      do {
        if (atEnd())
          fail("Unbalanced type parameters");
        if (peek().isSymbol("<"))
          ++depth;
        else if (peek().isSymbol(">"))
          --depth;
        advance();
      } while (depth > 0);
    }
    while (peek().isSymbol("[") && tokenAt(pos_ + 1).isSymbol("]")) {
      advance();
      advance();
    }
    return textFrom(begin);
  }

  // ---- queries ----

  std::vector<CommonTableExpr> parseCteList() {
    std::vector<CommonTableExpr> ctes;
    do {
      CommonTableExpr cte;
      cte.name = identifier();
      if (peek().isSymbol("("))
        cte.columnAliases = parseIdentifierList();
      expectWord("as");
      if (acceptWord("not"))
        expectWord("materialized");
      else
        acceptWord("materialized");
      expectSymbol("(");
      cte.query = parseQuery();
      expectSymbol(")");
      ctes.push_back(std::move(cte));
    } while (acceptSymbol(","));
    return ctes;
  }

  void hoistCtes(QueryPtr &query, std::vector<CommonTableExpr> &ctes,
                 const std::string &withText) {
    if (!query || ctes.empty())
      return;
    for (auto it = ctes.rbegin(); it != ctes.rend(); ++it)
      query->ctes.insert(query->ctes.begin(), std::move(*it));
    query->text = withText + " " + query->text;
  }

  QueryPtr parseQuery() {
    NestingGuard guard(*this);
    size_t begin = peek().begin;
    if (acceptWord("with")) {
      acceptWord("recursive");
      std::vector<CommonTableExpr> ctes = parseCteList();
      return parseQueryAfterWith(begin, std::move(ctes));
    }
    QueryPtr query = parseSetOperation();
    parseQueryModifiers(*query);
    query->text = textFrom(begin);
    return query;
  }

  QueryPtr parseQueryAfterWith(size_t begin, std::vector<CommonTableExpr> ctes) {
    QueryPtr query = parseSetOperation();
    parseQueryModifiers(*query);
    for (auto it = ctes.rbegin(); it != ctes.rend(); ++it)
      query->ctes.insert(query->ctes.begin(), std::move(*it));
    query->text = textFrom(begin);
    return query;
  }

  QueryPtr parseSetOperation() {
    size_t begin = peek().begin;
    QueryPtr left = parseQueryTerm();
    while (true) {
      std::string op;
      if (peek().isWord("union") || peek().isWord("intersect") ||
          peek().isWord("except") || peek().isWord("minus")) {
        op = StringUtils::toUpper(advance().value);
      } else {
        break;
      }
      if (acceptWord("all"))
        op += " ALL";
      else if (acceptWord("distinct"))
        op += " DISTINCT";
      // BY NAME variants match columns by name instead of position.
      if (peek().isWord("by") && tokenAt(pos_ + 1).isWord("name")) {
        advance();
        advance();
        op += " BY NAME";
      }

      QueryPtr right = parseQueryTerm();
      auto node = std::make_unique<QueryNode>();
      node->kind = QueryKind::SetOperation;
      node->setOperator = op;
      node->left = std::move(left);
      node->right = std::move(right);
      node->text = textFrom(begin);
      left = std::move(node);
    }
    return left;
  }

  QueryPtr parseQueryTerm() {
    size_t begin = peek().begin;
    if (peek().isSymbol("(")) {
      if (!isQueryStart(pos_ + 1))
        fail("Expected query");
      advance();
      QueryPtr inner = parseQuery();
      expectSymbol(")");
      return inner;
    }
    if (peek().isWord("select")) {
      auto node = std::make_unique<QueryNode>();
      node->kind = QueryKind::Select;
      node->select = parseSelectCore();
      node->text = textFrom(begin);
      return node;
    }
    if (peek().isWord("values")) {
      return parseValues();
    }
    fail("Expected SELECT");
  }

  QueryPtr parseValues() {
    size_t begin = peek().begin;
    expectWord("values");
    auto node = std::make_unique<QueryNode>();
    node->kind = QueryKind::Values;
    do {
      std::vector<ExprPtr> row;
      if (acceptSymbol("(")) {
        do {
          row.push_back(parseExpr());
        } while (acceptSymbol(","));
        expectSymbol(")");
      } else {
        row.push_back(parseExpr());
      }
      node->rows.push_back(std::move(row));
    } while (acceptSymbol(","));
    node->text = textFrom(begin);
    return node;
  }

  void parseQueryModifiers(QueryNode &query) {
    while (true) {
      if ((peek().isWord("order") || peek().isWord("sort")) &&
          tokenAt(pos_ + 1).isWord("by")) {
        advance();
        advance();
        parseOrderItems(query.orderBy);
      } else if ((peek().isWord("distribute") || peek().isWord("cluster")) &&
                 tokenAt(pos_ + 1).isWord("by")) {
        advance();
        advance();
        do {
          query.orderBy.push_back(parseExpr());
        } while (acceptSymbol(","));
      } else if (acceptWord("limit")) {
        if (!acceptWord("all"))
          parseExpr();
        if (acceptSymbol(",") || acceptWord("offset"))
          parseExpr();
      } else if (acceptWord("offset")) {
        parseExpr();
        if (!acceptWord("rows"))
          acceptWord("row");
      } else if (acceptWord("fetch")) {
        if (!acceptWord("first"))
          expectWord("next");
        if (!peek().isWord("rows") && !peek().isWord("row"))
          parseExpr();
        if (!acceptWord("rows"))
          expectWord("row");
        if (!acceptWord("only")) {
          expectWord("with");
          expectWord("ties");
        }
      } else {
        break;
      }
    }
  }

  void parseOrderItems(std::vector<ExprPtr> &out) {
    do {
      out.push_back(parseExpr());
      if (!acceptWord("asc"))
        acceptWord("desc");
      if (acceptWord("nulls")) {
        if (!acceptWord("first"))
          expectWord("last");
      }
    } while (acceptSymbol(","));
  }

  std::unique_ptr<SelectCore> parseSelectCore() {
    expectWord("select");
    auto core = std::make_unique<SelectCore>();

    if (acceptWord("distinct")) {
      core->distinct = true;
      if (acceptWord("on")) {
        expectSymbol("(");
        do {
          parseExpr();
        } while (acceptSymbol(","));
        expectSymbol(")");
      }
    } else {
      acceptWord("all");
    }
    if (acceptWord("top")) {
      parsePrimary();
    }

    do {
      core->projections.push_back(parseSelectItem());
    } while (acceptSymbol(","));

    if (acceptWord("into")) {
      acceptWord("temporary");
      acceptWord("temp");
      parseTableName();
    }

    if (acceptWord("from")) {
      parseFromClause(*core);
    }

    while (true) {
      if (acceptWord("where")) {
        core->where = parseExpr();
      } else if (peek().isWord("group") && tokenAt(pos_ + 1).isWord("by")) {
        advance();
        advance();
        if (!acceptWord("all")) {
          do {
            core->groupBy.push_back(parseGroupingElement());
          } while (acceptSymbol(","));
        }
        if (peek().isWord("with") && (tokenAt(pos_ + 1).isWord("rollup") ||
                                      tokenAt(pos_ + 1).isWord("cube"))) {
          advance();
          advance();
        }
      } else if (acceptWord("having")) {
        core->having = parseExpr();
      } else if (acceptWord("window")) {
        do {
          identifier();
          expectWord("as");
          parseWindowSpec();
        } while (acceptSymbol(","));
      } else if (acceptWord("qualify")) {
        core->qualify = parseExpr();
      } else {
        break;
      }
    }
    return core;
  }

  ExprPtr parseGroupingElement() {
    if (peek().isWord("grouping") && tokenAt(pos_ + 1).isWord("sets")) {
      size_t begin = peek().begin;
      advance();
      advance();
      auto node = std::make_unique<Expression>();
      node->kind = ExprKind::Function;
      node->name = "grouping sets";
      expectSymbol("(");
      do {
        node->children.push_back(parseExpr());
      } while (acceptSymbol(","));
      expectSymbol(")");
      node->text = textFrom(begin);
      return node;
    }
    return parseExpr();
  }

  SelectItem parseSelectItem() {
    SelectItem item;
    size_t begin = peek().begin;
    item.expr = parseExpr();
    if (acceptWord("as")) {
      if (peek().isSymbol("(")) {
        item.aliases = parseIdentifierList();
      } else if (peek().type == TokenType::String) {
        item.aliases.push_back(StringUtils::toLower(advance().value));
      } else {
        item.aliases.push_back(identifier());
      }
    } else if (isAliasCandidate(peek())) {
      item.aliases.push_back(identifier());
    }
    item.text = textFrom(begin);
    return item;
  }

  void parseFromClause(SelectCore &core) {
    core.from = std::make_unique<TableSource>(parseTableSource());
    while (true) {
      if (acceptSymbol(",")) {
        Join join;
        join.kind = JoinKind::Comma;
        join.source = parseTableSource();
        core.joins.push_back(std::move(join));
      } else if (peek().isWord("lateral") && tokenAt(pos_ + 1).isWord("view")) {
        core.lateralViews.push_back(parseLateralView());
      } else {
        JoinKind kind;
        if (!acceptJoinKeywords(kind))
          break;
        Join join;
        join.kind = kind;
        join.source = parseTableSource();
        if (acceptWord("on")) {
          join.condition = parseExpr();
        } else if (acceptWord("using")) {
          join.usingColumns = parseIdentifierList();
        }
        core.joins.push_back(std::move(join));
      }
    }
  }

  bool acceptJoinKeywords(JoinKind &kind) {
    size_t start = pos_;
    acceptWord("natural");

    if (acceptWord("join")) {
      kind = JoinKind::Inner;
      return true;
    }
    if (acceptWord("inner")) {
      expectWord("join");
      kind = JoinKind::Inner;
      return true;
    }
    if (acceptWord("cross")) {
      if (!acceptWord("apply"))
        expectWord("join");
      kind = JoinKind::Cross;
      return true;
    }
    if (peek().isWord("outer") && tokenAt(pos_ + 1).isWord("apply")) {
      advance();
      advance();
      kind = JoinKind::Left;
      return true;
    }
    if (acceptWord("semi")) {
      expectWord("join");
      kind = JoinKind::Semi;
      return true;
    }
    if (acceptWord("anti")) {
      expectWord("join");
      kind = JoinKind::Anti;
      return true;
    }
    if (peek().isWord("left") || peek().isWord("right") ||
        peek().isWord("full")) {
      std::string side = advance().value;
      if (side == "left" && acceptWord("semi")) {
        expectWord("join");
        kind = JoinKind::Semi;
        return true;
      }
      if (side == "left" && acceptWord("anti")) {
        expectWord("join");
        kind = JoinKind::Anti;
        return true;
      }
      acceptWord("outer");
      expectWord("join");
      kind = side == "left"    ? JoinKind::Left
             : side == "right" ? JoinKind::Right
                               : JoinKind::Full;
      return true;
    }

    pos_ = start;
    return false;
  }

  TableSource parseTableSource() {
    TableSource src;
    size_t begin = peek().begin;
    bool lateral = acceptWord("lateral");

    if (peek().isSymbol("(")) {
      if (!isQueryStart(pos_ + 1))
        fail("Expected subquery");
      advance();
      src.kind = SourceKind::Derived;
      src.query = parseQuery();
      expectSymbol(")");
    } else if (peek().isWord("values")) {
      src.kind = SourceKind::Derived;
      src.query = parseValues();
    } else if (peek().isIdentifier() && !lateral && !isCallAhead()) {
      src.kind = SourceKind::Table;
      src.table = parseTableName();
    } else if (peek().isIdentifier()) {
      src.kind = SourceKind::TableFunction;
      src.function = parsePostfix(parsePrimary());
    } else {
      fail("Expected table name or subquery");
    }

    if (acceptWord("tablesample"))
      skipBalanced();

    src.alias = parseOptionalAlias();
    if (!src.alias.empty() && peek().isSymbol("(") &&
        tokenAt(pos_ + 1).isIdentifier())
      src.columnAliases = parseIdentifierList();

    if (peek().isWord("pivot") || peek().isWord("unpivot")) {
      advance();
      skipBalanced();
      std::string pivotAlias = parseOptionalAlias();
      if (!pivotAlias.empty())
        src.alias = pivotAlias;
    }

    src.text = textFrom(begin);
    return src;
  }

  LateralView parseLateralView() {
    expectWord("lateral");
    expectWord("view");
    LateralView view;
    view.outer = acceptWord("outer");
    view.generator = parsePostfix(parsePrimary());
    if (isAliasCandidate(peek()))
      view.alias = identifier();
    if (acceptWord("as")) {
      view.columnAliases.push_back(identifier());
      while (peek().isSymbol(",") && tokenAt(pos_ + 1).isIdentifier() &&
             !tokenAt(pos_ + 2).isSymbol(".") &&
             !tokenAt(pos_ + 2).isSymbol("(")) {
        advance();
        view.columnAliases.push_back(identifier());
      }
    }
    return view;
  }

  // ---- expressions ----

  ExprPtr makeNode(ExprKind kind, size_t begin, std::string name = "") {
    auto node = std::make_unique<Expression>();
    node->kind = kind;
    node->name = std::move(name);
    node->text = textFrom(begin);
    return node;
  }

  ExprPtr makeBinary(const std::string &op, ExprPtr left, ExprPtr right,
                     size_t begin) {
    auto node = std::make_unique<Expression>();
    node->kind = ExprKind::Binary;
    node->name = op;
    node->children.push_back(std::move(left));
    node->children.push_back(std::move(right));
    node->text = textFrom(begin);
    return node;
  }

  ExprPtr parseExpr() {
    NestingGuard guard(*this);
    return parseOr();
  }

  ExprPtr parseOr() {
    size_t begin = peek().begin;
    ExprPtr left = parseAnd();
    while (acceptWord("or")) {
      ExprPtr right = parseAnd();
      left = makeBinary("or", std::move(left), std::move(right), begin);
    }
    return left;
  }

  ExprPtr parseAnd() {
    size_t begin = peek().begin;
    ExprPtr left = parseNot();
    while (acceptWord("and") || acceptSymbol("&&")) {
      ExprPtr right = parseNot();
      left = makeBinary("and", std::move(left), std::move(right), begin);
    }
    return left;
  }

  ExprPtr parseNot() {
    size_t begin = peek().begin;
    if (acceptWord("not")) {
      NestingGuard guard(*this);
      ExprPtr operand = parseNot();
      auto node = std::make_unique<Expression>();
      node->kind = ExprKind::Unary;
      node->name = "not";
      node->children.push_back(std::move(operand));
      node->text = textFrom(begin);
      return node;
    }
    return parsePredicate();
  }

  bool isPredicateKeyword(const Token &t) const {
    return t.isWord("between") || t.isWord("in") || t.isWord("like") ||
           t.isWord("ilike") || t.isWord("rlike") || t.isWord("regexp") ||
           t.isWord("similar");
  }

  ExprPtr parsePredicate() {
    size_t begin = peek().begin;
    ExprPtr left = parseAdditive();

    while (true) {
      const Token &t = peek();
      if (t.type == TokenType::Symbol && kComparisonOperators.count(t.value)) {
        std::string op = advance().value;
        ExprPtr right;
        if ((peek().isWord("any") || peek().isWord("all") ||
             peek().isWord("some")) &&
            tokenAt(pos_ + 1).isSymbol("(")) {
          size_t quantBegin = peek().begin;
          std::string quantifier = advance().value;
          advance();
          auto node = std::make_unique<Expression>();
          if (isQueryStart(pos_)) {
            node->kind = ExprKind::Subquery;
            node->subquery = parseQuery();
          } else {
            node->kind = ExprKind::Function;
            do {
              node->children.push_back(parseExpr());
            } while (acceptSymbol(","));
          }
          expectSymbol(")");
          node->name = quantifier;
          node->text = textFrom(quantBegin);
          right = std::move(node);
        } else {
          right = parseAdditive();
        }
        left = makeBinary(op, std::move(left), std::move(right), begin);
        continue;
      }

      if (t.isWord("is")) {
        advance();
        auto node = std::make_unique<Expression>();
        node->kind = ExprKind::Predicate;
        node->name = acceptWord("not") ? "is not" : "is";
        node->children.push_back(std::move(left));
        if (acceptWord("distinct")) {
          expectWord("from");
          node->children.push_back(parseAdditive());
        } else if (!(acceptWord("null") || acceptWord("true") ||
                     acceptWord("false") || acceptWord("unknown"))) {
          fail("Expected NULL, TRUE, FALSE or DISTINCT FROM after IS");
        }
        node->text = textFrom(begin);
        left = std::move(node);
        continue;
      }

      bool negated = false;
      if (t.isWord("not") && isPredicateKeyword(tokenAt(pos_ + 1))) {
        advance();
        negated = true;
      }
      if (!isPredicateKeyword(peek()))
        break;

      std::string keyword = advance().value;
      auto node = std::make_unique<Expression>();
      node->kind = ExprKind::Predicate;
      node->name = (negated ? "not " : "") + keyword;
      node->children.push_back(std::move(left));

      if (keyword == "between") {
        acceptWord("symmetric");
        node->children.push_back(parseAdditive());
        expectWord("and");
        node->children.push_back(parseAdditive());
      } else if (keyword == "in") {
        expectSymbol("(");
        if (isQueryStart(pos_)) {
          node->subquery = parseQuery();
        } else if (!peek().isSymbol(")")) {
          do {
            node->children.push_back(parseExpr());
          } while (acceptSymbol(","));
        }
        expectSymbol(")");
      } else {
        if (keyword == "similar")
          expectWord("to");
        if ((peek().isWord("any") || peek().isWord("all")) &&
            tokenAt(pos_ + 1).isSymbol("(")) {
          advance();
          advance();
          do {
            node->children.push_back(parseExpr());
          } while (acceptSymbol(","));
          expectSymbol(")");
        } else {
          node->children.push_back(parseAdditive());
        }
        if (acceptWord("escape"))
          node->children.push_back(parseAdditive());
      }
      node->text = textFrom(begin);
      left = std::move(node);
    }
    return left;
  }

  ExprPtr parseAdditive() {
    size_t begin = peek().begin;
    ExprPtr left = parseMultiplicative();
    while (peek().isSymbol("+") || peek().isSymbol("-") ||
           peek().isSymbol("||") || peek().isSymbol("&") ||
           peek().isSymbol("|") || peek().isSymbol("^")) {
      std::string op = advance().value;
      ExprPtr right = parseMultiplicative();
      left = makeBinary(op, std::move(left), std::move(right), begin);
    }
    return left;
  }

  ExprPtr parseMultiplicative() {
    size_t begin = peek().begin;
    ExprPtr left = parseUnary();
    while (peek().isSymbol("*") || peek().isSymbol("/") ||
           peek().isSymbol("%") || peek().isWord("div")) {
      std::string op = advance().value;
      ExprPtr right = parseUnary();
      left = makeBinary(op, std::move(left), std::move(right), begin);
    }
    return left;
  }

  ExprPtr parseUnary() {
    size_t begin = peek().begin;
    if (peek().isSymbol("-") || peek().isSymbol("+") || peek().isSymbol("~") ||
        peek().isSymbol("!")) {
      std::string op = advance().value;
      NestingGuard guard(*this);
      ExprPtr operand = parseUnary();
      bool literal = operand->kind == ExprKind::Literal;
      auto node = std::make_unique<Expression>();
      node->kind = literal ? ExprKind::Literal : ExprKind::Unary;
      node->name = op;
      node->children.push_back(std::move(operand));
      node->text = textFrom(begin);
      return node;
    }
    return parsePostfix(parsePrimary());
  }

  ExprPtr parsePostfix(ExprPtr base) {
    size_t begin = base->text.empty() ? peek().begin : lastEnd_ - base->text.size();
    while (true) {
      if (acceptSymbol("::")) {
        auto node = std::make_unique<Expression>();
        node->kind = ExprKind::Cast;
        node->name = parseTypeName();
        node->children.push_back(std::move(base));
        node->text = textFrom(begin);
        base = std::move(node);
      } else if (peek().isSymbol("[")) {
        advance();
        auto node = std::make_unique<Expression>();
        node->kind = ExprKind::Other;
        node->name = "subscript";
        node->children.push_back(std::move(base));
        node->children.push_back(parseExpr());
        if (acceptSymbol(":"))
          node->children.push_back(parseExpr());
        expectSymbol("]");
        node->text = textFrom(begin);
        base = std::move(node);
      } else if (peek().isSymbol(".") && tokenAt(pos_ + 1).isIdentifier()) {
        advance();
        auto node = std::make_unique<Expression>();
        node->kind = ExprKind::Other;
        node->name = "field " + identifier();
        node->children.push_back(std::move(base));
        node->text = textFrom(begin);
        base = std::move(node);
      } else if (peek().isWord("at") && tokenAt(pos_ + 1).isWord("time") &&
                 tokenAt(pos_ + 2).isWord("zone")) {
        advance();
        advance();
        advance();
        auto node = std::make_unique<Expression>();
        node->kind = ExprKind::Function;
        node->name = "at time zone";
        node->children.push_back(std::move(base));
        node->children.push_back(parseAdditive());
        node->text = textFrom(begin);
        base = std::move(node);
      } else if (acceptWord("collate")) {
        if (peek().type == TokenType::String)
          advance();
        else
          identifier();
        base->text = textFrom(begin);
      } else {
        break;
      }
    }
    return base;
  }

  ExprPtr parsePrimary() {
    const Token &t = peek();
    size_t begin = t.begin;

    switch (t.type) {
    case TokenType::Number: {
      std::string value = advance().value;
      return makeNode(ExprKind::Literal, begin, value);
    }
    case TokenType::String: {
      std::string value = advance().value;
      // Adjacent string literals concatenate.
      while (peek().type == TokenType::String)
        value += advance().value;
      return makeNode(ExprKind::Literal, begin, value);
    }
    case TokenType::Parameter: {
      std::string value = advance().value;
      return makeNode(ExprKind::Parameter, begin, value);
    }
    case TokenType::Symbol:
      return parseSymbolPrimary();
    case TokenType::QuotedIdentifier:
      return parsePathOrCall();
    case TokenType::Word:
      return parseWordPrimary();
    case TokenType::End:
      break;
    }
    fail("Expected expression");
  }

  ExprPtr parseSymbolPrimary() {
    size_t begin = peek().begin;
    if (peek().isSymbol("(")) {
      if (isQueryStart(pos_ + 1)) {
        advance();
        auto node = std::make_unique<Expression>();
        node->kind = ExprKind::Subquery;
        node->subquery = parseQuery();
        expectSymbol(")");
        node->text = textFrom(begin);
        return node;
      }
      advance();
      ExprPtr first = parseExpr();
      if (acceptSymbol(",")) {
        auto tuple = std::make_unique<Expression>();
        tuple->kind = ExprKind::Tuple;
        tuple->children.push_back(std::move(first));
        do {
          tuple->children.push_back(parseExpr());
        } while (acceptSymbol(","));
        expectSymbol(")");
        tuple->text = textFrom(begin);
        return tuple;
      }
      expectSymbol(")");
      first->text = textFrom(begin);
      return first;
    }
    if (acceptSymbol("*")) {
      return makeNode(ExprKind::Star, begin);
    }
    if (acceptSymbol("[")) {
      auto node = std::make_unique<Expression>();
      node->kind = ExprKind::Array;
      if (!peek().isSymbol("]")) {
        do {
          node->children.push_back(parseExpr());
        } while (acceptSymbol(","));
      }
      expectSymbol("]");
      node->text = textFrom(begin);
      return node;
    }
    fail("Expected expression");
  }

  ExprPtr parseWordPrimary() {
    const Token &t = peek();
    size_t begin = t.begin;
    const std::string word = t.value;
    const Token &next = tokenAt(pos_ + 1);

    if (kExpressionReserved.count(word))
      fail("Unexpected keyword");

    if (word == "case")
      return parseCase();
    if ((word == "cast" || word == "try_cast" || word == "safe_cast") &&
        next.isSymbol("("))
      return parseCast();
    if (word == "extract" && next.isSymbol("("))
      return parseExtract();
    if (word == "exists" && next.isSymbol("(")) {
      advance();
      advance();
      auto node = std::make_unique<Expression>();
      node->kind = ExprKind::Exists;
      node->subquery = parseQuery();
      expectSymbol(")");
      node->text = textFrom(begin);
      return node;
    }
    if (word == "interval" && !next.isSymbol(".") && !next.isSymbol(",") &&
        !next.isSymbol(")"))
      return parseInterval();
    if (word == "null" || word == "true" || word == "false") {
      advance();
      return makeNode(ExprKind::Literal, begin, word);
    }
    // Single-letter prefixes (x'ff', n'abc') must touch the string.
    if (kTypedLiteralPrefixes.count(word) && next.type == TokenType::String &&
        (word.size() > 1 || next.begin == t.end)) {
      advance();
      std::string value = advance().value;
      return makeNode(ExprKind::Literal, begin, value);
    }
    if (word == "array" && next.isSymbol("[")) {
      advance();
      ExprPtr array = parseSymbolPrimary();
      array->text = textFrom(begin);
      return array;
    }
    if (kNiladicFunctions.count(word) && !next.isSymbol("(") &&
        !next.isSymbol(".")) {
      advance();
      return makeNode(ExprKind::Function, begin, word);
    }
    return parsePathOrCall();
  }

  ExprPtr parsePathOrCall() {
    size_t begin = peek().begin;
    std::vector<std::string> parts;
    parts.push_back(identifier());

    while (peek().isSymbol(".")) {
      const Token &after = tokenAt(pos_ + 1);
      if (after.isSymbol("*")) {
        advance();
        advance();
        auto star = std::make_unique<Expression>();
        star->kind = ExprKind::Star;
        star->path = std::move(parts);
        star->text = textFrom(begin);
        return star;
      }
      if (!after.isIdentifier())
        break;
      advance();
      parts.push_back(identifier());
    }

    if (peek().isSymbol("(")) {
      return parseFunctionCall(StringUtils::join(parts, "."), begin);
    }

    auto column = std::make_unique<Expression>();
    column->kind = ExprKind::Column;
    column->path = std::move(parts);
    column->text = textFrom(begin);
    return column;
  }

  bool isParenLambdaAhead() const {
    size_t idx = pos_;
    if (!tokenAt(idx).isSymbol("("))
      return false;
    ++idx;
    while (true) {
      if (!tokenAt(idx).isIdentifier())
        return false;
      ++idx;
      if (tokenAt(idx).isSymbol(",")) {
        ++idx;
        continue;
      }
      break;
    }
    return tokenAt(idx).isSymbol(")") && tokenAt(idx + 1).isSymbol("->");
  }

  ExprPtr parseFunctionArgument() {
    size_t begin = peek().begin;
    if (peek().isIdentifier() && tokenAt(pos_ + 1).isSymbol("->")) {
      auto lambda = std::make_unique<Expression>();
      lambda->kind = ExprKind::Lambda;
      lambda->lambdaParams.push_back(identifier());
      advance();
      lambda->children.push_back(parseExpr());
      lambda->text = textFrom(begin);
      return lambda;
    }
    if (isParenLambdaAhead()) {
      auto lambda = std::make_unique<Expression>();
      lambda->kind = ExprKind::Lambda;
      advance();
      do {
        lambda->lambdaParams.push_back(identifier());
      } while (acceptSymbol(","));
      expectSymbol(")");
      expectSymbol("->");
      lambda->children.push_back(parseExpr());
      lambda->text = textFrom(begin);
      return lambda;
    }
    if (peek().isIdentifier() && tokenAt(pos_ + 1).isSymbol("=>")) {
      advance();
      advance();
    }
    return parseExpr();
  }

  ExprPtr parseFunctionCall(const std::string &name, size_t begin) {
    auto fn = std::make_unique<Expression>();
    fn->kind = ExprKind::Function;
    fn->name = StringUtils::toLower(name);
    expectSymbol("(");

    if (!peek().isSymbol(")")) {
      if (!acceptWord("distinct"))
        acceptWord("all");
      // TRIM(LEADING 'x' FROM y) and friends.
      if ((peek().isWord("leading") || peek().isWord("trailing") ||
           peek().isWord("both")) &&
          !tokenAt(pos_ + 1).isSymbol(",") &&
          !tokenAt(pos_ + 1).isSymbol(")"))
        advance();

      if (peek().isSymbol("*") && tokenAt(pos_ + 1).isSymbol(")")) {
        size_t starBegin = peek().begin;
        advance();
        // COUNT(*) counts rows; it reads no particular column.
        fn->children.push_back(makeNode(ExprKind::Literal, starBegin, "*"));
      } else if (!peek().isWord("from")) {
        do {
          fn->children.push_back(parseFunctionArgument());
          // SUBSTRING(x FROM 1 FOR 2), POSITION('a' IN s), TRIM(x FROM y)
          while (peek().isWord("from") || peek().isWord("for") ||
                 (peek().isWord("in") && fn->name == "position")) {
            advance();
            fn->children.push_back(parseExpr());
          }
          if (peek().isWord("ignore") || peek().isWord("respect")) {
            advance();
            expectWord("nulls");
          }
        } while (acceptSymbol(","));
      } else {
        advance();
        fn->children.push_back(parseExpr());
      }

      if (peek().isWord("order") && tokenAt(pos_ + 1).isWord("by")) {
        advance();
        advance();
        parseOrderItems(fn->children);
      }
      if (acceptWord("separator"))
        fn->children.push_back(parsePrimary());
      if (peek().isWord("limit")) {
        advance();
        parseExpr();
      }
    }
    expectSymbol(")");

    if (peek().isWord("within") && tokenAt(pos_ + 1).isWord("group")) {
      advance();
      advance();
      expectSymbol("(");
      expectWord("order");
      expectWord("by");
      parseOrderItems(fn->children);
      expectSymbol(")");
    }
    if (peek().isWord("ignore") || peek().isWord("respect")) {
      advance();
      expectWord("nulls");
    }
    if (peek().isWord("filter") && tokenAt(pos_ + 1).isSymbol("(")) {
      advance();
      advance();
      expectWord("where");
      fn->children.push_back(parseExpr());
      expectSymbol(")");
    }
    if (acceptWord("over")) {
      if (peek().isSymbol("(")) {
        std::vector<ExprPtr> windowExprs = parseWindowSpec();
        for (auto &expr : windowExprs)
          fn->children.push_back(std::move(expr));
      } else {
        identifier();
      }
    }

    fn->text = textFrom(begin);
    return fn;
  }

  // Returns the PARTITION BY and ORDER BY expressions of a window spec; the
  // frame clause carries no column references and is skipped.
  std::vector<ExprPtr> parseWindowSpec() {
    std::vector<ExprPtr> exprs;
    expectSymbol("(");
    if (isAliasCandidate(peek()) && !peek().isWord("rows") &&
        !peek().isWord("range") && !peek().isWord("groups"))
      identifier();
    if (acceptWord("partition")) {
      expectWord("by");
      do {
        exprs.push_back(parseExpr());
      } while (acceptSymbol(","));
    }
    if ((peek().isWord("order") || peek().isWord("sort")) &&
        tokenAt(pos_ + 1).isWord("by")) {
      advance();
      advance();
      parseOrderItems(exprs);
    }
    if (peek().isWord("rows") || peek().isWord("range") ||
        peek().isWord("groups")) {
      int depth = 0;
      while (!atEnd() && !(depth == 0 && peek().isSymbol(")"))) {
        if (peek().isSymbol("("))
          ++depth;
        else if (peek().isSymbol(")"))
          --depth;
        advance();
      }
    }
    expectSymbol(")");
    return exprs;
  }

  ExprPtr parseCase() {
    size_t begin = peek().begin;
    expectWord("case");
    auto node = std::make_unique<Expression>();
    node->kind = ExprKind::Case;
    if (!peek().isWord("when"))
      node->children.push_back(parseExpr());
    while (acceptWord("when")) {
      node->children.push_back(parseExpr());
      expectWord("then");
      node->children.push_back(parseExpr());
    }
    if (acceptWord("else"))
      node->children.push_back(parseExpr());
    expectWord("end");
    node->text = textFrom(begin);
    return node;
  }

  ExprPtr parseCast() {
    size_t begin = peek().begin;
    advance();
    expectSymbol("(");
    auto node = std::make_unique<Expression>();
    node->kind = ExprKind::Cast;
    node->children.push_back(parseExpr());
    if (acceptWord("as") || acceptSymbol(","))
      node->name = parseTypeName();
    if (acceptWord("format"))
      parsePrimary();
    expectSymbol(")");
    node->text = textFrom(begin);
    return node;
  }

  ExprPtr parseExtract() {
    size_t begin = peek().begin;
    advance();
    expectSymbol("(");
    auto node = std::make_unique<Expression>();
    node->kind = ExprKind::Function;
    if (peek().type == TokenType::String)
      node->name = "extract " + StringUtils::toLower(advance().value);
    else
      node->name = "extract " + identifier();
    if (!acceptWord("from"))
      expectSymbol(",");
    node->children.push_back(parseExpr());
    expectSymbol(")");
    node->text = textFrom(begin);
    return node;
  }

  ExprPtr parseInterval() {
    size_t begin = peek().begin;
    expectWord("interval");
    auto node = std::make_unique<Expression>();
    node->kind = ExprKind::Interval;
    node->children.push_back(parseUnary());
    if (peek().type == TokenType::Word && kIntervalUnits.count(peek().value)) {
      advance();
      if (acceptWord("to")) {
        if (!(peek().type == TokenType::Word &&
              kIntervalUnits.count(peek().value)))
          fail("Expected interval unit");
        advance();
      }
    }
    node->text = textFrom(begin);
    return node;
  }

  // ---- statements ----

  InsertStatement parseInsert() {
    InsertStatement insert;
    expectWord("insert");
    if (acceptWord("or")) {
      if (!acceptWord("replace"))
        expectWord("ignore");
    }
    acceptWord("ignore");
    if (acceptWord("overwrite"))
      insert.overwrite = true;
    else
      expectWord("into");
    acceptWord("into");
    acceptWord("table");
    insert.target = parseTableName();

    if (peek().isWord("as") && tokenAt(pos_ + 1).isIdentifier()) {
      advance();
      identifier();
    }
    if (acceptWord("partition"))
      skipBalanced();
    if (peek().isWord("if")) {
      advance();
      expectWord("not");
      expectWord("exists");
    }
    if (peek().isSymbol("(") && !isQueryStart(pos_ + 1))
      insert.columns = parseIdentifierList();
    if (peek().isWord("by") && tokenAt(pos_ + 1).isWord("name")) {
      advance();
      advance();
    }

    if (peek().isWord("values")) {
      insert.hasValues = true;
      parseValues();
    } else if (peek().isWord("default") && tokenAt(pos_ + 1).isWord("values")) {
      advance();
      advance();
      insert.hasValues = true;
    } else {
      insert.query = parseQuery();
    }

    // ON CONFLICT / ON DUPLICATE KEY / RETURNING tails carry no lineage.
    if (peek().isWord("on") || peek().isWord("returning"))
      skipToEnd();
    return insert;
  }

  StatementBody parseCreate() {
    expectWord("create");
    CreateStatement create;
    if (acceptWord("or")) {
      expectWord("replace");
      create.orReplace = true;
    }

    static const std::unordered_set<std::string> modifiers = {
        "temporary", "temp",     "global",   "local",  "external",
        "transient", "volatile", "unlogged", "secure", "recursive"};
    bool materialized = false;
    while (peek().type == TokenType::Word &&
           (modifiers.count(peek().value) || peek().isWord("materialized"))) {
      if (peek().isWord("temporary") || peek().isWord("temp"))
        create.temporary = true;
      if (peek().isWord("materialized"))
        materialized = true;
      advance();
    }

    if (acceptWord("table")) {
      create.kind = CreateKind::Table;
      create.objectType = "TABLE";
    } else if (acceptWord("view")) {
      create.kind = CreateKind::View;
      create.objectType = materialized ? "MATERIALIZED VIEW" : "VIEW";
    } else {
      AdministrativeStatement admin;
      std::vector<std::string> words = {"create"};
      if (peek().type == TokenType::Word)
        words.push_back(advance().value);
      admin.verb = upperWords(words);
      skipToEnd();
      return admin;
    }

    if (peek().isWord("if")) {
      advance();
      expectWord("not");
      expectWord("exists");
    }
    create.target = parseTableName();

    if (peek().isSymbol("(") && !isQueryStart(pos_ + 1)) {
      if (create.kind == CreateKind::Table) {
        create.columns = parseColumnDefinitions();
      } else {
        for (auto &name : parseIdentifierList()) {
          ColumnDefinition column;
          column.name = name;
          create.columns.push_back(std::move(column));
        }
      }
    }

    while (!atEnd()) {
      if (peek().isWord("as") && isQueryStart(pos_ + 1)) {
        advance();
        create.query = parseQuery();
        break;
      }
      if (isQueryStart(pos_) && !peek().isSymbol("(")) {
        create.query = parseQuery();
        break;
      }
      if (peek().isSymbol("(")) {
        skipBalanced();
        continue;
      }
      if (acceptWord("like")) {
        parseTableName();
        continue;
      }
      advance();
    }
    return create;
  }

  std::vector<ColumnDefinition> parseColumnDefinitions() {
    static const std::unordered_set<std::string> constraintStarts = {
        "constraint", "primary", "foreign", "unique", "check",
        "key",        "index",   "period",  "like",   "exclude"};
    std::vector<ColumnDefinition> columns;
    expectSymbol("(");
    while (!peek().isSymbol(")")) {
      if (atEnd())
        fail("Unterminated column list");
      if (peek().type == TokenType::Word &&
          constraintStarts.count(peek().value)) {
        skipListElement();
      } else {
        ColumnDefinition column;
        column.name = identifier();
        if (!peek().isSymbol(",") && !peek().isSymbol(")"))
          column.type = parseTypeName();
        skipListElement();
        columns.push_back(std::move(column));
      }
      if (!acceptSymbol(","))
        break;
    }
    expectSymbol(")");
    return columns;
  }

  CreateStatement parseCache() {
    expectWord("cache");
    acceptWord("lazy");
    expectWord("table");
    CreateStatement create;
    create.kind = CreateKind::Cache;
    create.objectType = "TABLE";
    create.target = parseTableName();
    if (acceptWord("options"))
      skipBalanced();
    if (acceptWord("as") || isQueryStart(pos_))
      create.query = parseQuery();
    return create;
  }

  MergeStatement parseMerge() {
    MergeStatement merge;
    expectWord("merge");
    acceptWord("into");
    merge.target = parseTableName();
    merge.targetAlias = parseOptionalAlias();
    expectWord("using");
    merge.source = parseTableSource();
    expectWord("on");
    merge.condition = parseExpr();
    // WHEN [NOT] MATCHED ... actions write into the target; the lineage of a
    // MERGE comes from the USING source.
    skipToEnd();
    return merge;
  }

  UpdateStatement parseUpdate() {
    UpdateStatement update;
    expectWord("update");
    update.target = parseTableName();
    update.targetAlias = parseOptionalAlias();
    expectWord("set");
    do {
      Assignment assignment;
      TableName column = parseTableName();
      assignment.column = column.name();
      expectSymbol("=");
      assignment.value = parseExpr();
      update.assignments.push_back(std::move(assignment));
    } while (acceptSymbol(","));

    if (acceptWord("from")) {
      update.from.push_back(parseTableSource());
      while (true) {
        JoinKind kind;
        if (acceptSymbol(",")) {
          update.from.push_back(parseTableSource());
        } else if (acceptJoinKeywords(kind)) {
          update.from.push_back(parseTableSource());
          if (acceptWord("on"))
            parseExpr();
          else if (peek().isWord("using")) {
            advance();
            parseIdentifierList();
          }
        } else {
          break;
        }
      }
    }
    if (acceptWord("where"))
      update.where = parseExpr();
    if (peek().isWord("returning"))
      skipToEnd();
    return update;
  }

  DeleteStatement parseDelete() {
    DeleteStatement del;
    expectWord("delete");
    acceptWord("from");
    del.target = parseTableName();
    parseOptionalAlias();
    if (acceptWord("using")) {
      parseTableSource();
      while (acceptSymbol(","))
        parseTableSource();
    }
    if (acceptWord("where"))
      del.where = parseExpr();
    if (peek().isWord("returning"))
      skipToEnd();
    return del;
  }

  AdministrativeStatement parseAdministrative() {
    static const std::unordered_set<std::string> twoWordVerbs = {
        "drop",    "alter",   "truncate", "show",  "describe", "refresh",
        "analyze", "uncache", "optimize", "msck",  "vacuum",   "comment"};
    AdministrativeStatement admin;
    std::vector<std::string> words;
    const Token &first = peek();
    if (first.type == TokenType::Word) {
      words.push_back(advance().value);
      if (twoWordVerbs.count(words.front()) && peek().type == TokenType::Word &&
          !peek().isWord("if"))
        words.push_back(advance().value);
    } else {
      words.push_back(src_.substr(first.begin, first.end - first.begin));
      advance();
    }
    admin.verb = upperWords(words);
    skipToEnd();
    return admin;
  }
};

} // namespace

SqlParser::SqlParser(const std::string &dialect)
    : dialect_(StringUtils::toLower(dialect)), tokenizer_(dialect) {}

std::vector<std::vector<Token>>
SqlParser::splitTokens(const std::string &sql) const {
  std::vector<Token> tokens = tokenizer_.tokenize(sql);
  std::vector<std::vector<Token>> statements;
  std::vector<Token> current;

  auto flush = [&](size_t endOffset) {
    if (current.empty())
      return;
    Token end;
    end.type = TokenType::End;
    end.begin = endOffset;
    end.end = endOffset;
    current.push_back(end);
    statements.push_back(std::move(current));
    current.clear();
  };

  for (const Token &token : tokens) {
    if (token.type == TokenType::End) {
      flush(token.begin);
      break;
    }
    if (token.isSymbol(";")) {
      flush(token.begin);
      continue;
    }
    current.push_back(token);
  }
  return statements;
}

std::vector<Statement>
SqlParser::parseScript(const std::string &sql,
                       std::vector<StatementParseError> *errors) const {
  std::vector<Statement> statements;
  size_t index = 0;
  for (auto &tokens : splitTokens(sql)) {
    size_t begin = tokens.front().begin;
    size_t end = tokens[tokens.size() - 2].end;
    try {
      Parser parser(sql, std::move(tokens));
      Statement statement = parser.parseStatement();
      statement.index = index;
      statements.push_back(std::move(statement));
    } catch (const SqlParseError &e) {
      if (!errors)
        throw;
      StatementParseError error;
      error.index = index;
      error.text = sql.substr(begin, end - begin);
      error.message = e.what();
      errors->push_back(std::move(error));
    }
    ++index;
  }
  return statements;
}

std::vector<std::string>
SqlParser::splitStatements(const std::string &sql) const {
  std::vector<std::string> texts;
  for (const auto &tokens : splitTokens(sql)) {
    size_t begin = tokens.front().begin;
    size_t end = tokens[tokens.size() - 2].end;
    texts.push_back(sql.substr(begin, end - begin));
  }
  return texts;
}

Statement SqlParser::parseStatement(const std::string &sql) const {
  std::vector<std::vector<Token>> statements = splitTokens(sql);
  if (statements.empty())
    throw SqlParseError("Empty statement", 0);
  if (statements.size() > 1)
    throw SqlParseError("Expected a single statement",
                        statements[1].front().begin);
  Parser parser(sql, std::move(statements.front()));
  return parser.parseStatement();
}

QueryPtr SqlParser::parseQuery(const std::string &sql) const {
  std::vector<std::vector<Token>> statements = splitTokens(sql);
  if (statements.size() != 1)
    throw SqlParseError("Expected a single query", 0);
  Parser parser(sql, std::move(statements.front()));
  return parser.parseStandaloneQuery();
}

} // namespace sql
