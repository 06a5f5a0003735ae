#include "expression.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <limits>

namespace expression {

std::string_view
typeName(TYPE type) {
  switch(type) {
    case TYPE::BOOL:      return "bool";
    case TYPE::INT:       return "int";
    case TYPE::DECIMAL:   return "decimal";
    case TYPE::STRING:    return "string";
    case TYPE::ITEM:      return "item";
    case TYPE::ITEM_LIST: return "list(item)";
  }
  return "unknown";
}

namespace {

enum TOKEN: const unsigned char {
  END,
  IDENT,
  NUMBER,
  STRING_LITERAL,
  LPAREN,
  RPAREN,
  LBRACKET,
  RBRACKET,
  DOT,
  COMMA,
  BANG,
  MINUS,
  PLUS,
  LESS,
  LESS_EQ,
  GREATER,
  GREATER_EQ,
  EQUAL,
  NOT_EQUAL,
  AND_AND,
  OR_OR
};

struct Token {
  TOKEN
    kind = TOKEN::END;
  std::string
    text;
  std::size_t
    offset = 0;
};

std::string
lowercase(std::string_view text) {
  std::string out{text};
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

Error
syntaxError(std::size_t offset, std::string_view what) {
  return makeError(UNEXPECTED_CODE::VALIDATION, std::format("{} at position {}", what, offset));
}

std::expected<std::vector<Token>, Error>
tokenize(std::string_view text) {
  std::vector<Token> tokens;
  std::size_t pos = 0;

  auto single = [&](TOKEN kind) {
    tokens.push_back(Token{kind, std::string{text.substr(pos, 1)}, pos});
    ++pos;
  };

  auto pair = [&](TOKEN kind) {
    tokens.push_back(Token{kind, std::string{text.substr(pos, 2)}, pos});
    pos += 2;
  };

  while(pos < text.size()) {
    const char c = text[pos];
    const char next = pos + 1 < text.size() ? text[pos + 1] : '\0';

    if(std::isspace(static_cast<unsigned char>(c))) {
      ++pos;
      continue;
    }

    if(std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
      const auto start = pos;
      while(pos < text.size() &&
            (std::isalnum(static_cast<unsigned char>(text[pos])) || text[pos] == '_')) {
        ++pos;
      }
      tokens.push_back(Token{TOKEN::IDENT, std::string{text.substr(start, pos - start)}, start});
      continue;
    }

    if(std::isdigit(static_cast<unsigned char>(c))) {
      const auto start = pos;
      while(pos < text.size() &&
            (std::isdigit(static_cast<unsigned char>(text[pos])) || text[pos] == '.')) {
        ++pos;
      }
      tokens.push_back(Token{TOKEN::NUMBER, std::string{text.substr(start, pos - start)}, start});
      continue;
    }

    if(c == '"' || c == '\'') {
      const auto start = pos;
      const char quote = c;
      std::string value;
      ++pos;

      bool closed = false;
      while(pos < text.size()) {
        const char ch = text[pos++];
        if(ch == quote) {
          closed = true;
          break;
        }
        if(ch == '\\') {
          if(pos >= text.size()) {
            break;
          }
          const char escaped = text[pos++];
          switch(escaped) {
            case 'n': value.push_back('\n'); break;
            case 't': value.push_back('\t'); break;
            case '\\':
            case '"':
            case '\'':
              value.push_back(escaped);
              break;
            default:
              return std::unexpected(syntaxError(pos - 2, "unknown escape sequence"));
          }
          continue;
        }
        value.push_back(ch);
      }

      if(!closed) {
        return std::unexpected(syntaxError(start, "unterminated string literal"));
      }

      tokens.push_back(Token{TOKEN::STRING_LITERAL, std::move(value), start});
      continue;
    }

    switch(c) {
      case '(': single(TOKEN::LPAREN); continue;
      case ')': single(TOKEN::RPAREN); continue;
      case '[': single(TOKEN::LBRACKET); continue;
      case ']': single(TOKEN::RBRACKET); continue;
      case '.': single(TOKEN::DOT); continue;
      case ',': single(TOKEN::COMMA); continue;
      case '+': single(TOKEN::PLUS); continue;
      case '-': single(TOKEN::MINUS); continue;
      case '<':
        if(next == '=') pair(TOKEN::LESS_EQ); else single(TOKEN::LESS);
        continue;
      case '>':
        if(next == '=') pair(TOKEN::GREATER_EQ); else single(TOKEN::GREATER);
        continue;
      case '!':
        if(next == '=') pair(TOKEN::NOT_EQUAL); else single(TOKEN::BANG);
        continue;
      case '=':
        if(next == '=') {
          pair(TOKEN::EQUAL);
          continue;
        }
        break;
      case '&':
        if(next == '&') {
          pair(TOKEN::AND_AND);
          continue;
        }
        break;
      case '|':
        if(next == '|') {
          pair(TOKEN::OR_OR);
          continue;
        }
        break;
      default:
        break;
    }

    return std::unexpected(syntaxError(pos, std::format("unexpected character '{}'", c)));
  }

  tokens.push_back(Token{TOKEN::END, "", text.size()});
  return tokens;
}

// Deepest nesting of () and [] outside string literals.
int
nestingDepth(std::string_view text) {
  int depth = 0;
  int deepest = 0;
  char quote = '\0';

  for(std::size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];

    if(quote != '\0') {
      if(c == '\\') {
        ++i;
      } else if(c == quote) {
        quote = '\0';
      }
      continue;
    }

    if(c == '"' || c == '\'') {
      quote = c;
    } else if(c == '(' || c == '[') {
      deepest = std::max(deepest, ++depth);
    } else if(c == ')' || c == ']') {
      --depth;
    }
  }

  return deepest;
}

std::optional<FIELD>
itemField(std::string_view name) {
  if(name == "amount")            return FIELD::AMOUNT;
  if(name == "description")       return FIELD::DESCRIPTION;
  if(name == "counterparty")      return FIELD::COUNTERPARTY;
  if(name == "responsible_party") return FIELD::COUNTERPARTY;
  if(name == "payment_method")    return FIELD::PAYMENT_METHOD;
  if(name == "date")              return FIELD::DATE;
  return std::nullopt;
}

std::optional<FIELD>
contextField(std::string_view name) {
  if(name == "count") return FIELD::COUNT;
  if(name == "items") return FIELD::ITEMS;
  if(name == "date")  return std::nullopt;
  return itemField(name);
}

TYPE
fieldType(FIELD field) {
  switch(field) {
    case FIELD::AMOUNT:         return TYPE::DECIMAL;
    case FIELD::DATE:           return TYPE::INT;
    case FIELD::COUNT:          return TYPE::INT;
    case FIELD::ITEMS:          return TYPE::ITEM_LIST;
    case FIELD::DESCRIPTION:
    case FIELD::COUNTERPARTY:
    case FIELD::PAYMENT_METHOD: return TYPE::STRING;
  }
  return TYPE::STRING;
}

bool
isNumeric(TYPE type) {
  return type == TYPE::INT || type == TYPE::DECIMAL;
}

NodePtr
makeNode(auto kind, TYPE type) {
  return std::make_unique<Node>(Node{std::move(kind), type});
}

// Recursive descent parser that type-checks while it builds the tree.
class Parser {
public:
  explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

  std::expected<NodePtr, Error>
  parse() {
    auto root = parseOr();
    if(!root) {
      return root;
    }

    if(peek().kind != TOKEN::END) {
      return std::unexpected(syntaxError(peek().offset, std::format("unexpected '{}'", peek().text)));
    }

    if((*root)->type != TYPE::BOOL) {
      return std::unexpected(makeError(UNEXPECTED_CODE::VALIDATION,
          std::format("expression must evaluate to bool, not {}", typeName((*root)->type))));
    }

    return root;
  }

  std::size_t slots() const { return nextSlot_; }

private:
  struct Scope {
    // Empty name: an all_match/any_match scope where bare field names refer to the item.
    std::string
      name;
    std::size_t
      slot;
  };

  std::vector<Token>
    tokens_;
  std::size_t
    pos_ = 0;
  std::vector<Scope>
    scopes_;
  std::size_t
    nextSlot_ = 0;

  const Token &peek() const { return tokens_[pos_]; }

  const Token &advance() { return tokens_[pos_ < tokens_.size() - 1 ? pos_++ : pos_]; }

  bool
  accept(TOKEN kind) {
    if(peek().kind == kind) {
      advance();
      return true;
    }
    return false;
  }

  std::optional<Error>
  expect(TOKEN kind, std::string_view what) {
    if(!accept(kind)) {
      return syntaxError(peek().offset, std::format("expected {}", what));
    }
    return std::nullopt;
  }

  std::expected<NodePtr, Error>
  parseOr() {
    auto lhs = parseAnd();
    if(!lhs) {
      return lhs;
    }

    while(peek().kind == TOKEN::OR_OR) {
      const auto offset = advance().offset;
      auto rhs = parseAnd();
      if(!rhs) {
        return rhs;
      }
      if((*lhs)->type != TYPE::BOOL || (*rhs)->type != TYPE::BOOL) {
        return std::unexpected(syntaxError(offset, "'||' needs bool operands"));
      }
      lhs = makeNode(Binary{BINARY_OP::OR, std::move(*lhs), std::move(*rhs)}, TYPE::BOOL);
    }

    return lhs;
  }

  std::expected<NodePtr, Error>
  parseAnd() {
    auto lhs = parseRelation();
    if(!lhs) {
      return lhs;
    }

    while(peek().kind == TOKEN::AND_AND) {
      const auto offset = advance().offset;
      auto rhs = parseRelation();
      if(!rhs) {
        return rhs;
      }
      if((*lhs)->type != TYPE::BOOL || (*rhs)->type != TYPE::BOOL) {
        return std::unexpected(syntaxError(offset, "'&&' needs bool operands"));
      }
      lhs = makeNode(Binary{BINARY_OP::AND, std::move(*lhs), std::move(*rhs)}, TYPE::BOOL);
    }

    return lhs;
  }

  std::expected<NodePtr, Error>
  parseRelation() {
    auto lhs = parseAdditive();
    if(!lhs) {
      return lhs;
    }

    std::optional<BINARY_OP> op;
    switch(peek().kind) {
      case TOKEN::EQUAL:      op = BINARY_OP::EQ; break;
      case TOKEN::NOT_EQUAL:  op = BINARY_OP::NE; break;
      case TOKEN::LESS:       op = BINARY_OP::LT; break;
      case TOKEN::LESS_EQ:    op = BINARY_OP::LE; break;
      case TOKEN::GREATER:    op = BINARY_OP::GT; break;
      case TOKEN::GREATER_EQ: op = BINARY_OP::GE; break;
      default:
        return lhs;
    }

    const auto &token = advance();
    const auto offset = token.offset;
    const auto symbol = token.text;

    auto rhs = parseAdditive();
    if(!rhs) {
      return rhs;
    }

    const TYPE l = (*lhs)->type;
    const TYPE r = (*rhs)->type;
    const bool equality = *op == BINARY_OP::EQ || *op == BINARY_OP::NE;

    const bool comparable =
        (isNumeric(l) && isNumeric(r)) ||
        (l == TYPE::STRING && r == TYPE::STRING) ||
        (equality && l == TYPE::BOOL && r == TYPE::BOOL);

    if(!comparable) {
      return std::unexpected(syntaxError(offset,
          std::format("cannot apply '{}' to {} and {}", symbol, typeName(l), typeName(r))));
    }

    return makeNode(Binary{*op, std::move(*lhs), std::move(*rhs)}, TYPE::BOOL);
  }

  std::expected<NodePtr, Error>
  parseAdditive() {
    auto lhs = parseUnary();
    if(!lhs) {
      return lhs;
    }

    while(peek().kind == TOKEN::PLUS || peek().kind == TOKEN::MINUS) {
      const auto &token = advance();
      const auto op = token.kind == TOKEN::PLUS ? BINARY_OP::ADD : BINARY_OP::SUB;
      const auto offset = token.offset;

      auto rhs = parseUnary();
      if(!rhs) {
        return rhs;
      }

      const TYPE l = (*lhs)->type;
      const TYPE r = (*rhs)->type;
      TYPE result;

      if(isNumeric(l) && isNumeric(r)) {
        result = (l == TYPE::INT && r == TYPE::INT) ? TYPE::INT : TYPE::DECIMAL;
      } else if(op == BINARY_OP::ADD && l == TYPE::STRING && r == TYPE::STRING) {
        result = TYPE::STRING;
      } else {
        return std::unexpected(syntaxError(offset,
            std::format("cannot apply '{}' to {} and {}",
                        op == BINARY_OP::ADD ? "+" : "-", typeName(l), typeName(r))));
      }

      lhs = makeNode(Binary{op, std::move(*lhs), std::move(*rhs)}, result);
    }

    return lhs;
  }

  std::expected<NodePtr, Error>
  parseUnary() {
    if(peek().kind == TOKEN::BANG) {
      const auto offset = advance().offset;
      auto operand = parseUnary();
      if(!operand) {
        return operand;
      }
      if((*operand)->type != TYPE::BOOL) {
        return std::unexpected(syntaxError(offset, "'!' needs a bool operand"));
      }
      return makeNode(Unary{UNARY_OP::NOT, std::move(*operand)}, TYPE::BOOL);
    }

    if(peek().kind == TOKEN::MINUS) {
      const auto offset = advance().offset;
      auto operand = parseUnary();
      if(!operand) {
        return operand;
      }
      const TYPE type = (*operand)->type;
      if(!isNumeric(type)) {
        return std::unexpected(syntaxError(offset, "'-' needs a numeric operand"));
      }
      return makeNode(Unary{UNARY_OP::NEGATE, std::move(*operand)}, type);
    }

    return parsePostfix();
  }

  std::expected<NodePtr, Error>
  parsePostfix() {
    auto node = parsePrimary();
    if(!node) {
      return node;
    }

    while(true) {
      if(peek().kind == TOKEN::DOT) {
        advance();
        const auto &name = peek();
        if(name.kind != TOKEN::IDENT) {
          return std::unexpected(syntaxError(name.offset, "expected a member name after '.'"));
        }
        const std::string member = advance().text;

        if(peek().kind == TOKEN::LPAREN) {
          node = parseMethod(std::move(*node), member, name.offset);
        } else {
          node = parseField(std::move(*node), member, name.offset);
        }

        if(!node) {
          return node;
        }
        continue;
      }

      if(peek().kind == TOKEN::LBRACKET) {
        const auto offset = advance().offset;
        if((*node)->type != TYPE::ITEM_LIST) {
          return std::unexpected(syntaxError(offset,
              std::format("cannot index into {}", typeName((*node)->type))));
        }

        auto index = parseOr();
        if(!index) {
          return index;
        }
        if((*index)->type != TYPE::INT) {
          return std::unexpected(syntaxError(offset, "list index must be an int"));
        }
        if(auto error = expect(TOKEN::RBRACKET, "']'")) {
          return std::unexpected(*error);
        }

        node = makeNode(Index{std::move(*node), std::move(*index)}, TYPE::ITEM);
        continue;
      }

      return node;
    }
  }

  std::expected<NodePtr, Error>
  parseField(NodePtr receiver, const std::string &name, std::size_t offset) {
    if(receiver->type != TYPE::ITEM) {
      return std::unexpected(syntaxError(offset,
          std::format("{} has no field '{}'", typeName(receiver->type), name)));
    }

    auto field = itemField(name);
    if(!field) {
      return std::unexpected(syntaxError(offset, std::format("item has no field '{}'", name)));
    }

    return makeNode(Member{std::move(receiver), *field}, fieldType(*field));
  }

  std::expected<NodePtr, Error>
  parseMethod(NodePtr receiver, const std::string &name, std::size_t offset) {
    const TYPE type = receiver->type;

    if(type == TYPE::ITEM_LIST && (name == "all" || name == "exists")) {
      advance();
      const auto &variable = peek();
      if(variable.kind != TOKEN::IDENT) {
        return std::unexpected(syntaxError(variable.offset,
            std::format("{}() needs a variable name as its first argument", name)));
      }
      const std::string variableName = advance().text;

      if(auto error = expect(TOKEN::COMMA, "','")) {
        return std::unexpected(*error);
      }

      return parseQuantified(name == "all" ? QUANTIFIER::ALL : QUANTIFIER::ANY,
                             std::move(receiver), variableName, offset);
    }

    auto args = parseArguments();
    if(!args) {
      return std::unexpected(args.error());
    }

    std::optional<FUNCTION> function;
    TYPE result = TYPE::BOOL;
    std::vector<TYPE> expected;

    if(type == TYPE::STRING) {
      if(name == "contains")        function = FUNCTION::CONTAINS;
      else if(name == "startsWith") function = FUNCTION::STARTS_WITH;
      else if(name == "endsWith")   function = FUNCTION::ENDS_WITH;
      else if(name == "size") {
        function = FUNCTION::SIZE;
        result = TYPE::INT;
      }

      if(function && *function != FUNCTION::SIZE) {
        expected.push_back(TYPE::STRING);
      }
    } else if(type == TYPE::ITEM_LIST && name == "size") {
      function = FUNCTION::SIZE;
      result = TYPE::INT;
    }

    if(!function) {
      return std::unexpected(syntaxError(offset,
          std::format("{} has no method '{}'", typeName(type), name)));
    }

    if(args->size() != expected.size()) {
      return std::unexpected(syntaxError(offset,
          std::format("{}() takes {} argument(s)", name, expected.size())));
    }

    for(std::size_t i = 0; i < expected.size(); ++i) {
      if((*args)[i]->type != expected[i]) {
        return std::unexpected(syntaxError(offset,
            std::format("{}() argument {} must be {}", name, i + 1, typeName(expected[i]))));
      }
    }

    std::vector<NodePtr> callArgs;
    callArgs.push_back(std::move(receiver));
    for(auto &arg : *args) {
      callArgs.push_back(std::move(arg));
    }

    return makeNode(Call{*function, std::move(callArgs)}, result);
  }

  // Parses "pred)" of a quantifier; the opening part has been consumed.
  std::expected<NodePtr, Error>
  parseQuantified(QUANTIFIER kind, NodePtr range, const std::string &variable, std::size_t offset) {
    const auto slot = nextSlot_++;
    scopes_.push_back(Scope{variable, slot});

    auto predicate = parseOr();
    scopes_.pop_back();

    if(!predicate) {
      return predicate;
    }
    if((*predicate)->type != TYPE::BOOL) {
      return std::unexpected(syntaxError(offset, "quantifier predicate must be bool"));
    }
    if(auto error = expect(TOKEN::RPAREN, "')'")) {
      return std::unexpected(*error);
    }

    return makeNode(Quantifier{kind, std::move(range), slot, std::move(*predicate)}, TYPE::BOOL);
  }

  // Parses "(a, b, ...)".
  std::expected<std::vector<NodePtr>, Error>
  parseArguments() {
    if(auto error = expect(TOKEN::LPAREN, "'('")) {
      return std::unexpected(*error);
    }

    std::vector<NodePtr> args;
    if(accept(TOKEN::RPAREN)) {
      return args;
    }

    while(true) {
      auto arg = parseOr();
      if(!arg) {
        return std::unexpected(arg.error());
      }
      args.push_back(std::move(*arg));

      if(accept(TOKEN::COMMA)) {
        continue;
      }
      if(auto error = expect(TOKEN::RPAREN, "')'")) {
        return std::unexpected(*error);
      }
      return args;
    }
  }

  std::expected<NodePtr, Error>
  parseFunction(const std::string &name, std::size_t offset) {
    if(name == "all_match" || name == "any_match") {
      advance();
      return parseQuantified(name == "all_match" ? QUANTIFIER::ALL : QUANTIFIER::ANY,
                             nullptr, "", offset);
    }

    std::optional<FUNCTION> aggregate;
    if(name == "sum")          aggregate = FUNCTION::SUM;
    else if(name == "avg")     aggregate = FUNCTION::AVG;
    else if(name == "min_val") aggregate = FUNCTION::MIN_VAL;
    else if(name == "max_val") aggregate = FUNCTION::MAX_VAL;

    if(aggregate) {
      advance();
      const auto &arg = peek();
      if(arg.kind != TOKEN::IDENT || arg.text != "amount") {
        return std::unexpected(syntaxError(arg.offset, std::format("{}() only accepts amount", name)));
      }
      advance();
      if(auto error = expect(TOKEN::RPAREN, "')'")) {
        return std::unexpected(*error);
      }
      return makeNode(Call{*aggregate, {}}, TYPE::DECIMAL);
    }

    auto args = parseArguments();
    if(!args) {
      return std::unexpected(args.error());
    }

    if(name == "count") {
      if(!args->empty()) {
        return std::unexpected(syntaxError(offset, "count() takes no arguments"));
      }
      return makeNode(Call{FUNCTION::COUNT_ITEMS, {}}, TYPE::INT);
    }

    if(name == "abs") {
      if(args->size() != 1 || !isNumeric((*args)[0]->type)) {
        return std::unexpected(syntaxError(offset, "abs() takes one numeric argument"));
      }
      const TYPE type = (*args)[0]->type;
      std::vector<NodePtr> callArgs;
      callArgs.push_back(std::move((*args)[0]));
      return makeNode(Call{FUNCTION::ABS, std::move(callArgs)}, type);
    }

    return std::unexpected(syntaxError(offset, std::format("unknown function '{}'", name)));
  }

  std::expected<NodePtr, Error>
  resolveIdentifier(const std::string &name, std::size_t offset) {
    for(auto scope = scopes_.rbegin(); scope != scopes_.rend(); ++scope) {
      if(!scope->name.empty() && scope->name == name) {
        return makeNode(Variable{scope->slot}, TYPE::ITEM);
      }

      if(scope->name.empty()) {
        if(auto field = itemField(name)) {
          return makeNode(Member{makeNode(Variable{scope->slot}, TYPE::ITEM), *field},
                          fieldType(*field));
        }
      }
    }

    if(auto field = contextField(name)) {
      return makeNode(ContextField{*field}, fieldType(*field));
    }

    return std::unexpected(syntaxError(offset, std::format("undeclared reference to '{}'", name)));
  }

  std::expected<NodePtr, Error>
  parseNumber(const Token &token) {
    if(token.text.find('.') != std::string::npos) {
      auto value = Decimal::parse(token.text);
      if(!value) {
        return std::unexpected(syntaxError(token.offset, value.error().message));
      }
      return makeNode(Literal{*value}, TYPE::DECIMAL);
    }

    std::int64_t value = 0;
    const auto *end = token.text.data() + token.text.size();
    const auto [ptr, ec] = std::from_chars(token.text.data(), end, value);
    if(ec != std::errc{} || ptr != end) {
      return std::unexpected(syntaxError(token.offset, std::format("invalid number '{}'", token.text)));
    }

    // Integers are promoted to cents next to amounts.
    if(value > std::numeric_limits<std::int64_t>::max() / 100) {
      return std::unexpected(syntaxError(token.offset, std::format("number '{}' out of range", token.text)));
    }

    return makeNode(Literal{value}, TYPE::INT);
  }

  std::expected<NodePtr, Error>
  parsePrimary() {
    const Token &token = peek();

    switch(token.kind) {
      case TOKEN::NUMBER: {
        advance();
        return parseNumber(token);
      }

      case TOKEN::STRING_LITERAL: {
        advance();
        return makeNode(Literal{lowercase(token.text)}, TYPE::STRING);
      }

      case TOKEN::LPAREN: {
        advance();
        auto inner = parseOr();
        if(!inner) {
          return inner;
        }
        if(auto error = expect(TOKEN::RPAREN, "')'")) {
          return std::unexpected(*error);
        }
        return inner;
      }

      case TOKEN::IDENT: {
        const std::string name = token.text;
        const auto offset = token.offset;
        advance();

        if(name == "true" || name == "false") {
          return makeNode(Literal{name == "true"}, TYPE::BOOL);
        }

        if(peek().kind == TOKEN::LPAREN) {
          return parseFunction(name, offset);
        }

        return resolveIdentifier(name, offset);
      }

      case TOKEN::END:
        return std::unexpected(syntaxError(token.offset, "unexpected end of expression"));

      default:
        return std::unexpected(syntaxError(token.offset, std::format("unexpected '{}'", token.text)));
    }
  }
};

}

std::expected<CompiledExpression, Error>
compile(std::string_view text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if(first == std::string_view::npos) {
    return std::unexpected(makeError(UNEXPECTED_CODE::VALIDATION, "Expression cannot be empty"));
  }
  const auto last = text.find_last_not_of(" \t\r\n");
  const auto trimmed = text.substr(first, last - first + 1);

  if(trimmed.size() > MAX_EXPRESSION_LENGTH) {
    return std::unexpected(makeError(UNEXPECTED_CODE::VALIDATION,
        std::format("Expression too long (max {} characters)", MAX_EXPRESSION_LENGTH)));
  }

  if(nestingDepth(trimmed) > MAX_NESTING_DEPTH) {
    return std::unexpected(makeError(UNEXPECTED_CODE::VALIDATION,
        std::format("Expression too deeply nested (max {} levels)", MAX_NESTING_DEPTH)));
  }

  auto tokens = tokenize(trimmed);
  if(!tokens) {
    return std::unexpected(tokens.error());
  }

  Parser parser{std::move(*tokens)};
  auto root = parser.parse();
  if(!root) {
    return std::unexpected(root.error());
  }

  return CompiledExpression{std::string{trimmed}, std::move(*root), parser.slots()};
}

ValidationResult
validate(std::string_view text) {
  auto compiled = compile(text);
  if(!compiled) {
    return ValidationResult{false, compiled.error().message};
  }
  return ValidationResult{true, std::nullopt};
}

}
