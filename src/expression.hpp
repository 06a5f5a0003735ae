#pragma once

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "decimal.hpp"
#include "models.hpp"
#include "unexpected_codes.hpp"

namespace expression {

constexpr std::size_t MAX_EXPRESSION_LENGTH = 500;
constexpr int MAX_NESTING_DEPTH = 10;

enum TYPE: const unsigned char {
  BOOL,
  INT,
  DECIMAL,
  STRING,
  ITEM,
  ITEM_LIST
};

std::string_view typeName(TYPE type);

enum FIELD: const unsigned char {
  AMOUNT,
  DESCRIPTION,
  COUNTERPARTY,
  PAYMENT_METHOD,
  DATE,
  COUNT,
  ITEMS
};

// One selected line item as seen by an expression. Strings are lowercased.
struct ItemRecord {
  Decimal
    amount;
  std::string
    description;
  std::string
    counterparty;
  std::string
    paymentMethod;
  std::int64_t
    date = 0;
};

// The fixed schema every expression compiles against.
struct EvalContext {
  Decimal
    amount;
  std::string
    description;
  std::string
    counterparty;
  std::string
    paymentMethod;
  std::int64_t
    count = 0;
  std::vector<ItemRecord>
    items;
};

EvalContext
buildContext(const std::vector<models::LineItem> &lineItems);

using Value = std::variant<bool,
                           std::int64_t,
                           Decimal,
                           std::string,
                           const ItemRecord *,
                           const std::vector<ItemRecord> *>;

// AST

enum UNARY_OP: const unsigned char {
  NOT,
  NEGATE
};

enum BINARY_OP: const unsigned char {
  OR,
  AND,
  EQ,
  NE,
  LT,
  LE,
  GT,
  GE,
  ADD,
  SUB
};

enum FUNCTION: const unsigned char {
  SUM,
  AVG,
  MIN_VAL,
  MAX_VAL,
  COUNT_ITEMS,
  ABS,
  CONTAINS,
  STARTS_WITH,
  ENDS_WITH,
  SIZE
};

enum QUANTIFIER: const unsigned char {
  ALL,
  ANY
};

struct Node;
using NodePtr = std::unique_ptr<Node>;

struct Literal {
  Value value;
};

struct ContextField {
  FIELD field;
};

// An item bound by a quantifier, addressed by its slot.
struct Variable {
  std::size_t slot;
};

struct Member {
  NodePtr item;
  FIELD field;
};

struct Unary {
  UNARY_OP op;
  NodePtr operand;
};

struct Binary {
  BINARY_OP op;
  NodePtr lhs;
  NodePtr rhs;
};

// Methods carry their receiver as the first argument.
struct Call {
  FUNCTION function;
  std::vector<NodePtr> args;
};

struct Index {
  NodePtr list;
  NodePtr index;
};

// A null range means the context's own items (all_match/any_match).
struct Quantifier {
  QUANTIFIER kind;
  NodePtr range;
  std::size_t slot;
  NodePtr predicate;
};

struct Node {
  std::variant<Literal,
               ContextField,
               Variable,
               Member,
               Unary,
               Binary,
               Call,
               Index,
               Quantifier> kind;
  TYPE type;
};

class CompiledExpression {
public:
  CompiledExpression(std::string source, NodePtr root, std::size_t slots)
    : source_(std::move(source)), root_(std::move(root)), slots_(slots) {}

  const Node &root() const { return *root_; }
  const std::string &source() const { return source_; }
  std::size_t slots() const { return slots_; }

private:
  std::string
    source_;
  NodePtr
    root_;
  std::size_t
    slots_;
};

std::expected<CompiledExpression, Error>
compile(std::string_view text);

std::expected<Value, Error>
evaluate(const CompiledExpression &expr, const EvalContext &context);

// evaluate() narrowed to the boolean result every compiled expression has.
std::expected<bool, Error>
matches(const CompiledExpression &expr, const EvalContext &context);

struct ValidationResult {
  bool
    valid = false;
  std::optional<std::string>
    error;
};

ValidationResult
validate(std::string_view text);

}
