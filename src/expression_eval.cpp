#include "expression.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace expression {

namespace {

std::string
lowercase(std::string_view text) {
  std::string out{text};
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

Error
evaluationError(std::string message) {
  return makeError(UNEXPECTED_CODE::EVALUATION, std::move(message));
}

Error
overflowError() {
  return evaluationError("integer overflow");
}

// Integer arithmetic on user input; every result outside int64 is an error.
std::expected<std::int64_t, Error>
checkedAdd(std::int64_t l, std::int64_t r) {
  std::int64_t out = 0;
  if(__builtin_add_overflow(l, r, &out)) {
    return std::unexpected(overflowError());
  }
  return out;
}

std::expected<std::int64_t, Error>
checkedSub(std::int64_t l, std::int64_t r) {
  std::int64_t out = 0;
  if(__builtin_sub_overflow(l, r, &out)) {
    return std::unexpected(overflowError());
  }
  return out;
}

std::expected<std::int64_t, Error>
checkedAbs(std::int64_t value) {
  if(value < 0) {
    return checkedSub(0, value);
  }
  return value;
}

std::expected<Decimal, Error>
asDecimal(const Value &value) {
  if(const auto *integer = std::get_if<std::int64_t>(&value)) {
    std::int64_t cents = 0;
    if(__builtin_mul_overflow(*integer, std::int64_t{100}, &cents)) {
      return std::unexpected(overflowError());
    }
    return Decimal::fromCents(cents);
  }
  return std::get<Decimal>(value);
}

std::expected<Decimal, Error>
addAmounts(Decimal l, Decimal r) {
  return checkedAdd(l.cents(), r.cents()).transform(Decimal::fromCents);
}

class Evaluator {
public:
  Evaluator(const EvalContext &context, std::size_t slots)
    : context_(context), bound_(slots, nullptr) {}

  std::expected<Value, Error>
  eval(const Node &node) {
    return std::visit([&](const auto &kind) { return apply(kind, node.type); }, node.kind);
  }

private:
  const EvalContext
    &context_;
  std::vector<const ItemRecord *>
    bound_;

  std::expected<Value, Error>
  apply(const Literal &literal, TYPE) {
    return literal.value;
  }

  std::expected<Value, Error>
  apply(const ContextField &field, TYPE) {
    switch(field.field) {
      case FIELD::AMOUNT:         return Value{context_.amount};
      case FIELD::DESCRIPTION:    return Value{context_.description};
      case FIELD::COUNTERPARTY:   return Value{context_.counterparty};
      case FIELD::PAYMENT_METHOD: return Value{context_.paymentMethod};
      case FIELD::COUNT:          return Value{context_.count};
      case FIELD::ITEMS:          return Value{&context_.items};
      case FIELD::DATE:           break;
    }
    return std::unexpected(evaluationError("context has no date field"));
  }

  std::expected<Value, Error>
  apply(const Variable &variable, TYPE) {
    const auto *item = bound_.at(variable.slot);
    if(item == nullptr) {
      return std::unexpected(evaluationError("unbound item variable"));
    }
    return Value{item};
  }

  std::expected<Value, Error>
  apply(const Member &member, TYPE) {
    auto item = eval(*member.item);
    if(!item) {
      return item;
    }

    const auto *record = std::get<const ItemRecord *>(*item);
    switch(member.field) {
      case FIELD::AMOUNT:         return Value{record->amount};
      case FIELD::DESCRIPTION:    return Value{record->description};
      case FIELD::COUNTERPARTY:   return Value{record->counterparty};
      case FIELD::PAYMENT_METHOD: return Value{record->paymentMethod};
      case FIELD::DATE:           return Value{record->date};
      case FIELD::COUNT:
      case FIELD::ITEMS:          break;
    }
    return std::unexpected(evaluationError("item has no such field"));
  }

  std::expected<Value, Error>
  apply(const Unary &unary, TYPE type) {
    auto operand = eval(*unary.operand);
    if(!operand) {
      return operand;
    }

    if(unary.op == UNARY_OP::NOT) {
      return Value{!std::get<bool>(*operand)};
    }

    if(type == TYPE::INT) {
      return checkedSub(0, std::get<std::int64_t>(*operand))
          .transform([](std::int64_t value) { return Value{value}; });
    }
    return checkedSub(0, std::get<Decimal>(*operand).cents())
        .transform([](std::int64_t cents) { return Value{Decimal::fromCents(cents)}; });
  }

  std::expected<Value, Error>
  apply(const Binary &binary, TYPE type) {
    auto lhs = eval(*binary.lhs);
    if(!lhs) {
      return lhs;
    }

    if(binary.op == BINARY_OP::AND && !std::get<bool>(*lhs)) {
      return Value{false};
    }
    if(binary.op == BINARY_OP::OR && std::get<bool>(*lhs)) {
      return Value{true};
    }

    auto rhs = eval(*binary.rhs);
    if(!rhs) {
      return rhs;
    }

    switch(binary.op) {
      case BINARY_OP::AND:
      case BINARY_OP::OR:
        return Value{std::get<bool>(*rhs)};

      case BINARY_OP::ADD:
      case BINARY_OP::SUB:
        return arithmetic(binary.op, *lhs, *rhs, type);

      default:
        return compare(binary.op, *lhs, *rhs, binary.lhs->type, binary.rhs->type)
            .transform([](bool result) { return Value{result}; });
    }
  }

  static std::expected<Value, Error>
  arithmetic(BINARY_OP op, const Value &lhs, const Value &rhs, TYPE type) {
    if(type == TYPE::STRING) {
      return Value{std::get<std::string>(lhs) + std::get<std::string>(rhs)};
    }

    const auto combine = op == BINARY_OP::ADD ? checkedAdd : checkedSub;

    if(type == TYPE::INT) {
      return combine(std::get<std::int64_t>(lhs), std::get<std::int64_t>(rhs))
          .transform([](std::int64_t value) { return Value{value}; });
    }

    const auto l = asDecimal(lhs);
    if(!l) {
      return std::unexpected(l.error());
    }
    const auto r = asDecimal(rhs);
    if(!r) {
      return std::unexpected(r.error());
    }
    return combine(l->cents(), r->cents())
        .transform([](std::int64_t cents) { return Value{Decimal::fromCents(cents)}; });
  }

  static std::expected<bool, Error>
  compare(BINARY_OP op, const Value &lhs, const Value &rhs, TYPE l, TYPE r) {
    std::strong_ordering order = std::strong_ordering::equal;

    if(l == TYPE::BOOL) {
      order = std::get<bool>(lhs) <=> std::get<bool>(rhs);
    } else if(l == TYPE::STRING) {
      order = std::get<std::string>(lhs) <=> std::get<std::string>(rhs);
    } else if(l == TYPE::INT && r == TYPE::INT) {
      order = std::get<std::int64_t>(lhs) <=> std::get<std::int64_t>(rhs);
    } else {
      const auto left = asDecimal(lhs);
      if(!left) {
        return std::unexpected(left.error());
      }
      const auto right = asDecimal(rhs);
      if(!right) {
        return std::unexpected(right.error());
      }
      order = *left <=> *right;
    }

    switch(op) {
      case BINARY_OP::EQ: return order == 0;
      case BINARY_OP::NE: return order != 0;
      case BINARY_OP::LT: return order < 0;
      case BINARY_OP::LE: return order <= 0;
      case BINARY_OP::GT: return order > 0;
      case BINARY_OP::GE: return order >= 0;
      default:            return false;
    }
  }

  std::expected<Value, Error>
  aggregate(FUNCTION function) {
    const auto &items = context_.items;

    Decimal total;
    for(const auto &item : items) {
      auto next = addAmounts(total, item.amount);
      if(!next) {
        return std::unexpected(next.error());
      }
      total = *next;
    }

    if(function == FUNCTION::SUM) {
      return Value{total};
    }

    if(items.empty()) {
      return std::unexpected(evaluationError("aggregate over an empty selection"));
    }

    if(function == FUNCTION::AVG) {
      return Value{total.dividedBy(static_cast<std::int64_t>(items.size()))};
    }

    const auto byAmount = [](const ItemRecord &a, const ItemRecord &b) { return a.amount < b.amount; };

    if(function == FUNCTION::MIN_VAL) {
      return Value{std::min_element(items.begin(), items.end(), byAmount)->amount};
    }
    return Value{std::max_element(items.begin(), items.end(), byAmount)->amount};
  }

  std::expected<Value, Error>
  apply(const Call &call, TYPE type) {
    switch(call.function) {
      case FUNCTION::SUM:
      case FUNCTION::AVG:
      case FUNCTION::MIN_VAL:
      case FUNCTION::MAX_VAL:
        return aggregate(call.function);

      case FUNCTION::COUNT_ITEMS:
        return Value{static_cast<std::int64_t>(context_.items.size())};

      default:
        break;
    }

    std::vector<Value> args;
    args.reserve(call.args.size());
    for(const auto &arg : call.args) {
      auto value = eval(*arg);
      if(!value) {
        return value;
      }
      args.push_back(std::move(*value));
    }

    switch(call.function) {
      case FUNCTION::ABS:
        if(type == TYPE::INT) {
          return checkedAbs(std::get<std::int64_t>(args[0]))
              .transform([](std::int64_t value) { return Value{value}; });
        }
        return checkedAbs(std::get<Decimal>(args[0]).cents())
            .transform([](std::int64_t cents) { return Value{Decimal::fromCents(cents)}; });

      case FUNCTION::CONTAINS:
        return Value{std::get<std::string>(args[0]).find(std::get<std::string>(args[1])) != std::string::npos};

      case FUNCTION::STARTS_WITH:
        return Value{std::get<std::string>(args[0]).starts_with(std::get<std::string>(args[1]))};

      case FUNCTION::ENDS_WITH:
        return Value{std::get<std::string>(args[0]).ends_with(std::get<std::string>(args[1]))};

      case FUNCTION::SIZE:
        if(const auto *text = std::get_if<std::string>(&args[0])) {
          return Value{static_cast<std::int64_t>(text->size())};
        }
        return Value{static_cast<std::int64_t>(std::get<const std::vector<ItemRecord> *>(args[0])->size())};

      default:
        return std::unexpected(evaluationError("unsupported function"));
    }
  }

  std::expected<Value, Error>
  apply(const Index &index, TYPE) {
    auto list = eval(*index.list);
    if(!list) {
      return list;
    }

    auto position = eval(*index.index);
    if(!position) {
      return position;
    }

    const auto *items = std::get<const std::vector<ItemRecord> *>(*list);
    const auto at = std::get<std::int64_t>(*position);

    if(at < 0 || static_cast<std::size_t>(at) >= items->size()) {
      return std::unexpected(evaluationError(
          std::format("index {} out of range for {} item(s)", at, items->size())));
    }

    return Value{&(*items)[static_cast<std::size_t>(at)]};
  }

  std::expected<Value, Error>
  apply(const Quantifier &quantifier, TYPE) {
    const std::vector<ItemRecord> *items = &context_.items;

    if(quantifier.range) {
      auto range = eval(*quantifier.range);
      if(!range) {
        return range;
      }
      items = std::get<const std::vector<ItemRecord> *>(*range);
    }

    const bool wantAll = quantifier.kind == QUANTIFIER::ALL;
    const auto *previous = bound_[quantifier.slot];

    for(const auto &item : *items) {
      bound_[quantifier.slot] = &item;

      auto result = eval(*quantifier.predicate);
      if(!result) {
        bound_[quantifier.slot] = previous;
        return result;
      }

      if(std::get<bool>(*result) != wantAll) {
        bound_[quantifier.slot] = previous;
        return Value{!wantAll};
      }
    }

    bound_[quantifier.slot] = previous;
    return Value{wantAll};
  }
};

}

EvalContext
buildContext(const std::vector<models::LineItem> &lineItems) {
  EvalContext context;
  context.count = static_cast<std::int64_t>(lineItems.size());
  context.items.reserve(lineItems.size());

  bool sameCounterparty = true;
  bool samePaymentMethod = true;

  for(std::size_t i = 0; i < lineItems.size(); ++i) {
    const auto &lineItem = lineItems[i];

    ItemRecord record{
      lineItem.amount,
      lowercase(lineItem.description),
      lowercase(lineItem.counterparty),
      lowercase(lineItem.paymentMethod),
      lineItem.date
    };

    context.amount += record.amount;

    if(i > 0) {
      context.description.push_back('\n');
      sameCounterparty = sameCounterparty && record.counterparty == context.items.front().counterparty;
      samePaymentMethod = samePaymentMethod && record.paymentMethod == context.items.front().paymentMethod;
    }
    context.description += record.description;

    context.items.push_back(std::move(record));
  }

  if(!context.items.empty()) {
    if(sameCounterparty) {
      context.counterparty = context.items.front().counterparty;
    }
    if(samePaymentMethod) {
      context.paymentMethod = context.items.front().paymentMethod;
    }
  }

  return context;
}

std::expected<Value, Error>
evaluate(const CompiledExpression &expr, const EvalContext &context) {
  Evaluator evaluator{context, expr.slots()};
  return evaluator.eval(expr.root());
}

std::expected<bool, Error>
matches(const CompiledExpression &expr, const EvalContext &context) {
  auto value = evaluate(expr, context);
  if(!value) {
    return std::unexpected(value.error());
  }

  if(const auto *result = std::get_if<bool>(&*value)) {
    return *result;
  }
  return std::unexpected(evaluationError("expression did not produce a bool"));
}

}
