#include "hint_matcher.hpp"

#include <set>

#include <spdlog/spdlog.h>

namespace hints {

HintMatcher::HintMatcher(const HintStore &store, const ledger::Ledger &ledger)
  : store_(store), ledger_(ledger) {}

std::shared_ptr<const std::expected<expression::CompiledExpression, Error>>
HintMatcher::compiled(const models::Hint &hint) {
  CacheKey key{hint.id, hint.expressionVersion};

  {
    std::lock_guard lock{cacheMutex_};
    if(auto found = cache_.find(key); found != cache_.end()) {
      return found->second;
    }
  }

  auto entry = std::make_shared<const std::expected<expression::CompiledExpression, Error>>(
      expression::compile(hint.expression));

  std::lock_guard lock{cacheMutex_};
  return cache_.try_emplace(key, std::move(entry)).first->second;
}

void
HintMatcher::retain(const std::vector<models::Hint> &active) {
  std::set<CacheKey> keep;
  for(const auto &hint : active) {
    keep.emplace(hint.id, hint.expressionVersion);
  }

  // Deleted, deactivated and superseded hints.
  std::lock_guard lock{cacheMutex_};
  std::erase_if(cache_, [&](const auto &entry) { return !keep.contains(entry.first); });
}

std::expected<std::optional<models::Suggestion>, Error>
HintMatcher::suggest(const std::vector<models::LineItem> &selected) {
  if(selected.empty()) {
    return std::unexpected(makeError(UNEXPECTED_CODE::VALIDATION,
                                     "at least one line item is required"));
  }

  const auto context = expression::buildContext(selected);

  const auto active = store_.list(true);
  retain(active);

  for(const auto &hint : active) {
    auto expr = compiled(hint);

    if(!expr->has_value()) {
      spdlog::warn("skipping event hint {} '{}': {}", hint.id, hint.name, expr->error().message);
      continue;
    }

    auto result = expression::matches(**expr, context);

    if(!result) {
      spdlog::warn("skipping event hint {} '{}': {}", hint.id, hint.name, result.error().message);
      continue;
    }

    if(*result) {
      spdlog::debug("event hint {} matched {} line items", hint.id, selected.size());
      return models::Suggestion{hint.prefillName, hint.prefillCategoryId, hint.id, hint.name};
    }
  }

  return std::nullopt;
}

std::expected<std::optional<models::Suggestion>, Error>
HintMatcher::suggestFor(const std::vector<std::string> &lineItemIds) {
  auto items = ledger_.getMany(lineItemIds);
  if(!items) {
    return std::unexpected(items.error());
  }
  return suggest(*items);
}

std::size_t
HintMatcher::cachedExpressions() const {
  std::lock_guard lock{cacheMutex_};
  return cache_.size();
}

}
