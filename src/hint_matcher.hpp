#pragma once

#include <expected>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "expression.hpp"
#include "hint_store.hpp"
#include "ledger.hpp"
#include "models.hpp"
#include "unexpected_codes.hpp"

namespace hints {

class HintMatcher {
public:
  HintMatcher(const HintStore &store, const ledger::Ledger &ledger);

  // First active hint, in display order, whose expression holds for the
  // selection. Hints that fail to compile or evaluate are skipped.
  std::expected<std::optional<models::Suggestion>, Error>
  suggest(const std::vector<models::LineItem> &selected);

  std::expected<std::optional<models::Suggestion>, Error>
  suggestFor(const std::vector<std::string> &lineItemIds);

  std::size_t cachedExpressions() const;

private:
  using CacheKey = std::pair<std::string, int>;

  const HintStore
    &store_;
  const ledger::Ledger
    &ledger_;
  mutable std::mutex
    cacheMutex_;
  // A failed compile is cached too so a broken hint is not re-parsed per request.
  std::map<CacheKey, std::shared_ptr<const std::expected<expression::CompiledExpression, Error>>>
    cache_;

  std::shared_ptr<const std::expected<expression::CompiledExpression, Error>>
  compiled(const models::Hint &hint);

  void
  retain(const std::vector<models::Hint> &active);
};

}
