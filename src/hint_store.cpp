#include "hint_store.hpp"

#include <algorithm>
#include <format>
#include <mutex>
#include <unordered_set>

#include <spdlog/spdlog.h>

#include "ids.hpp"

namespace hints {

namespace {

std::optional<Error>
requireText(std::string_view value, std::string_view field) {
  if(value.find_first_not_of(" \t\r\n") == std::string_view::npos) {
    return makeError(UNEXPECTED_CODE::VALIDATION, std::format("Missing required field: {}", field));
  }
  return std::nullopt;
}

std::optional<Error>
requireValidExpression(std::string_view text) {
  auto result = expression::validate(text);
  if(!result.valid) {
    return makeError(UNEXPECTED_CODE::VALIDATION,
                     std::format("Invalid CEL expression: {}", result.error.value_or("unknown error")));
  }
  return std::nullopt;
}

}

HintStore::HintStore(Repository &repository): repository_(repository) {}

void
HintStore::sortByOrder(std::vector<models::Hint> &hints) {
  std::sort(hints.begin(), hints.end(), [](const models::Hint &a, const models::Hint &b) {
    if(a.displayOrder != b.displayOrder) {
      return a.displayOrder < b.displayOrder;
    }
    return a.id < b.id;
  });
}

std::optional<Error>
HintStore::load() {
  auto stored = repository_.loadHints();
  if(!stored) {
    return stored.error();
  }

  sortByOrder(*stored);

  std::unique_lock lock{mutex_};
  hints_ = std::move(*stored);

  spdlog::info("loaded {} event hints", hints_.size());
  return std::nullopt;
}

std::vector<models::Hint>
HintStore::list(bool activeOnly) const {
  std::shared_lock lock{mutex_};

  if(!activeOnly) {
    return hints_;
  }

  std::vector<models::Hint> active;
  std::copy_if(hints_.begin(), hints_.end(), std::back_inserter(active),
               [](const models::Hint &hint) { return hint.active; });
  return active;
}

std::expected<models::Hint, Error>
HintStore::get(const std::string &id) const {
  std::shared_lock lock{mutex_};

  auto found = std::find_if(hints_.begin(), hints_.end(),
                            [&](const models::Hint &hint) { return hint.id == id; });
  if(found == hints_.end()) {
    return std::unexpected(makeError(UNEXPECTED_CODE::NOT_FOUND,
                                     std::format("Event hint not found: {}", id)));
  }
  return *found;
}

bool
HintStore::orderTaken(int order, const std::string &exceptId) const {
  return std::any_of(hints_.begin(), hints_.end(), [&](const models::Hint &hint) {
    return hint.active && hint.id != exceptId && hint.displayOrder == order;
  });
}

expression::ValidationResult
HintStore::validate(std::string_view text) {
  return expression::validate(text);
}

std::expected<models::Hint, Error>
HintStore::create(const models::NewHint &request) {
  for(auto error : {requireText(request.name, "name"),
                    requireText(request.expression, "cel_expression"),
                    requireText(request.prefillName, "prefill_name")}) {
    if(error) {
      return std::unexpected(*error);
    }
  }

  if(auto error = requireValidExpression(request.expression)) {
    return std::unexpected(*error);
  }

  std::unique_lock lock{mutex_};

  models::Hint hint;
  hint.id = ids::generateId("eh");
  hint.name = request.name;
  hint.expression = request.expression;
  hint.prefillName = request.prefillName;
  hint.prefillCategoryId = request.prefillCategoryId;
  hint.active = request.active;
  hint.expressionVersion = 1;

  if(request.displayOrder) {
    if(hint.active && orderTaken(*request.displayOrder, hint.id)) {
      return std::unexpected(makeError(UNEXPECTED_CODE::DUPLICATE_ORDER,
          std::format("Display order {} is already used by an active hint", *request.displayOrder)));
    }
    hint.displayOrder = *request.displayOrder;
  } else {
    int next = 0;
    for(const auto &existing : hints_) {
      next = std::max(next, existing.displayOrder + 1);
    }
    hint.displayOrder = next;
  }

  if(auto error = repository_.saveHint(hint)) {
    return std::unexpected(*error);
  }

  hints_.push_back(hint);
  sortByOrder(hints_);

  spdlog::info("created event hint {} '{}' at order {}", hint.id, hint.name, hint.displayOrder);
  return hint;
}

std::expected<models::Hint, Error>
HintStore::update(const std::string &id, const models::HintPatch &patch) {
  if(patch.name) {
    if(auto error = requireText(*patch.name, "name")) {
      return std::unexpected(*error);
    }
  }
  if(patch.prefillName) {
    if(auto error = requireText(*patch.prefillName, "prefill_name")) {
      return std::unexpected(*error);
    }
  }
  if(patch.expression) {
    if(auto error = requireValidExpression(*patch.expression)) {
      return std::unexpected(*error);
    }
  }

  std::unique_lock lock{mutex_};

  auto found = std::find_if(hints_.begin(), hints_.end(),
                            [&](const models::Hint &hint) { return hint.id == id; });
  if(found == hints_.end()) {
    return std::unexpected(makeError(UNEXPECTED_CODE::NOT_FOUND,
                                     std::format("Event hint not found: {}", id)));
  }

  models::Hint hint = *found;

  if(patch.name) hint.name = *patch.name;
  if(patch.prefillName) hint.prefillName = *patch.prefillName;
  if(patch.prefillCategoryId) hint.prefillCategoryId = *patch.prefillCategoryId;
  if(patch.displayOrder) hint.displayOrder = *patch.displayOrder;
  if(patch.active) hint.active = *patch.active;

  if(patch.expression && *patch.expression != hint.expression) {
    hint.expression = *patch.expression;
    ++hint.expressionVersion;
  }

  if(hint.active && orderTaken(hint.displayOrder, hint.id)) {
    return std::unexpected(makeError(UNEXPECTED_CODE::DUPLICATE_ORDER,
        std::format("Display order {} is already used by an active hint", hint.displayOrder)));
  }

  if(auto error = repository_.saveHint(hint)) {
    return std::unexpected(*error);
  }

  *found = hint;
  sortByOrder(hints_);

  spdlog::info("updated event hint {}", id);
  return hint;
}

std::optional<Error>
HintStore::remove(const std::string &id) {
  std::unique_lock lock{mutex_};

  auto found = std::find_if(hints_.begin(), hints_.end(),
                            [&](const models::Hint &hint) { return hint.id == id; });
  if(found == hints_.end()) {
    return makeError(UNEXPECTED_CODE::NOT_FOUND, std::format("Event hint not found: {}", id));
  }

  if(auto error = repository_.deleteHint(id)) {
    return error;
  }

  hints_.erase(found);
  spdlog::info("deleted event hint {}", id);
  return std::nullopt;
}

std::optional<Error>
HintStore::reorder(const std::vector<std::string> &ids) {
  if(ids.empty()) {
    return makeError(UNEXPECTED_CODE::VALIDATION, "hint_ids array is required");
  }

  std::unordered_set<std::string> requested;
  for(const auto &id : ids) {
    if(!requested.insert(id).second) {
      return makeError(UNEXPECTED_CODE::VALIDATION, std::format("Hint {} listed twice", id));
    }
  }

  std::unique_lock lock{mutex_};

  std::vector<models::Hint> reordered;
  reordered.reserve(hints_.size());

  for(const auto &id : ids) {
    auto found = std::find_if(hints_.begin(), hints_.end(),
                              [&](const models::Hint &hint) { return hint.id == id; });
    if(found == hints_.end()) {
      return makeError(UNEXPECTED_CODE::UNKNOWN_ID, std::format("Event hint not found: {}", id));
    }
    reordered.push_back(*found);
  }

  // hints_ is already in display order, so the rest keep their relative order.
  for(const auto &hint : hints_) {
    if(!requested.contains(hint.id)) {
      reordered.push_back(hint);
    }
  }

  for(std::size_t i = 0; i < reordered.size(); ++i) {
    reordered[i].displayOrder = static_cast<int>(i);
  }

  if(auto error = repository_.saveHintOrder(reordered)) {
    return error;
  }

  hints_ = std::move(reordered);

  spdlog::info("reordered {} event hints", ids.size());
  return std::nullopt;
}

}
