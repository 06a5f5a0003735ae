#pragma once

#include <expected>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "expression.hpp"
#include "models.hpp"
#include "repository.hpp"
#include "unexpected_codes.hpp"

namespace hints {

// Ordered rule set. Readers take a shared lock and always see a complete
// ordering; writers persist first and swap memory only on success.
class HintStore {
public:
  explicit HintStore(Repository &repository);

  HintStore(const HintStore &) = delete;
  HintStore &operator=(const HintStore &) = delete;

  std::optional<Error>
  load();

  // Ascending display order, ties by id.
  std::vector<models::Hint>
  list(bool activeOnly) const;

  std::expected<models::Hint, Error>
  get(const std::string &id) const;

  std::expected<models::Hint, Error>
  create(const models::NewHint &hint);

  std::expected<models::Hint, Error>
  update(const std::string &id, const models::HintPatch &patch);

  std::optional<Error>
  remove(const std::string &id);

  // The given ids take orders 0..n-1; every other hint follows from n on in
  // its previous relative order.
  std::optional<Error>
  reorder(const std::vector<std::string> &ids);

  static expression::ValidationResult
  validate(std::string_view expression);

private:
  Repository
    &repository_;
  mutable std::shared_mutex
    mutex_;
  std::vector<models::Hint>
    hints_;

  bool orderTaken(int order, const std::string &exceptId) const;

  static void sortByOrder(std::vector<models::Hint> &hints);
};

}
