#include <gtest/gtest.h>

#include "hint_store.hpp"
#include "test_support.hpp"

namespace {

models::NewHint
newHint(std::string name, std::optional<int> order = std::nullopt, std::string expression = "amount < 0") {
  models::NewHint hint;
  hint.name = name;
  hint.expression = std::move(expression);
  hint.prefillName = name + " prefill";
  hint.displayOrder = order;
  return hint;
}

std::vector<std::string>
namesInOrder(const std::vector<models::Hint> &hints) {
  std::vector<std::string> names;
  for(const auto &hint : hints) {
    names.push_back(hint.name);
  }
  return names;
}

}

class HintStoreTest: public ::testing::Test {
protected:
  std::unique_ptr<database::SqliteRepository> storage = testing_support::memoryRepository();
  testing_support::FlakyRepository repository{*storage};
  hints::HintStore store{repository};
};

TEST_F(HintStoreTest, CreateAppendsAfterTheLastHint) {
  auto first = store.create(newHint("first"));
  auto second = store.create(newHint("second"));
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());

  EXPECT_EQ(first->displayOrder, 0);
  EXPECT_EQ(second->displayOrder, 1);
  EXPECT_EQ(first->expressionVersion, 1);
  EXPECT_EQ(first->id.rfind("eh_", 0), 0u);
}

TEST_F(HintStoreTest, CreateValidatesInput) {
  auto invalid = store.create(newHint("broken", std::nullopt, "amount <"));
  ASSERT_FALSE(invalid.has_value());
  EXPECT_EQ(invalid.error().code, UNEXPECTED_CODE::VALIDATION);
  EXPECT_EQ(invalid.error().message.rfind("Invalid CEL expression: ", 0), 0u);

  auto unnamed = newHint("");
  unnamed.prefillName = "x";
  EXPECT_EQ(store.create(unnamed).error().code, UNEXPECTED_CODE::VALIDATION);

  EXPECT_TRUE(store.list(false).empty());
}

TEST_F(HintStoreTest, ActiveHintsCannotShareAnOrder) {
  ASSERT_TRUE(store.create(newHint("a", 3)).has_value());

  auto clash = store.create(newHint("b", 3));
  ASSERT_FALSE(clash.has_value());
  EXPECT_EQ(clash.error().code, UNEXPECTED_CODE::DUPLICATE_ORDER);

  auto inactive = newHint("c", 3);
  inactive.active = false;
  EXPECT_TRUE(store.create(inactive).has_value());
}

TEST_F(HintStoreTest, UpdateBumpsVersionOnlyWhenExpressionChanges) {
  auto hint = store.create(newHint("a"));
  ASSERT_TRUE(hint.has_value());

  models::HintPatch rename;
  rename.name = "renamed";
  auto renamed = store.update(hint->id, rename);
  ASSERT_TRUE(renamed.has_value());
  EXPECT_EQ(renamed->name, "renamed");
  EXPECT_EQ(renamed->expressionVersion, 1);

  models::HintPatch rewrite;
  rewrite.expression = "amount > 0";
  auto rewritten = store.update(hint->id, rewrite);
  ASSERT_TRUE(rewritten.has_value());
  EXPECT_EQ(rewritten->expressionVersion, 2);

  models::HintPatch bad;
  bad.expression = "amount >";
  EXPECT_EQ(store.update(hint->id, bad).error().code, UNEXPECTED_CODE::VALIDATION);
  EXPECT_EQ(store.get(hint->id)->expression, "amount > 0");
}

TEST_F(HintStoreTest, UpdateCanClearTheCategory) {
  auto request = newHint("a");
  request.prefillCategoryId = "dining";
  auto hint = store.create(request);
  ASSERT_TRUE(hint.has_value());

  models::HintPatch patch;
  patch.prefillCategoryId = std::optional<std::string>{};
  auto updated = store.update(hint->id, patch);
  ASSERT_TRUE(updated.has_value());
  EXPECT_FALSE(updated->prefillCategoryId.has_value());
}

TEST_F(HintStoreTest, UnknownIdsAreNotFound) {
  EXPECT_EQ(store.get("eh_nope").error().code, UNEXPECTED_CODE::NOT_FOUND);
  EXPECT_EQ(store.update("eh_nope", {}).error().code, UNEXPECTED_CODE::NOT_FOUND);
  EXPECT_EQ(store.remove("eh_nope")->code, UNEXPECTED_CODE::NOT_FOUND);
}

TEST_F(HintStoreTest, ListCanSkipInactiveHints) {
  ASSERT_TRUE(store.create(newHint("on")).has_value());
  auto off = newHint("off");
  off.active = false;
  ASSERT_TRUE(store.create(off).has_value());

  EXPECT_EQ(store.list(false).size(), 2u);
  EXPECT_EQ(namesInOrder(store.list(true)), std::vector<std::string>{"on"});
}

TEST_F(HintStoreTest, ReorderPutsListedIdsFirstAndKeepsTheRest) {
  std::vector<std::string> ids;
  for(auto name : {"a", "b", "c", "d"}) {
    ids.push_back(store.create(newHint(name)).value().id);
  }

  ASSERT_FALSE(store.reorder({ids[3], ids[1]}).has_value());

  auto hints = store.list(false);
  EXPECT_EQ(namesInOrder(hints), (std::vector<std::string>{"d", "b", "a", "c"}));
  for(std::size_t i = 0; i < hints.size(); ++i) {
    EXPECT_EQ(hints[i].displayOrder, static_cast<int>(i));
  }
}

TEST_F(HintStoreTest, FailedReorderLeavesOrderingIntact) {
  std::vector<std::string> ids;
  for(auto name : {"a", "b", "c"}) {
    ids.push_back(store.create(newHint(name)).value().id);
  }

  auto unknown = store.reorder({ids[2], "eh_ghost"});
  ASSERT_TRUE(unknown.has_value());
  EXPECT_EQ(unknown->code, UNEXPECTED_CODE::UNKNOWN_ID);

  EXPECT_EQ(store.reorder({})->code, UNEXPECTED_CODE::VALIDATION);
  EXPECT_EQ(store.reorder({ids[0], ids[0]})->code, UNEXPECTED_CODE::VALIDATION);

  repository.failHints = true;
  EXPECT_EQ(store.reorder({ids[2], ids[1], ids[0]})->code, UNEXPECTED_CODE::UNKNOWN);

  EXPECT_EQ(namesInOrder(store.list(false)), (std::vector<std::string>{"a", "b", "c"}));
}

TEST_F(HintStoreTest, PersistsAcrossReload) {
  std::vector<std::string> ids;
  for(auto name : {"a", "b", "c"}) {
    ids.push_back(store.create(newHint(name)).value().id);
  }
  ASSERT_FALSE(store.reorder({ids[2]}).has_value());
  ASSERT_FALSE(store.remove(ids[1]).has_value());

  hints::HintStore reloaded{repository};
  ASSERT_FALSE(reloaded.load().has_value());
  EXPECT_EQ(namesInOrder(reloaded.list(false)), (std::vector<std::string>{"c", "a"}));
}

TEST_F(HintStoreTest, ValidateReportsWithoutStoring) {
  EXPECT_TRUE(hints::HintStore::validate("count == 2").valid);
  EXPECT_FALSE(hints::HintStore::validate("count ==").valid);
  EXPECT_TRUE(store.list(false).empty());
}
