#include "api.hpp"

#include <cmath>
#include <cstdlib>
#include <format>
#include <limits>

#include <spdlog/spdlog.h>

#include "dates.hpp"

namespace api {

namespace {

void
sendJson(httplib::Response &res, int status, const nlohmann::json &body) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

void
sendData(httplib::Response &res, int status, nlohmann::json data) {
  sendJson(res, status, nlohmann::json{{"data", std::move(data)}});
}

void
sendError(httplib::Response &res, const Error &error) {
  auto status = statusFor(error.code);
  if(status >= 500) {
    spdlog::error("[{}] {}", codeName(error.code), error.message);
  }
  sendJson(res, status, nlohmann::json{{"error", error.message}});
}

void
sendMessage(httplib::Response &res, std::string_view message) {
  sendJson(res, 200, nlohmann::json{{"message", std::string{message}}});
}

// Bounds on numbers taken from requests.
constexpr std::int64_t MAX_AMOUNT_UNITS = 1'000'000'000'000;
constexpr std::int64_t MIN_TIMESTAMP = -62'135'596'800;  // 0001-01-01
constexpr std::int64_t MAX_TIMESTAMP = 253'402'300'799;  // 9999-12-31T23:59:59

Error
invalid(std::string message) {
  return makeError(UNEXPECTED_CODE::VALIDATION, std::move(message));
}

Error
outOfRange(std::string_view field) {
  return invalid(std::format("{} out of range", field));
}

// Integer JSON value within [low, high]; low <= 0 <= high.
std::optional<std::int64_t>
integerWithin(const nlohmann::json &value, std::int64_t low, std::int64_t high) {
  if(value.is_number_unsigned()) {
    const auto number = value.get<std::uint64_t>();
    if(number > static_cast<std::uint64_t>(high)) {
      return std::nullopt;
    }
    return static_cast<std::int64_t>(number);
  }

  const auto number = value.get<std::int64_t>();
  if(number < low || number > high) {
    return std::nullopt;
  }
  return number;
}

std::expected<std::int64_t, Error>
secondsFrom(double value, std::string_view field) {
  if(!std::isfinite(value) || value < static_cast<double>(MIN_TIMESTAMP) ||
     value > static_cast<double>(MAX_TIMESTAMP)) {
    return std::unexpected(outOfRange(field));
  }
  return static_cast<std::int64_t>(value);
}

// Answers 400 itself when the body is not a JSON object.
std::optional<nlohmann::json>
parseBody(const httplib::Request &req, httplib::Response &res) {
  nlohmann::json data = nlohmann::json::parse(req.body, nullptr, false);

  if(data.is_discarded() || !data.is_object()) {
    sendJson(res, 400, nlohmann::json{{"error", "Request body must be a JSON object"}});
    return std::nullopt;
  }

  return data;
}

std::expected<std::optional<std::string>, Error>
optionalString(const nlohmann::json &data, const char *field) {
  auto found = data.find(field);
  if(found == data.end() || found->is_null()) {
    return std::optional<std::string>{};
  }
  if(!found->is_string()) {
    return std::unexpected(invalid(std::format("{} must be a string", field)));
  }
  return std::optional<std::string>{found->get<std::string>()};
}

std::expected<std::string, Error>
requiredString(const nlohmann::json &data, const char *field) {
  auto value = optionalString(data, field);
  if(!value) {
    return std::unexpected(value.error());
  }
  if(!*value) {
    return std::unexpected(invalid(std::format("Missing required field: {}", field)));
  }
  return **value;
}

std::expected<std::optional<bool>, Error>
optionalBool(const nlohmann::json &data, const char *field) {
  auto found = data.find(field);
  if(found == data.end() || found->is_null()) {
    return std::optional<bool>{};
  }
  if(!found->is_boolean()) {
    return std::unexpected(invalid(std::format("{} must be a boolean", field)));
  }
  return std::optional<bool>{found->get<bool>()};
}

std::expected<std::optional<int>, Error>
optionalInt(const nlohmann::json &data, const char *field) {
  auto found = data.find(field);
  if(found == data.end() || found->is_null()) {
    return std::optional<int>{};
  }
  if(!found->is_number_integer()) {
    return std::unexpected(invalid(std::format("{} must be an integer", field)));
  }
  auto value = integerWithin(*found, std::numeric_limits<int>::min(), std::numeric_limits<int>::max());
  if(!value) {
    return std::unexpected(outOfRange(field));
  }
  return std::optional<int>{static_cast<int>(*value)};
}

std::expected<std::vector<std::string>, Error>
stringList(const nlohmann::json &data, const char *field) {
  auto found = data.find(field);
  if(found == data.end() || found->is_null()) {
    return std::vector<std::string>{};
  }
  if(!found->is_array()) {
    return std::unexpected(invalid(std::format("{} must be an array", field)));
  }

  std::vector<std::string> values;
  for(const auto &value : *found) {
    if(!value.is_string()) {
      return std::unexpected(invalid(std::format("{} must only hold strings", field)));
    }
    values.push_back(value.get<std::string>());
  }
  return values;
}

// "YYYY-MM-DD" or Unix seconds.
std::expected<std::int64_t, Error>
dateFrom(const nlohmann::json &value, const char *field) {
  if(value.is_number_integer()) {
    if(auto seconds = integerWithin(value, MIN_TIMESTAMP, MAX_TIMESTAMP)) {
      return *seconds;
    }
    return std::unexpected(outOfRange(field));
  }
  if(value.is_number()) {
    return secondsFrom(value.get<double>(), field);
  }
  if(value.is_string()) {
    if(auto parsed = dates::parseIso(value.get<std::string>())) {
      return *parsed;
    }
  }
  return std::unexpected(invalid(std::format("{} must be a YYYY-MM-DD date or Unix seconds", field)));
}

std::expected<Decimal, Error>
amountFrom(const nlohmann::json &value, const char *field) {
  if(value.is_number_integer()) {
    if(auto units = integerWithin(value, -MAX_AMOUNT_UNITS, MAX_AMOUNT_UNITS)) {
      return Decimal::fromUnits(*units);
    }
    return std::unexpected(outOfRange(field));
  }

  if(value.is_number()) {
    const auto number = value.get<double>();
    if(!std::isfinite(number) || std::fabs(number) > static_cast<double>(MAX_AMOUNT_UNITS)) {
      return std::unexpected(outOfRange(field));
    }
    return Decimal::fromDouble(number);
  }

  if(value.is_string()) {
    auto parsed = Decimal::parse(value.get<std::string>());
    if(parsed && parsed->abs() > Decimal::fromUnits(MAX_AMOUNT_UNITS)) {
      return std::unexpected(outOfRange(field));
    }
    return parsed;
  }
  return std::unexpected(invalid(std::format("{} must be a number", field)));
}

std::expected<std::optional<std::int64_t>, Error>
timeParam(const httplib::Request &req, const char *name) {
  if(!req.has_param(name)) {
    return std::optional<std::int64_t>{};
  }

  auto text = req.get_param_value(name);
  char *end = nullptr;
  double value = std::strtod(text.c_str(), &end);

  if(text.empty() || end != text.c_str() + text.size()) {
    return std::unexpected(invalid(std::format("{} must be Unix seconds", name)));
  }

  auto seconds = secondsFrom(value, name);
  if(!seconds) {
    return std::unexpected(seconds.error());
  }
  return std::optional<std::int64_t>{*seconds};
}

bool
flagParam(const httplib::Request &req, const char *name) {
  if(!req.has_param(name)) {
    return false;
  }
  auto value = req.get_param_value(name);
  return value == "true" || value == "1";
}

nlohmann::json
lineItemsJson(const std::vector<models::LineItem> &items) {
  auto data = nlohmann::json::array();
  for(const auto &item : items) {
    data.push_back(toJson(item));
  }
  return data;
}

nlohmann::json
nullable(const std::optional<std::string> &value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

}

int
statusFor(UNEXPECTED_CODE code) {
  switch(code) {
    case UNEXPECTED_CODE::VALIDATION:
    case UNEXPECTED_CODE::EVALUATION:
    case UNEXPECTED_CODE::NOT_MANUAL:
      return 422;
    case UNEXPECTED_CODE::NOT_FOUND:
    case UNEXPECTED_CODE::PARTIAL_NOT_FOUND:
    case UNEXPECTED_CODE::UNKNOWN_ID:
      return 404;
    case UNEXPECTED_CODE::DUPLICATE_ORDER:
    case UNEXPECTED_CODE::CONFLICT:
    case UNEXPECTED_CODE::BUSY:
      return 409;
    case UNEXPECTED_CODE::PROVIDER:
      return 502;
    case UNEXPECTED_CODE::TIMEOUT:
      return 504;
    case UNEXPECTED_CODE::UNKNOWN:
      return 500;
  }
  return 500;
}

nlohmann::json
toJson(const models::LineItem &item) {
  nlohmann::json data;
  data["id"] = item.id;
  data["date"] = item.date;
  data["amount"] = item.amount.toDouble();
  data["description"] = item.description;
  data["responsible_party"] = item.counterparty;
  data["payment_method"] = item.paymentMethod;
  data["provider"] = item.isManual() ? nlohmann::json(nullptr) : nlohmann::json(item.provider);
  data["external_ref"] = item.isManual() ? nlohmann::json(nullptr) : nlohmann::json(item.externalRef);
  data["is_selected"] = item.selected;
  data["reviewed"] = item.reviewed;
  data["event_id"] = nullable(item.eventId);
  return data;
}

nlohmann::json
toJson(const models::Hint &hint) {
  nlohmann::json data;
  data["id"] = hint.id;
  data["name"] = hint.name;
  data["cel_expression"] = hint.expression;
  data["prefill_name"] = hint.prefillName;
  data["prefill_category_id"] = nullable(hint.prefillCategoryId);
  data["display_order"] = hint.displayOrder;
  data["is_active"] = hint.active;
  return data;
}

nlohmann::json
toJson(const models::Event &event) {
  nlohmann::json data;
  data["id"] = event.id;
  data["name"] = event.name;
  data["category"] = event.categoryId;
  data["date"] = event.date;
  data["amount"] = event.amount.toDouble();
  data["line_items"] = event.lineItemIds;
  data["is_duplicate_transaction"] = event.isDuplicateTransaction;
  return data;
}

nlohmann::json
toJson(const models::Account &account) {
  nlohmann::json data;
  data["id"] = account.id;
  data["provider"] = std::string{models::providerKey(account.provider)};
  data["display_name"] = account.displayName;
  data["status"] = std::string{models::statusKey(account.status)};
  data["last_synced_at"] = account.lastSyncedAt ? nlohmann::json(*account.lastSyncedAt) : nlohmann::json(nullptr);
  data["balance"] = account.balance ? nlohmann::json(account.balance->toDouble()) : nlohmann::json(nullptr);
  return data;
}

nlohmann::json
toJson(const models::SyncResult &result) {
  nlohmann::json data;
  data["account_id"] = result.accountId;
  data["outcome"] = result.outcome == models::SYNC_OUTCOME::OK ? "ok" : "error";
  data["items_merged"] = result.itemsMerged;
  data["error"] = nullable(result.error);
  return data;
}

nlohmann::json
toJson(const models::Suggestion &suggestion) {
  nlohmann::json data;
  data["name"] = suggestion.name;
  data["category"] = nullable(suggestion.categoryId);
  data["matched_hint_id"] = suggestion.matchedHintId;
  data["matched_hint_name"] = suggestion.matchedHintName;
  return data;
}

Api::Api(Services services): services_(services) {}

void
Api::recomputeAggregates() {
  if(auto result = services_.aggregates.recompute(); !result) {
    spdlog::error("aggregates not recomputed: {}", result.error().message);
  }
}

void
Api::listHints(const httplib::Request &req, httplib::Response &res) {
  auto data = nlohmann::json::array();
  for(const auto &hint : services_.hints.list(flagParam(req, "active_only"))) {
    data.push_back(toJson(hint));
  }
  sendData(res, 200, data);
}

void
Api::getHint(const httplib::Request &req, httplib::Response &res) {
  auto hint = services_.hints.get(req.path_params.at("id"));
  if(!hint) {
    sendError(res, hint.error());
    return;
  }
  sendData(res, 200, toJson(*hint));
}

void
Api::createHint(const httplib::Request &req, httplib::Response &res) {
  auto data = parseBody(req, res);
  if(!data) {
    return;
  }

  models::NewHint request;

  for(auto [field, target] : {std::pair{"name", &request.name},
                              std::pair{"cel_expression", &request.expression},
                              std::pair{"prefill_name", &request.prefillName}}) {
    auto value = requiredString(*data, field);
    if(!value) {
      sendError(res, value.error());
      return;
    }
    *target = *value;
  }

  auto category = optionalString(*data, "prefill_category_id");
  auto active = optionalBool(*data, "is_active");
  auto order = optionalInt(*data, "display_order");

  for(const auto *error : {category ? nullptr : &category.error(),
                           active ? nullptr : &active.error(),
                           order ? nullptr : &order.error()}) {
    if(error != nullptr) {
      sendError(res, *error);
      return;
    }
  }

  request.prefillCategoryId = *category;
  request.active = active->value_or(true);
  request.displayOrder = *order;

  auto hint = services_.hints.create(request);
  if(!hint) {
    sendError(res, hint.error());
    return;
  }
  sendData(res, 201, toJson(*hint));
}

void
Api::updateHint(const httplib::Request &req, httplib::Response &res) {
  auto data = parseBody(req, res);
  if(!data) {
    return;
  }

  models::HintPatch patch;

  for(auto [field, target] : {std::pair{"name", &patch.name},
                              std::pair{"cel_expression", &patch.expression},
                              std::pair{"prefill_name", &patch.prefillName}}) {
    auto value = optionalString(*data, field);
    if(!value) {
      sendError(res, value.error());
      return;
    }
    *target = *value;
  }

  // An explicit null clears the category; a missing key leaves it alone.
  if(data->contains("prefill_category_id")) {
    auto category = optionalString(*data, "prefill_category_id");
    if(!category) {
      sendError(res, category.error());
      return;
    }
    patch.prefillCategoryId = *category;
  }

  auto active = optionalBool(*data, "is_active");
  if(!active) {
    sendError(res, active.error());
    return;
  }
  patch.active = *active;

  auto order = optionalInt(*data, "display_order");
  if(!order) {
    sendError(res, order.error());
    return;
  }
  patch.displayOrder = *order;

  auto hint = services_.hints.update(req.path_params.at("id"), patch);
  if(!hint) {
    sendError(res, hint.error());
    return;
  }
  sendData(res, 200, toJson(*hint));
}

void
Api::deleteHint(const httplib::Request &req, httplib::Response &res) {
  if(auto error = services_.hints.remove(req.path_params.at("id"))) {
    sendError(res, *error);
    return;
  }
  sendMessage(res, "Event hint deleted");
}

void
Api::reorderHints(const httplib::Request &req, httplib::Response &res) {
  auto data = parseBody(req, res);
  if(!data) {
    return;
  }

  auto ids = stringList(*data, "hint_ids");
  if(!ids) {
    sendError(res, ids.error());
    return;
  }

  if(auto error = services_.hints.reorder(*ids)) {
    sendError(res, *error);
    return;
  }
  sendMessage(res, "Hints reordered");
}

void
Api::validateHint(const httplib::Request &req, httplib::Response &res) {
  auto data = parseBody(req, res);
  if(!data) {
    return;
  }

  auto text = optionalString(*data, "cel_expression");
  if(!text) {
    sendError(res, text.error());
    return;
  }

  auto result = hints::HintStore::validate(text->value_or(""));

  nlohmann::json body{{"is_valid", result.valid}};
  if(result.error) {
    body["error"] = *result.error;
  }
  sendData(res, 200, body);
}

void
Api::evaluateHints(const httplib::Request &req, httplib::Response &res) {
  auto data = parseBody(req, res);
  if(!data) {
    return;
  }

  auto ids = stringList(*data, "line_item_ids");
  if(!ids) {
    sendError(res, ids.error());
    return;
  }

  if(ids->empty()) {
    sendData(res, 200, nlohmann::json{{"suggestion", nullptr}});
    return;
  }

  auto suggestion = services_.matcher.suggestFor(*ids);
  if(!suggestion) {
    sendError(res, suggestion.error());
    return;
  }

  sendData(res, 200, nlohmann::json{
    {"suggestion", *suggestion ? toJson(**suggestion) : nlohmann::json(nullptr)}
  });
}

void
Api::listLineItems(const httplib::Request &req, httplib::Response &res) {
  models::LineItemFilter filter;
  filter.onlyToReview = flagParam(req, "only_line_items_to_review");

  if(req.has_param("payment_method")) {
    auto method = req.get_param_value("payment_method");
    if(method != "All") {
      filter.paymentMethod = method;
    }
  }

  auto items = services_.ledger.list(filter);

  Decimal total;
  for(const auto &item : items) {
    total += item.amount;
  }

  sendJson(res, 200, nlohmann::json{{"total", total.toDouble()}, {"data", lineItemsJson(items)}});
}

void
Api::getLineItem(const httplib::Request &req, httplib::Response &res) {
  auto item = services_.ledger.get(req.path_params.at("id"));
  if(!item) {
    sendError(res, item.error());
    return;
  }
  sendData(res, 200, toJson(*item));
}

void
Api::selectLineItem(const httplib::Request &req, httplib::Response &res) {
  auto item = services_.ledger.toggleSelect(req.path_params.at("id"));
  if(!item) {
    sendError(res, item.error());
    return;
  }
  sendData(res, 200, toJson(*item));
}

void
Api::createCashTransaction(const httplib::Request &req, httplib::Response &res) {
  auto data = parseBody(req, res);
  if(!data) {
    return;
  }

  for(const char *field : {"date", "amount"}) {
    if(!data->contains(field)) {
      sendError(res, invalid(std::format("Missing required field: {}", field)));
      return;
    }
  }

  auto date = dateFrom(data->at("date"), "date");
  if(!date) {
    sendError(res, date.error());
    return;
  }

  auto amount = amountFrom(data->at("amount"), "amount");
  if(!amount) {
    sendError(res, amount.error());
    return;
  }

  auto person = requiredString(*data, "person");
  if(!person) {
    sendError(res, person.error());
    return;
  }

  auto description = requiredString(*data, "description");
  if(!description) {
    sendError(res, description.error());
    return;
  }

  auto method = optionalString(*data, "payment_method");
  if(!method) {
    sendError(res, method.error());
    return;
  }

  models::NewManualItem manual;
  manual.date = *date;
  manual.amount = *amount;
  manual.counterparty = *person;
  manual.description = *description;
  if(*method) {
    manual.paymentMethod = **method;
  }

  auto item = services_.ledger.insertManual(manual);
  if(!item) {
    sendError(res, item.error());
    return;
  }
  sendData(res, 201, toJson(*item));
}

void
Api::deleteCashTransaction(const httplib::Request &req, httplib::Response &res) {
  if(auto error = services_.ledger.deleteManual(req.path_params.at("id"))) {
    sendError(res, *error);
    return;
  }
  sendMessage(res, "Deleted cash transaction");
}

void
Api::listEvents(const httplib::Request &req, httplib::Response &res) {
  auto start = timeParam(req, "start_time");
  if(!start) {
    sendError(res, start.error());
    return;
  }

  auto end = timeParam(req, "end_time");
  if(!end) {
    sendError(res, end.error());
    return;
  }

  auto list = services_.events.list(*start, *end);

  auto data = nlohmann::json::array();
  for(const auto &event : list.events) {
    data.push_back(toJson(event));
  }

  sendJson(res, 200, nlohmann::json{{"total", list.total.toDouble()}, {"data", data}});
}

void
Api::getEvent(const httplib::Request &req, httplib::Response &res) {
  auto event = services_.events.get(req.path_params.at("id"));
  if(!event) {
    sendError(res, event.error());
    return;
  }
  sendData(res, 200, toJson(*event));
}

void
Api::eventLineItems(const httplib::Request &req, httplib::Response &res) {
  auto items = services_.events.lineItemsFor(req.path_params.at("id"));
  if(!items) {
    sendError(res, items.error());
    return;
  }
  sendData(res, 200, lineItemsJson(*items));
}

void
Api::createEvent(const httplib::Request &req, httplib::Response &res) {
  auto data = parseBody(req, res);
  if(!data) {
    return;
  }

  models::NewEvent request;

  auto name = requiredString(*data, "name");
  if(!name) {
    sendError(res, name.error());
    return;
  }
  request.name = *name;

  auto category = optionalString(*data, "category");
  if(!category) {
    sendError(res, category.error());
    return;
  }
  request.categoryId = category->value_or("");

  auto ids = stringList(*data, "line_items");
  if(!ids) {
    sendError(res, ids.error());
    return;
  }
  request.lineItemIds = std::move(*ids);

  if(auto date = data->find("date"); date != data->end() && !date->is_null() &&
     !(date->is_string() && date->get<std::string>().empty())) {
    auto parsed = dateFrom(*date, "date");
    if(!parsed) {
      sendError(res, parsed.error());
      return;
    }
    request.date = *parsed;
  }

  auto duplicate = optionalBool(*data, "is_duplicate_transaction");
  if(!duplicate) {
    sendError(res, duplicate.error());
    return;
  }
  request.isDuplicateTransaction = duplicate->value_or(false);

  auto event = services_.events.create(request);
  if(!event) {
    sendError(res, event.error());
    return;
  }

  recomputeAggregates();
  sendData(res, 201, toJson(*event));
}

void
Api::deleteEvent(const httplib::Request &req, httplib::Response &res) {
  if(auto error = services_.events.remove(req.path_params.at("id"))) {
    sendError(res, *error);
    return;
  }

  recomputeAggregates();
  sendMessage(res, "Deleted event");
}

void
Api::listAccounts(const httplib::Request &, httplib::Response &res) {
  auto data = nlohmann::json::array();
  for(const auto &account : services_.accounts.list()) {
    data.push_back(toJson(account));
  }
  sendData(res, 200, data);
}

void
Api::upsertAccount(const httplib::Request &req, httplib::Response &res) {
  auto data = parseBody(req, res);
  if(!data) {
    return;
  }

  auto id = requiredString(*data, "id");
  auto provider = requiredString(*data, "provider");
  auto displayName = optionalString(*data, "display_name");
  auto status = optionalString(*data, "status");

  for(const auto *error : {id ? nullptr : &id.error(),
                           provider ? nullptr : &provider.error(),
                           displayName ? nullptr : &displayName.error(),
                           status ? nullptr : &status.error()}) {
    if(error != nullptr) {
      sendError(res, *error);
      return;
    }
  }

  models::Account account;
  account.id = *id;
  account.displayName = displayName->value_or(*id);

  auto kind = models::providerFromKey(*provider);
  if(!kind) {
    sendError(res, invalid(std::format("Unknown provider: {}", *provider)));
    return;
  }
  account.provider = *kind;

  if(*status) {
    auto parsed = models::statusFromKey(**status);
    if(!parsed) {
      sendError(res, invalid(std::format("Unknown status: {}", **status)));
      return;
    }
    account.status = *parsed;
  }

  auto stored = services_.accounts.upsert(account);
  if(!stored) {
    sendError(res, stored.error());
    return;
  }

  recomputeAggregates();
  sendData(res, 200, toJson(*stored));
}

void
Api::setAccountStatus(const httplib::Request &req, httplib::Response &res) {
  auto data = parseBody(req, res);
  if(!data) {
    return;
  }

  auto statusName = requiredString(*data, "status");
  if(!statusName) {
    sendError(res, statusName.error());
    return;
  }

  auto status = models::statusFromKey(*statusName);
  if(!status) {
    sendError(res, invalid(std::format("Unknown status: {}", *statusName)));
    return;
  }

  auto account = services_.accounts.setStatus(req.path_params.at("id"), *status);
  if(!account) {
    sendError(res, account.error());
    return;
  }

  recomputeAggregates();
  sendData(res, 200, toJson(*account));
}

void
Api::refreshAll(const httplib::Request &, httplib::Response &res) {
  auto results = services_.orchestrator.refreshAll();

  bool allOk = true;
  auto resultsJson = nlohmann::json::array();

  for(const auto &result : results) {
    allOk = allOk && result.outcome == models::SYNC_OUTCOME::OK;
    resultsJson.push_back(toJson(result));
  }

  sendJson(res, allOk ? 200 : 207, nlohmann::json{
    {"results", resultsJson},
    {"data", lineItemsJson(services_.ledger.listUnreviewed())}
  });
}

void
Api::refreshAccount(const httplib::Request &req, httplib::Response &res) {
  auto providerName = req.path_params.at("provider");
  auto accountId = req.path_params.at("id");

  auto provider = models::providerFromKey(providerName);
  if(!provider) {
    sendError(res, makeError(UNEXPECTED_CODE::NOT_FOUND, std::format("Unknown provider: {}", providerName)));
    return;
  }

  auto account = services_.accounts.get(accountId);
  if(!account) {
    sendError(res, account.error());
    return;
  }

  if(account->provider != *provider) {
    sendError(res, makeError(UNEXPECTED_CODE::NOT_FOUND,
                             std::format("Account {} is not a {} account", accountId, providerName)));
    return;
  }

  auto result = services_.orchestrator.refreshOne(accountId);
  if(!result) {
    sendError(res, result.error());
    return;
  }

  int status = 200;
  if(result->rejected) {
    status = 409;
  } else if(result->timedOut) {
    status = 504;
  } else if(result->outcome != models::SYNC_OUTCOME::OK) {
    status = 502;
  }

  nlohmann::json body{{"result", toJson(*result)}};
  if(status == 200) {
    body["data"] = lineItemsJson(services_.ledger.listUnreviewed());
  }
  sendJson(res, status, body);
}

void
Api::monthlyBreakdown(const httplib::Request &, httplib::Response &res) {
  auto snapshot = services_.aggregates.snapshot();

  auto data = nlohmann::json::object();
  for(const auto &[category, months] : snapshot.monthlyBreakdown) {
    auto series = nlohmann::json::array();
    for(const auto &month : months) {
      series.push_back(nlohmann::json{{"month", month.month}, {"amount", month.amount.toDouble()}});
    }
    data[category] = series;
  }
  sendData(res, 200, data);
}

void
Api::balances(const httplib::Request &, httplib::Response &res) {
  auto snapshot = services_.aggregates.snapshot();

  auto accounts = nlohmann::json::array();
  for(const auto &balance : snapshot.balances) {
    accounts.push_back(nlohmann::json{
      {"account_id", balance.accountId},
      {"display_name", balance.displayName},
      {"balance", balance.balance.toDouble()},
      {"as_of", balance.asOf ? nlohmann::json(*balance.asOf) : nlohmann::json(nullptr)}
    });
  }

  sendData(res, 200, nlohmann::json{{"accounts", accounts}, {"total", snapshot.totalBalance.toDouble()}});
}

void
registerRoutes(httplib::Server &svr, Api &api) {
  auto route = [&api](void (Api::*handler)(const httplib::Request &, httplib::Response &)) {
    return [&api, handler](const httplib::Request &req, httplib::Response &res) {
      (api.*handler)(req, res);
    };
  };

  // Fixed segments are registered before the :id routes they would otherwise match.
  svr.Get("/event-hints", route(&Api::listHints));
  svr.Post("/event-hints/validate", route(&Api::validateHint));
  svr.Post("/event-hints/evaluate", route(&Api::evaluateHints));
  svr.Put("/event-hints/reorder", route(&Api::reorderHints));
  svr.Post("/event-hints", route(&Api::createHint));
  svr.Get("/event-hints/:id", route(&Api::getHint));
  svr.Put("/event-hints/:id", route(&Api::updateHint));
  svr.Delete("/event-hints/:id", route(&Api::deleteHint));

  svr.Get("/line_items", route(&Api::listLineItems));
  svr.Get("/line_items/:id", route(&Api::getLineItem));
  svr.Put("/line_items/:id/select", route(&Api::selectLineItem));

  svr.Post("/cash_transaction", route(&Api::createCashTransaction));
  svr.Delete("/cash_transaction/:id", route(&Api::deleteCashTransaction));

  svr.Get("/events", route(&Api::listEvents));
  svr.Post("/events", route(&Api::createEvent));
  svr.Get("/events/:id", route(&Api::getEvent));
  svr.Get("/events/:id/line_items", route(&Api::eventLineItems));
  svr.Delete("/events/:id", route(&Api::deleteEvent));

  svr.Get("/accounts", route(&Api::listAccounts));
  svr.Post("/accounts", route(&Api::upsertAccount));
  svr.Put("/accounts/:id/status", route(&Api::setAccountStatus));

  svr.Post("/refresh/all", route(&Api::refreshAll));
  svr.Get("/account/:provider/:id/refresh", route(&Api::refreshAccount));

  svr.Get("/monthly_breakdown", route(&Api::monthlyBreakdown));
  svr.Get("/balances", route(&Api::balances));
}

}
