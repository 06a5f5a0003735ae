#pragma once

#include <optional>

#include "httplib.h"
#include "nlohmann/json.hpp"

#include "account_store.hpp"
#include "aggregates.hpp"
#include "event_store.hpp"
#include "hint_matcher.hpp"
#include "hint_store.hpp"
#include "ledger.hpp"
#include "models.hpp"
#include "orchestrator.hpp"
#include "unexpected_codes.hpp"

namespace api {

int
statusFor(UNEXPECTED_CODE code);

nlohmann::json toJson(const models::LineItem &item);
nlohmann::json toJson(const models::Hint &hint);
nlohmann::json toJson(const models::Event &event);
nlohmann::json toJson(const models::Account &account);
nlohmann::json toJson(const models::SyncResult &result);
nlohmann::json toJson(const models::Suggestion &suggestion);

struct Services {
  ledger::Ledger
    &ledger;
  hints::HintStore
    &hints;
  hints::HintMatcher
    &matcher;
  events::EventStore
    &events;
  accounts::AccountStore
    &accounts;
  aggregates::AggregateCache
    &aggregates;
  orchestrator::Orchestrator
    &orchestrator;
};

class Api {
public:
  explicit Api(Services services);

  // event hints
  void listHints(const httplib::Request &req, httplib::Response &res);
  void getHint(const httplib::Request &req, httplib::Response &res);
  void createHint(const httplib::Request &req, httplib::Response &res);
  void updateHint(const httplib::Request &req, httplib::Response &res);
  void deleteHint(const httplib::Request &req, httplib::Response &res);
  void reorderHints(const httplib::Request &req, httplib::Response &res);
  void validateHint(const httplib::Request &req, httplib::Response &res);
  void evaluateHints(const httplib::Request &req, httplib::Response &res);

  // line items
  void listLineItems(const httplib::Request &req, httplib::Response &res);
  void getLineItem(const httplib::Request &req, httplib::Response &res);
  void selectLineItem(const httplib::Request &req, httplib::Response &res);
  void createCashTransaction(const httplib::Request &req, httplib::Response &res);
  void deleteCashTransaction(const httplib::Request &req, httplib::Response &res);

  // events
  void listEvents(const httplib::Request &req, httplib::Response &res);
  void getEvent(const httplib::Request &req, httplib::Response &res);
  void eventLineItems(const httplib::Request &req, httplib::Response &res);
  void createEvent(const httplib::Request &req, httplib::Response &res);
  void deleteEvent(const httplib::Request &req, httplib::Response &res);

  // accounts and sync
  void listAccounts(const httplib::Request &req, httplib::Response &res);
  void upsertAccount(const httplib::Request &req, httplib::Response &res);
  void setAccountStatus(const httplib::Request &req, httplib::Response &res);
  void refreshAll(const httplib::Request &req, httplib::Response &res);
  void refreshAccount(const httplib::Request &req, httplib::Response &res);

  // aggregates
  void monthlyBreakdown(const httplib::Request &req, httplib::Response &res);
  void balances(const httplib::Request &req, httplib::Response &res);

private:
  Services
    services_;

  void recomputeAggregates();
};

void
registerRoutes(httplib::Server &svr, Api &api);

}
