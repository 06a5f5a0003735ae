#include "models.hpp"

namespace models {

std::string_view
providerKey(PROVIDER provider) {
  switch(provider) {
    case PROVIDER::CARD_AGGREGATOR: return "card_aggregator";
    case PROVIDER::PEER_PAYMENT:    return "peer_payment";
    case PROVIDER::EXPENSE_SPLIT:   return "expense_split";
  }
  return "card_aggregator";
}

std::optional<PROVIDER>
providerFromKey(std::string_view key) {
  if(key == "card_aggregator") return PROVIDER::CARD_AGGREGATOR;
  if(key == "peer_payment")    return PROVIDER::PEER_PAYMENT;
  if(key == "expense_split")   return PROVIDER::EXPENSE_SPLIT;
  return std::nullopt;
}

std::string_view
statusKey(ACCOUNT_STATUS status) {
  return status == ACCOUNT_STATUS::ACTIVE ? "active" : "inactive";
}

std::optional<ACCOUNT_STATUS>
statusFromKey(std::string_view key) {
  if(key == "active")   return ACCOUNT_STATUS::ACTIVE;
  if(key == "inactive") return ACCOUNT_STATUS::INACTIVE;
  return std::nullopt;
}

}
