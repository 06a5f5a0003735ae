#include "unexpected_codes.hpp"

std::string_view
codeName(UNEXPECTED_CODE code) {
  switch(code) {
    case UNEXPECTED_CODE::VALIDATION:        return "validation";
    case UNEXPECTED_CODE::EVALUATION:        return "evaluation";
    case UNEXPECTED_CODE::NOT_FOUND:         return "not_found";
    case UNEXPECTED_CODE::PARTIAL_NOT_FOUND: return "partial_not_found";
    case UNEXPECTED_CODE::NOT_MANUAL:        return "not_manual";
    case UNEXPECTED_CODE::DUPLICATE_ORDER:   return "duplicate_order";
    case UNEXPECTED_CODE::UNKNOWN_ID:        return "unknown_id";
    case UNEXPECTED_CODE::CONFLICT:          return "conflict";
    case UNEXPECTED_CODE::PROVIDER:          return "provider";
    case UNEXPECTED_CODE::TIMEOUT:           return "timeout";
    case UNEXPECTED_CODE::BUSY:              return "busy";
    case UNEXPECTED_CODE::UNKNOWN:           return "unknown";
  }
  return "unknown";
}
