#pragma once

#include <string>
#include <string_view>
#include <utility>

enum class UNEXPECTED_CODE: unsigned char {
  VALIDATION,
  EVALUATION,
  NOT_FOUND,
  PARTIAL_NOT_FOUND,
  NOT_MANUAL,
  DUPLICATE_ORDER,
  UNKNOWN_ID,
  CONFLICT,
  PROVIDER,
  TIMEOUT,
  BUSY,
  UNKNOWN
};

struct Error {
  UNEXPECTED_CODE
    code = UNEXPECTED_CODE::UNKNOWN;
  std::string
    message;
};

inline Error
makeError(UNEXPECTED_CODE code, std::string message) {
  return Error{code, std::move(message)};
}

std::string_view
codeName(UNEXPECTED_CODE code);
