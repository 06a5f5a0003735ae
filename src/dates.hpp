#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace dates {

// "YYYY-MM-DD", optionally followed by "THH:MM[:SS]" and a trailing "Z" or
// fractional part, read as UTC. Returns Unix seconds.
std::optional<std::int64_t>
parseIso(std::string_view text);

// "YYYY-MM-DD" in UTC.
std::string
formatDay(std::int64_t timestamp);

}
