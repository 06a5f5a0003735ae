#pragma once

#include <string>
#include <string_view>

namespace ids {

// "<prefix>_<ulid>": 48-bit millisecond timestamp followed by 80 random bits,
// Crockford base32, so ids sort by creation time.
std::string
generateId(std::string_view prefix);

}
