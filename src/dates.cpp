#include "dates.hpp"

#include <charconv>
#include <chrono>
#include <format>

namespace dates {

namespace {

bool
readNumber(std::string_view text, std::size_t offset, std::size_t width, int &out) {
  if(offset + width > text.size()) {
    return false;
  }
  auto begin = text.data() + offset;
  auto [end, ec] = std::from_chars(begin, begin + width, out);
  return ec == std::errc{} && end == begin + width;
}

}

std::optional<std::int64_t>
parseIso(std::string_view text) {
  using namespace std::chrono;

  int y = 0, m = 0, d = 0;
  if(text.size() < 10 || text[4] != '-' || text[7] != '-' ||
     !readNumber(text, 0, 4, y) || !readNumber(text, 5, 2, m) || !readNumber(text, 8, 2, d)) {
    return std::nullopt;
  }

  const year_month_day date{year{y}, month{static_cast<unsigned>(m)}, day{static_cast<unsigned>(d)}};
  if(!date.ok()) {
    return std::nullopt;
  }

  int hh = 0, mm = 0, ss = 0;
  if(text.size() > 10) {
    if((text[10] != 'T' && text[10] != ' ') ||
       !readNumber(text, 11, 2, hh) || text.size() < 16 || text[13] != ':' ||
       !readNumber(text, 14, 2, mm)) {
      return std::nullopt;
    }
    if(text.size() > 16 && text[16] == ':' && !readNumber(text, 17, 2, ss)) {
      return std::nullopt;
    }
    if(hh > 23 || mm > 59 || ss > 60) {
      return std::nullopt;
    }
  }

  auto point = sys_days{date} + hours{hh} + minutes{mm} + seconds{ss};
  return point.time_since_epoch().count();
}

std::string
formatDay(std::int64_t timestamp) {
  using namespace std::chrono;
  return std::format("{:%F}", floor<days>(sys_seconds{seconds{timestamp}}));
}

}
