#include "Timestamp.hpp"

#include <cctype>
#include <format>

namespace {

bool read_number(std::string_view text, size_t pos, size_t width, int& out) {
  if (pos + width > text.size()) return false;
  int value = 0;
  for (size_t i = pos; i < pos + width; ++i) {
    const unsigned char c = static_cast<unsigned char>(text[i]);
    if (!std::isdigit(c)) return false;
    value = value * 10 + (c - '0');
  }
  out = value;
  return true;
}

std::optional<Timestamp> make_timestamp(int y, int mo, int d, int h, int mi,
                                        int s) {
  using namespace std::chrono;
  const year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)},
                           day{static_cast<unsigned>(d)}};
  if (!ymd.ok() || h > 23 || mi > 59 || s > 60) return std::nullopt;
  return sys_days{ymd} + hours{h} + minutes{mi} + seconds{s};
}

}  // namespace

std::optional<Timestamp> parse_exif_timestamp(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text[0]))) {
    text.remove_prefix(1);
  }
  // "YYYY:MM:DD HH:MM:SS" is 19 characters.
  if (text.size() < 19) return std::nullopt;

  const char date_sep = text[4];
  if ((date_sep != ':' && date_sep != '-') || text[7] != date_sep) {
    return std::nullopt;
  }
  if (text[10] != ' ' && text[10] != 'T') return std::nullopt;
  if (text[13] != ':' || text[16] != ':') return std::nullopt;

  int y, mo, d, h, mi, s;
  if (!read_number(text, 0, 4, y) || !read_number(text, 5, 2, mo) ||
      !read_number(text, 8, 2, d) || !read_number(text, 11, 2, h) ||
      !read_number(text, 14, 2, mi) || !read_number(text, 17, 2, s)) {
    return std::nullopt;
  }
  return make_timestamp(y, mo, d, h, mi, s);
}

std::optional<Timestamp> parse_gps_timestamp(std::string_view date,
                                             std::string_view time) {
  if (date.size() < 10 || time.size() < 8) return std::nullopt;
  int y, mo, d, h, mi, s;
  if (!read_number(date, 0, 4, y) || !read_number(date, 5, 2, mo) ||
      !read_number(date, 8, 2, d) || !read_number(time, 0, 2, h) ||
      !read_number(time, 3, 2, mi) || !read_number(time, 6, 2, s)) {
    return std::nullopt;
  }
  return make_timestamp(y, mo, d, h, mi, s);
}

std::string format_exif_timestamp(Timestamp ts) {
  return std::format("{:%Y:%m:%d %H:%M:%S}", ts);
}

std::string format_iso_timestamp(Timestamp ts) {
  return std::format("{:%Y-%m-%dT%H:%M:%S}", ts);
}

std::string format_timestamp(Timestamp ts, std::string_view pattern) {
  const std::string spec = std::format("{{:{}}}", pattern);
  return std::vformat(spec, std::make_format_args(ts));
}
