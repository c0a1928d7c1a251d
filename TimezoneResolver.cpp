#include "TimezoneResolver.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <format>

#include "utils.hpp"

namespace {

// Canon TimeZoneCity ids, see exiftool's Canon TimeZoneCity table.
const std::vector<TimezoneTable::Entry>& builtin_entries() {
  static const std::vector<TimezoneTable::Entry> entries = {
      {"Adelaide", 9 * 60 + 30, 5},
      {"Anchorage", -9 * 60, 31},
      {"Austin", -6 * 60, 28},
      {"Azores", -1 * 60, 21},
      {"Bangkok", 7 * 60, 8},
      {"Buenos Aires", -4 * 60, 25},
      {"Cairo", 2 * 60, 18},
      {"Caracas", -(4 * 60 + 30), 26},
      {"Chatham Islands", 12 * 60 + 45, 1},
      {"Chicago", -6 * 60, 28},
      {"Delhi", 5 * 60 + 30, 12},
      {"Denver", -7 * 60, 29},
      {"Dhaka", 6 * 60, 10},
      {"Dubai", 4 * 60, 15},
      {"Dublin", 0, 20},
      {"Fernando de Noronha", -2 * 60, 22},
      {"Galapagos", -6 * 60, 28},
      {"Hong Kong", 8 * 60, 7},
      {"Honolulu", -10 * 60, 32},
      {"Kabul", 4 * 60 + 30, 14},
      {"Karachi", 5 * 60, 13},
      {"Kathmandu", 5 * 60 + 45, 11},
      {"Kiev", 2 * 60, 17},
      {"London", 0, 20},
      {"Los Angeles", -8 * 60, 30},
      {"Mexico City", -6 * 60, 28},
      {"Moscow", 4 * 60, 17},
      {"New York", -5 * 60, 27},
      {"Newfoundland", -(3 * 60 + 30), 24},
      {"Paris", 1 * 60, 19},
      {"Quintana Roo", -5 * 60, 27},
      {"Quito", -5 * 60, 27},
      {"Rome", 1 * 60, 19},
      {"Samoa", 13 * 60, 33},
      {"San Francisco", -8 * 60, 30},
      {"Santiago", -4 * 60, 25},
      {"Sao Paulo", -3 * 60, 23},
      {"Singapore", 8 * 60, 7},
      {"Solomon Islands", 11 * 60, 3},
      {"Sydney", 10 * 60, 4},
      {"Tehran", 3 * 60 + 30, 16},
      {"Tokyo", 9 * 60, 6},
      {"US/Central", -6 * 60, 28},
      {"US/Eastern", -5 * 60, 27},
      {"US/Pacific", -8 * 60, 30},
      {"Wellington", 12 * 60, 2},
      {"Yangon", 6 * 60 + 30, 9},
  };
  return entries;
}

bool all_digits(std::string_view sv) {
  if (sv.empty()) return false;
  for (char c : sv) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

int to_int(std::string_view sv) {
  int value = 0;
  for (char c : sv) value = value * 10 + (c - '0');
  return value;
}

}  // namespace

std::optional<int> parse_offset(std::string_view text) {
  text = trim_ascii(text);
  const std::string lower = string_to_lower_ascii(text);
  if (lower == "z" || lower == "utc" || lower == "gmt") return 0;
  if (lower.starts_with("utc") || lower.starts_with("gmt")) {
    text.remove_prefix(3);
  }
  if (text.empty()) return std::nullopt;

  int sign = 1;
  if (text[0] == '+' || text[0] == '-') {
    sign = text[0] == '-' ? -1 : 1;
    text.remove_prefix(1);
  }

  std::string_view hours;
  std::string_view mins = "0";
  if (auto colon = text.find(':'); colon != std::string_view::npos) {
    hours = text.substr(0, colon);
    mins = text.substr(colon + 1);
  } else if (text.size() == 4) {
    hours = text.substr(0, 2);
    mins = text.substr(2);
  } else if (text.size() <= 2) {
    hours = text;
  } else {
    return std::nullopt;
  }

  if (!all_digits(hours) || !all_digits(mins) || hours.size() > 2 ||
      mins.size() != (mins == "0" ? 1u : 2u)) {
    return std::nullopt;
  }
  const int h = to_int(hours);
  const int m = to_int(mins);
  if (m >= 60) return std::nullopt;
  return sign * (h * 60 + m);
}

TimezoneTable::TimezoneTable(std::vector<Entry> entries)
    : m_entries(std::move(entries)) {
  for (size_t i = 0; i < m_entries.size(); ++i) {
    m_exact[m_entries[i].name] = i;
    m_folded.emplace(string_to_lower_ascii(m_entries[i].name), i);
  }
}

TimezoneTable TimezoneTable::builtin() {
  return TimezoneTable(builtin_entries());
}

TimezoneTable TimezoneTable::with_overrides(
    const std::unordered_map<std::string, CityEntry>& extra) const {
  std::vector<Entry> merged = m_entries;
  for (const auto& [name, city] : extra) {
    auto it = std::find_if(merged.begin(), merged.end(),
                           [&](const Entry& e) { return e.name == name; });
    if (it != merged.end()) {
      it->offset_minutes = city.offset_minutes;
      it->city_id = city.id;
    } else {
      merged.push_back({name, city.offset_minutes, city.id});
    }
  }
  return TimezoneTable(std::move(merged));
}

const TimezoneTable::Entry* TimezoneTable::find(std::string_view name) const {
  const std::string key(trim_ascii(name));
  if (auto it = m_exact.find(key); it != m_exact.end()) {
    return &m_entries[it->second];
  }
  if (auto it = m_folded.find(string_to_lower_ascii(key));
      it != m_folded.end()) {
    return &m_entries[it->second];
  }
  return nullptr;
}

TimezoneResolver::TimezoneResolver(TimezoneTable table)
    : m_table(std::move(table)) {}

TimezoneOffset TimezoneResolver::resolve(std::string_view identifier,
                                         bool dst) const {
  const int dst_minutes = dst ? 60 : 0;
  if (const auto* entry = m_table.find(identifier)) {
    return TimezoneOffset(entry->offset_minutes + dst_minutes, entry->name,
                          entry->city_id, dst);
  }
  if (auto minutes = parse_offset(identifier)) {
    return TimezoneOffset(*minutes + dst_minutes,
                          std::string(trim_ascii(identifier)), std::nullopt,
                          dst);
  }
  throw TimezoneError(
      std::format("Unknown timezone '{}': not a known city and not an offset",
                  identifier));
}

TimezoneOffset TimezoneResolver::infer(Timestamp camera_local,
                                       Timestamp reference_utc) const {
  using namespace std::chrono;
  const auto delta = duration_cast<seconds>(camera_local - reference_utc);
  const double quarters = static_cast<double>(delta.count()) / (15.0 * 60.0);
  const int minutes = static_cast<int>(std::lround(quarters)) * 15;
  return TimezoneOffset(minutes, "inferred");
}

std::optional<TimezoneOffset> TimezoneResolver::detect(const Tags& tags) const {
  const auto in_range = [](int minutes) {
    return minutes >= TimezoneOffset::kMinMinutes &&
           minutes <= TimezoneOffset::kMaxMinutes;
  };
  const bool dst = tags.daylight_savings.value_or(false);
  if (tags.offset_time_original) {
    auto minutes = parse_offset(*tags.offset_time_original);
    if (minutes && in_range(*minutes)) {
      return TimezoneOffset(*minutes, "OffsetTimeOriginal", tags.timezone_city,
                            dst);
    }
  }
  if (tags.timezone_minutes) {
    const int minutes = *tags.timezone_minutes + (dst ? 60 : 0);
    if (in_range(minutes)) {
      return TimezoneOffset(minutes, "TimeZone", tags.timezone_city, dst);
    }
  }
  return std::nullopt;
}
