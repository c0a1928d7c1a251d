#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "types.hpp"

// Parses "+02:00", "-0530", "+2", "Z", "UTC", "UTC+01:00" into minutes.
std::optional<int> parse_offset(std::string_view text);

// Immutable city -> offset table, passed explicitly to the resolver.
class TimezoneTable {
 public:
  struct Entry {
    std::string name;
    int offset_minutes;
    int city_id;
  };

  explicit TimezoneTable(std::vector<Entry> entries);

  // The camera "home city" list, with each city's camera id.
  static TimezoneTable builtin();

  // Copy of this table with the config's cities added or replaced.
  TimezoneTable with_overrides(
      const std::unordered_map<std::string, CityEntry>& extra) const;

  const Entry* find(std::string_view name) const;
  const std::vector<Entry>& entries() const { return m_entries; }

 private:
  std::vector<Entry> m_entries;
  std::unordered_map<std::string, size_t> m_exact;
  std::unordered_map<std::string, size_t> m_folded;
};

class TimezoneResolver {
 public:
  explicit TimezoneResolver(TimezoneTable table);

  // City name first (exact, then case-insensitive), then a literal offset.
  // Throws TimezoneError when neither works; there is no fallback zone.
  TimezoneOffset resolve(std::string_view identifier, bool dst = false) const;

  // Offset implied by a camera-local time and a trusted UTC reference,
  // rounded to the nearest 15 minutes.
  TimezoneOffset infer(Timestamp camera_local, Timestamp reference_utc) const;

  // Offset recorded by the camera itself, if any.
  std::optional<TimezoneOffset> detect(const Tags& tags) const;

  const TimezoneTable& table() const { return m_table; }

 private:
  TimezoneTable m_table;
};
