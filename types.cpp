#include "types.hpp"

#include <algorithm>
#include <cstdlib>
#include <format>
#include <stdexcept>

namespace {

void put_timestamp(json& j, const char* key,
                   const std::optional<Timestamp>& ts) {
  if (ts) j[key] = format_iso_timestamp(*ts);
}

std::optional<Timestamp> get_timestamp(const json& j, const char* key) {
  if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
  auto ts = parse_exif_timestamp(j.at(key).get<std::string>());
  if (!ts) {
    throw std::invalid_argument(
        std::format("invalid timestamp in field '{}'", key));
  }
  return ts;
}

std::optional<TimezoneOffset> get_offset(const json& j, const char* key) {
  if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
  return timezone_offset_from_json(j.at(key));
}

}  // namespace

TimezoneOffset::TimezoneOffset(int minutes, std::string label,
                               std::optional<int> city_id, bool dst)
    : m_minutes(minutes),
      m_label(std::move(label)),
      m_city_id(city_id),
      m_dst(dst) {
  if (minutes < kMinMinutes || minutes > kMaxMinutes) {
    throw TimezoneError(std::format(
        "Offset {} minutes for '{}' is outside -12:00..+14:00", minutes,
        m_label));
  }
}

std::string format_offset(int minutes) {
  const int abs_minutes = std::abs(minutes);
  return std::format("{}{:02}:{:02}", minutes < 0 ? '-' : '+',
                     abs_minutes / 60, abs_minutes % 60);
}

std::string TimezoneOffset::to_string() const {
  return format_offset(m_minutes);
}

void to_json(json& j, const TimezoneOffset& tz) {
  j = json{{"minutes", tz.minutes()},
           {"offset", tz.to_string()},
           {"label", tz.label()},
           {"dst", tz.dst()}};
  if (tz.city_id()) j["city_id"] = *tz.city_id();
}

TimezoneOffset timezone_offset_from_json(const json& j) {
  std::optional<int> city_id;
  if (j.contains("city_id")) city_id = j.at("city_id").get<int>();
  return TimezoneOffset(j.at("minutes").get<int>(),
                        j.value("label", std::string{}), city_id,
                        j.value("dst", false));
}

const StageResult& PhotoRecord::outcome(Stage stage) const {
  static const StageResult pending;
  auto it = outcomes.find(stage);
  return it == outcomes.end() ? pending : it->second;
}

bool PhotoRecord::has_failure() const {
  return std::any_of(outcomes.begin(), outcomes.end(), [](const auto& pair) {
    return pair.second.status == StageStatus::FAILED;
  });
}

void to_json(json& j, const PhotoRecord& r) {
  j = json{{"original_path", r.original_path},
           {"current_path", r.current_path},
           {"utc_shift_applied", r.utc_shift_applied}};
  if (r.capture_raw) j["capture_raw"] = *r.capture_raw;
  put_timestamp(j, "local_time", r.local_time);
  put_timestamp(j, "utc_time", r.utc_time);
  put_timestamp(j, "gps_time", r.gps_time);
  if (r.camera_offset) j["camera_offset"] = *r.camera_offset;
  if (r.applied_offset) j["applied_offset"] = *r.applied_offset;
  if (r.coordinate) j["coordinate"] = *r.coordinate;

  json outcomes = json::object();
  for (const auto& [stage, result] : r.outcomes) {
    outcomes[to_string(stage)] = result;
  }
  j["outcomes"] = std::move(outcomes);
}

void from_json(const json& j, PhotoRecord& r) {
  j.at("original_path").get_to(r.original_path);
  j.at("current_path").get_to(r.current_path);
  r.utc_shift_applied = j.value("utc_shift_applied", false);
  if (j.contains("capture_raw")) {
    r.capture_raw = j.at("capture_raw").get<std::string>();
  }
  r.local_time = get_timestamp(j, "local_time");
  r.utc_time = get_timestamp(j, "utc_time");
  r.gps_time = get_timestamp(j, "gps_time");
  r.camera_offset = get_offset(j, "camera_offset");
  r.applied_offset = get_offset(j, "applied_offset");
  if (j.contains("coordinate")) {
    r.coordinate = j.at("coordinate").get<Coordinate>();
  }
  r.outcomes.clear();
  if (j.contains("outcomes")) {
    for (const auto& [name, result] : j.at("outcomes").items()) {
      if (auto stage = parse_stage(name)) {
        r.outcomes[*stage] = result.get<StageResult>();
      }
    }
  }
}

size_t BatchReport::failed_records() const {
  return static_cast<size_t>(
      std::count_if(records.begin(), records.end(),
                    [](const PhotoRecord& r) { return r.has_failure(); }));
}

void to_json(json& j, const BatchReport& r) {
  j = json{{"state", r.state},
           {"pipeline", r.pipeline},
           {"stage_index", r.stage_index},
           {"abort_reason", r.abort_reason},
           {"dry_run", r.dry_run},
           {"records", r.records},
           {"moves", r.moves}};
  if (r.aborted_stage) j["aborted_stage"] = *r.aborted_stage;
  if (r.camera_timezone) j["camera_timezone"] = *r.camera_timezone;
  if (r.target_timezone) j["target_timezone"] = *r.target_timezone;
}

void from_json(const json& j, BatchReport& r) {
  j.at("state").get_to(r.state);
  j.at("pipeline").get_to(r.pipeline);
  r.stage_index = j.value("stage_index", size_t{0});
  r.abort_reason = j.value("abort_reason", std::string{});
  r.dry_run = j.value("dry_run", false);
  r.aborted_stage.reset();
  if (j.contains("aborted_stage")) {
    r.aborted_stage = j.at("aborted_stage").get<Stage>();
  }
  if (j.contains("camera_timezone")) {
    r.camera_timezone = j.at("camera_timezone").get<std::string>();
  }
  if (j.contains("target_timezone")) {
    r.target_timezone = j.at("target_timezone").get<std::string>();
  }
  j.at("records").get_to(r.records);
  r.moves = j.value("moves", std::vector<JournalEntry>{});
}
