#pragma once

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "Errors.hpp"
#include "Timestamp.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

enum class Stage { SHIFT_TO_UTC, ORGANIZE, GEOTAG, SET_TIME, RENAME };
NLOHMANN_JSON_SERIALIZE_ENUM(Stage, {{Stage::SHIFT_TO_UTC, "shift-to-utc"},
                                     {Stage::ORGANIZE, "organize"},
                                     {Stage::GEOTAG, "geotag"},
                                     {Stage::SET_TIME, "set-time"},
                                     {Stage::RENAME, "rename"}});

inline std::string to_string(Stage stage) {
  return json(stage).get<std::string>();
}

inline std::optional<Stage> parse_stage(const std::string& name) {
  for (Stage s : {Stage::SHIFT_TO_UTC, Stage::ORGANIZE, Stage::GEOTAG,
                  Stage::SET_TIME, Stage::RENAME}) {
    if (to_string(s) == name) return s;
  }
  return std::nullopt;
}

// Ordered stages to execute in one run.
using PipelineSpec = std::vector<Stage>;

inline PipelineSpec process_pipeline() {
  return {Stage::SHIFT_TO_UTC, Stage::ORGANIZE, Stage::GEOTAG, Stage::SET_TIME,
          Stage::RENAME};
}

enum class StageStatus { PENDING, SUCCESS, FAILED, SKIPPED };
NLOHMANN_JSON_SERIALIZE_ENUM(StageStatus, {{StageStatus::PENDING, "pending"},
                                           {StageStatus::SUCCESS, "success"},
                                           {StageStatus::FAILED, "failed"},
                                           {StageStatus::SKIPPED, "skipped"}});

struct StageResult {
  StageStatus status = StageStatus::PENDING;
  ErrorKind error = ErrorKind::NONE;
  std::string message;

  static StageResult success(std::string note = {}) {
    return {StageStatus::SUCCESS, ErrorKind::NONE, std::move(note)};
  }
  static StageResult skipped(std::string note,
                             ErrorKind reason = ErrorKind::NONE) {
    return {StageStatus::SKIPPED, reason, std::move(note)};
  }
  static StageResult failure(ErrorKind kind, std::string message) {
    return {StageStatus::FAILED, kind, std::move(message)};
  }
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(StageResult, status, error, message);

struct Coordinate {
  double latitude = 0.0;
  double longitude = 0.0;
  std::optional<double> altitude;

  bool operator==(const Coordinate&) const = default;
};

inline void to_json(json& j, const Coordinate& c) {
  j = json{{"latitude", c.latitude}, {"longitude", c.longitude}};
  if (c.altitude) j["altitude"] = *c.altitude;
}

inline void from_json(const json& j, Coordinate& c) {
  j.at("latitude").get_to(c.latitude);
  j.at("longitude").get_to(c.longitude);
  if (j.contains("altitude")) c.altitude = j.at("altitude").get<double>();
}

// "+05:30" style.
std::string format_offset(int minutes);

// A signed UTC offset. Once built it never changes; the constructor enforces
// the -12:00..+14:00 range of real-world zones.
class TimezoneOffset {
 public:
  static constexpr int kMinMinutes = -12 * 60;
  static constexpr int kMaxMinutes = 14 * 60;

  TimezoneOffset(int minutes, std::string label,
                 std::optional<int> city_id = std::nullopt, bool dst = false);

  static TimezoneOffset utc() { return TimezoneOffset(0, "UTC"); }

  int minutes() const { return m_minutes; }
  std::chrono::minutes duration() const {
    return std::chrono::minutes(m_minutes);
  }
  const std::string& label() const { return m_label; }
  std::optional<int> city_id() const { return m_city_id; }
  bool dst() const { return m_dst; }

  // "+02:00" style.
  std::string to_string() const;

  bool operator==(const TimezoneOffset& other) const {
    return m_minutes == other.m_minutes;
  }

 private:
  int m_minutes;
  std::string m_label;
  std::optional<int> m_city_id;
  bool m_dst;
};

void to_json(json& j, const TimezoneOffset& tz);
TimezoneOffset timezone_offset_from_json(const json& j);

// Tag values as read from or written to a file by the metadata tool. Unset
// fields are neither read nor touched on write.
struct Tags {
  std::optional<std::string> date_time_original;
  std::optional<std::string> offset_time_original;
  std::optional<int> timezone_minutes;
  std::optional<int> timezone_city;
  std::optional<bool> daylight_savings;
  std::optional<std::string> gps_date_stamp;
  std::optional<std::string> gps_time_stamp;
  std::optional<Coordinate> coordinate;
};

struct PhotoRecord {
  fs::path original_path;
  fs::path current_path;
  std::optional<std::string> capture_raw;
  std::optional<Timestamp> local_time;
  std::optional<Timestamp> utc_time;
  bool utc_shift_applied = false;
  std::optional<TimezoneOffset> camera_offset;
  std::optional<Timestamp> gps_time;
  std::optional<Coordinate> coordinate;
  std::optional<TimezoneOffset> applied_offset;
  std::map<Stage, StageResult> outcomes;
  // Set when the tags could not be read at load. Not persisted.
  std::optional<std::string> read_error;

  const StageResult& outcome(Stage stage) const;
  bool has_failure() const;
};

void to_json(json& j, const PhotoRecord& r);
void from_json(const json& j, PhotoRecord& r);

enum class ActionType { MOVE };
NLOHMANN_JSON_SERIALIZE_ENUM(ActionType, {{ActionType::MOVE, "MOVE"}});
struct JournalEntry {
  ActionType action;
  fs::path from;
  fs::path to;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(JournalEntry, action, from, to);

struct PlannedMove {
  size_t record;
  fs::path from;
  fs::path to;
};

// A checked, batch-wide mapping. Targets are pairwise distinct and moves are
// listed in an order that never overwrites a pending source.
struct RenamePlan {
  std::vector<PlannedMove> moves;
  // Records whose target equals their current path.
  std::vector<size_t> unchanged;
  // Records that had no usable timestamp and were left out.
  std::vector<size_t> unplannable;
};

enum class RunState { NOT_STARTED, RUNNING, COMPLETED, ABORTED };
NLOHMANN_JSON_SERIALIZE_ENUM(RunState, {{RunState::NOT_STARTED, "NotStarted"},
                                        {RunState::RUNNING, "Running"},
                                        {RunState::COMPLETED, "Completed"},
                                        {RunState::ABORTED, "Aborted"}});

struct BatchReport {
  RunState state = RunState::NOT_STARTED;
  PipelineSpec pipeline;
  size_t stage_index = 0;
  std::optional<Stage> aborted_stage;
  std::string abort_reason;
  std::optional<std::string> camera_timezone;
  std::optional<std::string> target_timezone;
  bool dry_run = false;
  std::vector<PhotoRecord> records;
  std::vector<JournalEntry> moves;

  size_t failed_records() const;
};

void to_json(json& j, const BatchReport& r);
void from_json(const json& j, BatchReport& r);

struct NamingScheme {
  std::string directory_format = "%Y-%m-%d";
  std::string file_format = "%Y-%m-%d_%H-%M-%S";
  std::string sequence_format = "_{}";
  bool lowercase_extension = true;
  bool use_local_time = false;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(NamingScheme, directory_format,
                                                file_format, sequence_format,
                                                lowercase_extension,
                                                use_local_time);

struct CityEntry {
  int offset_minutes;
  int id;
};

struct Config {
  std::vector<std::string> suffixes = {"jpg", "jpeg", "mp4"};
  int timerange = 10;
  unsigned concurrency = 4;
  bool dry_run = false;
  NamingScheme naming;
  std::unordered_map<std::string, CityEntry> timezones;
  // "exiv2" or "exiftool".
  std::string metadata_tool = "exiv2";
  std::string geotag_command = "gpicsync";
  std::string report_name = "photo_process_report.json";
  fs::path log_file = "photo_process.log";
};
