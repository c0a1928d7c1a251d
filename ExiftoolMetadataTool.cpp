#include "ExiftoolMetadataTool.hpp"

#include <cmath>
#include <format>

#include "ProcessRunner.hpp"
#include "utils.hpp"

namespace {

std::optional<std::string> json_string(const json& obj, const char* key) {
  if (!obj.contains(key)) return std::nullopt;
  const json& v = obj.at(key);
  if (v.is_string()) {
    std::string s(trim_ascii(v.get<std::string>()));
    if (s.empty()) return std::nullopt;
    return s;
  }
  if (v.is_number()) return v.dump();
  return std::nullopt;
}

std::optional<double> json_number(const json& obj, const char* key) {
  if (!obj.contains(key) || !obj.at(key).is_number()) return std::nullopt;
  return obj.at(key).get<double>();
}

}  // namespace

ExiftoolMetadataTool::ExiftoolMetadataTool(std::string program)
    : m_program(std::move(program)) {}

void ExiftoolMetadataTool::check_exit(int exit_code, const fs::path& path,
                                      const std::string& output) const {
  if (exit_code == 0) return;
  if (exit_code == ProcessRunner::kCommandNotFound || exit_code < 0) {
    throw ToolError(
        std::format("'{}' is not installed or not in PATH", m_program));
  }
  throw RecordError(ErrorKind::IO,
                    std::format("{} failed on '{}': {}", m_program,
                                safe_path_to_string(path), trim_ascii(output)));
}

Tags ExiftoolMetadataTool::read_tags(const fs::path& path) {
  const auto result = ProcessRunner::run(
      m_program,
      {"-j", "-n", "-DateTimeOriginal", "-CreateDate", "-OffsetTimeOriginal",
       "-TimeZone", "-TimeZoneCity", "-DaylightSavings", "-GPSDateStamp",
       "-GPSTimeStamp", "-GPSLatitude", "-GPSLongitude", "-GPSAltitude",
       safe_path_to_string(path)});
  check_exit(result.exit_code, path, result.output);

  json parsed;
  try {
    parsed = json::parse(result.output);
  } catch (const json::exception& e) {
    throw RecordError(ErrorKind::IO,
                      std::format("Unreadable {} output for '{}': {}",
                                  m_program, safe_path_to_string(path),
                                  e.what()));
  }
  if (!parsed.is_array() || parsed.empty()) return {};
  const json& obj = parsed.at(0);

  Tags tags;
  tags.date_time_original = json_string(obj, "DateTimeOriginal");
  if (!tags.date_time_original) {
    tags.date_time_original = json_string(obj, "CreateDate");
  }
  tags.offset_time_original = json_string(obj, "OffsetTimeOriginal");
  if (auto tz = json_number(obj, "TimeZone")) {
    tags.timezone_minutes = static_cast<int>(*tz);
  }
  if (auto city = json_number(obj, "TimeZoneCity")) {
    tags.timezone_city = static_cast<int>(*city);
  }
  if (auto dst = json_number(obj, "DaylightSavings")) {
    tags.daylight_savings = *dst != 0;
  }
  tags.gps_date_stamp = json_string(obj, "GPSDateStamp");
  tags.gps_time_stamp = json_string(obj, "GPSTimeStamp");

  auto lat = json_number(obj, "GPSLatitude");
  auto lon = json_number(obj, "GPSLongitude");
  if (lat && lon) {
    tags.coordinate = Coordinate{*lat, *lon, json_number(obj, "GPSAltitude")};
  }
  return tags;
}

void ExiftoolMetadataTool::write_tags(const fs::path& path, const Tags& tags) {
  std::vector<std::string> args = {"-overwrite_original"};

  if (tags.date_time_original) {
    args.push_back("-AllDates=" + *tags.date_time_original);
  }
  if (tags.offset_time_original) {
    args.push_back("-OffsetTime=" + *tags.offset_time_original);
    args.push_back("-OffsetTimeOriginal=" + *tags.offset_time_original);
    args.push_back("-OffsetTimeDigitized=" + *tags.offset_time_original);
  }
  if (tags.timezone_minutes) {
    args.push_back(std::format("-TimeZone#={}", *tags.timezone_minutes));
  }
  if (tags.timezone_city) {
    args.push_back(std::format("-TimeZoneCity#={}", *tags.timezone_city));
  }
  if (tags.daylight_savings) {
    args.push_back(
        std::format("-DaylightSavings#={}", *tags.daylight_savings ? 60 : 0));
  }
  if (tags.coordinate) {
    const Coordinate& c = *tags.coordinate;
    args.push_back(std::format("-GPSLatitude={:.8f}", std::fabs(c.latitude)));
    args.push_back(
        std::format("-GPSLatitudeRef={}", c.latitude < 0 ? 'S' : 'N'));
    args.push_back(
        std::format("-GPSLongitude={:.8f}", std::fabs(c.longitude)));
    args.push_back(
        std::format("-GPSLongitudeRef={}", c.longitude < 0 ? 'W' : 'E'));
    if (c.altitude) {
      args.push_back(
          std::format("-GPSAltitude={:.2f}", std::fabs(*c.altitude)));
      args.push_back(
          std::format("-GPSAltitudeRef#={}", *c.altitude < 0 ? 1 : 0));
    }
  }

  if (args.size() == 1) return;
  args.push_back(safe_path_to_string(path));

  const auto result = ProcessRunner::run(m_program, args);
  check_exit(result.exit_code, path, result.output);
}
