#include "GpicsyncGeotagTool.hpp"

#include <format>
#include <set>

#include "IOManager.hpp"
#include "ProcessRunner.hpp"
#include "utils.hpp"

GpicsyncGeotagTool::GpicsyncGeotagTool(MetadataTool& metadata,
                                       std::string program,
                                       int time_range_seconds)
    : m_metadata(metadata),
      m_program(std::move(program)),
      m_time_range(time_range_seconds) {}

std::map<fs::path, GeotagOutcome> GpicsyncGeotagTool::geotag_batch(
    const std::vector<fs::path>& images,
    const std::vector<fs::path>& track_files) {
  std::map<fs::path, GeotagOutcome> outcomes;
  if (images.empty()) return outcomes;
  if (track_files.empty()) {
    for (const auto& image : images) {
      outcomes[image] = {GeotagStatus::NO_MATCH, std::nullopt,
                         "no track files"};
    }
    return outcomes;
  }

  if (!ProcessRunner::has_tool(m_program)) {
    throw ToolError(
        std::format("'{}' is not installed or not in PATH", m_program));
  }

  std::set<fs::path> dirs;
  for (const auto& image : images) dirs.insert(image.parent_path());

  // gpicsync works on whole directories and expects UTC photo times.
  for (const auto& dir : dirs) {
    for (const auto& track : track_files) {
      const auto result = ProcessRunner::run(
          m_program, {"-g", safe_path_to_string(track), "-z", "UTC", "-d",
                      safe_path_to_string(dir), "--time-range",
                      std::to_string(m_time_range)});
      if (result.exit_code != 0) {
        throw ToolError(std::format(
            "{} exited with status {} on '{}': {}", m_program,
            result.exit_code, safe_path_to_string(dir),
            trim_ascii(result.output)));
      }
    }
  }

  for (const auto& image : images) {
    try {
      const Tags tags = m_metadata.read_tags(image);
      if (tags.coordinate) {
        outcomes[image] = {GeotagStatus::TAGGED, tags.coordinate, ""};
      } else {
        outcomes[image] = {GeotagStatus::NO_MATCH, std::nullopt,
                           "no track point in range"};
      }
    } catch (const RecordError& e) {
      outcomes[image] = {GeotagStatus::FAILED, std::nullopt, e.what()};
    }
  }
  return outcomes;
}
