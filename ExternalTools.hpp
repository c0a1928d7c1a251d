#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

// Reads and writes capture time, timezone and GPS tags.
// Implementations throw ToolError when the tool as a whole is unusable and
// RecordError when only the given file is at fault.
class MetadataTool {
 public:
  virtual ~MetadataTool() = default;

  virtual Tags read_tags(const fs::path& path) = 0;
  virtual void write_tags(const fs::path& path, const Tags& tags) = 0;
};

enum class GeotagStatus { TAGGED, NO_MATCH, FAILED };

struct GeotagOutcome {
  GeotagStatus status = GeotagStatus::NO_MATCH;
  std::optional<Coordinate> coordinate;
  std::string message;
};

// Matches image timestamps against track logs and writes coordinates.
// Throws ToolError when the geotagger cannot run at all.
class GeotagTool {
 public:
  virtual ~GeotagTool() = default;

  virtual std::map<fs::path, GeotagOutcome> geotag_batch(
      const std::vector<fs::path>& images,
      const std::vector<fs::path>& track_files) = 0;
};
