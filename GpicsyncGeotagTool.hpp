#pragma once

#include <string>

#include "ExternalTools.hpp"

// Runs gpicsync once per image directory and track file, then reads the
// written coordinates back through the metadata tool to report per image.
class GpicsyncGeotagTool : public GeotagTool {
 public:
  GpicsyncGeotagTool(MetadataTool& metadata, std::string program,
                     int time_range_seconds);

  std::map<fs::path, GeotagOutcome> geotag_batch(
      const std::vector<fs::path>& images,
      const std::vector<fs::path>& track_files) override;

 private:
  MetadataTool& m_metadata;
  std::string m_program;
  int m_time_range;
};
