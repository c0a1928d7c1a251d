#pragma once

#include <map>
#include <optional>
#include <string>

#include "types.hpp"

// Run summary as terminal text: the run state, per-stage counts and one row
// per failed record/stage pair.
std::string render_report(const BatchReport& report);

// One row per directory with the camera offset found for it.
std::string render_offsets(
    const std::map<fs::path, std::optional<TimezoneOffset>>& offsets);
