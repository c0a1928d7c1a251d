#pragma once

#include <functional>
#include <optional>
#include <vector>

#include "types.hpp"

enum class PlanMode {
  // root / <date directory> / <current filename>
  ORGANIZE,
  // <current directory> / <formatted timestamp><extension>
  RENAME
};

// Tells the planner whether a path outside the plan already holds a file.
using OccupiedPredicate = std::function<bool(const fs::path&)>;

class RenamePlanner {
 public:
  explicit RenamePlanner(NamingScheme scheme);

  // Computes the whole mapping for the given records, or throws
  // PlanningError. Never touches the filesystem; `occupied` is only asked
  // about targets that are not the current path of a planned record.
  RenamePlan plan(const std::vector<PhotoRecord>& records,
                  const std::vector<size_t>& indices, PlanMode mode,
                  const fs::path& root,
                  const OccupiedPredicate& occupied = nullptr) const;

  // Target path before disambiguation, or nullopt when the record has no
  // timestamp the scheme can use. A malformed pattern throws
  // std::format_error here and PlanningError from plan().
  std::optional<fs::path> candidate(const PhotoRecord& record, PlanMode mode,
                                    const fs::path& root) const;

 private:
  std::optional<Timestamp> naming_time(const PhotoRecord& record) const;

  NamingScheme m_scheme;
};
