#include "RenamePlanner.hpp"

#include <algorithm>
#include <format>
#include <map>
#include <set>

#include "utils.hpp"

namespace {

// Disambiguation order: original filename, then the full original path for
// files that share a name across directories.
bool disambiguation_less(const PhotoRecord& a, const PhotoRecord& b) {
  const std::string name_a = safe_path_to_string(a.original_path.filename());
  const std::string name_b = safe_path_to_string(b.original_path.filename());
  if (name_a != name_b) return name_a < name_b;
  return safe_path_to_string(a.original_path) <
         safe_path_to_string(b.original_path);
}

}  // namespace

RenamePlanner::RenamePlanner(NamingScheme scheme)
    : m_scheme(std::move(scheme)) {}

std::optional<Timestamp> RenamePlanner::naming_time(
    const PhotoRecord& record) const {
  if (m_scheme.use_local_time) {
    return record.applied_offset ? record.local_time : std::nullopt;
  }
  return record.utc_time;
}

std::optional<fs::path> RenamePlanner::candidate(const PhotoRecord& record,
                                                 PlanMode mode,
                                                 const fs::path& root) const {
  const auto ts = naming_time(record);
  if (!ts) return std::nullopt;

  if (mode == PlanMode::ORGANIZE) {
    const fs::path day_dir =
        path_from_utf8(format_timestamp(*ts, m_scheme.directory_format));
    return root / day_dir / record.current_path.filename();
  }

  std::string ext = safe_path_to_string(record.current_path.extension());
  if (m_scheme.lowercase_extension) ext = string_to_lower_ascii(ext);
  return record.current_path.parent_path() /
         path_from_utf8(format_timestamp(*ts, m_scheme.file_format) + ext);
}

RenamePlan RenamePlanner::plan(const std::vector<PhotoRecord>& records,
                               const std::vector<size_t>& indices,
                               PlanMode mode, const fs::path& root,
                               const OccupiedPredicate& occupied) const {
  RenamePlan result;

  // 1. Candidate per record.
  std::map<fs::path, std::vector<size_t>> by_candidate;
  std::map<size_t, fs::path> target_of;
  try {
    for (size_t i : indices) {
      if (auto target = candidate(records.at(i), mode, root)) {
        by_candidate[*target].push_back(i);
      } else {
        result.unplannable.push_back(i);
      }
    }

    // 2. Stable disambiguation inside each colliding group.
    for (auto& [path, group] : by_candidate) {
      std::sort(group.begin(), group.end(), [&](size_t a, size_t b) {
        return disambiguation_less(records[a], records[b]);
      });
      for (size_t n = 0; n < group.size(); ++n) {
        target_of[group[n]] =
            n == 0 ? path
                   : with_sequence_suffix(path, n + 1,
                                          m_scheme.sequence_format);
      }
    }
  } catch (const std::format_error& e) {
    throw PlanningError(std::format("invalid naming pattern: {}", e.what()));
  }

  // 3. Whatever still collides fails the whole plan.
  std::map<fs::path, size_t> claimed;
  for (const auto& [i, target] : target_of) {
    auto [it, inserted] = claimed.emplace(target, i);
    if (!inserted) {
      throw PlanningError(std::format(
          "'{}' and '{}' both map to '{}'",
          safe_path_to_string(records[it->second].current_path),
          safe_path_to_string(records[i].current_path),
          safe_path_to_string(target)));
    }
  }

  std::map<fs::path, size_t> source_of;
  for (const auto& [i, target] : target_of) {
    source_of[records[i].current_path] = i;
  }

  std::vector<PlannedMove> pending;
  for (const auto& [i, target] : target_of) {
    const fs::path& from = records[i].current_path;
    if (from == target) {
      result.unchanged.push_back(i);
      continue;
    }
    if (!source_of.contains(target) && occupied && occupied(target)) {
      throw PlanningError(
          std::format("'{}' would overwrite existing file '{}'",
                      safe_path_to_string(from), safe_path_to_string(target)));
    }
    pending.push_back({i, from, target});
  }

  // 4. Order the moves so no move lands on a source that has not moved yet.
  std::sort(pending.begin(), pending.end(),
            [](const PlannedMove& a, const PlannedMove& b) {
              return a.from < b.from;
            });
  std::set<fs::path> unmoved;
  for (const auto& move : pending) unmoved.insert(move.from);

  while (!pending.empty()) {
    auto ready = std::find_if(
        pending.begin(), pending.end(),
        [&](const PlannedMove& m) { return !unmoved.contains(m.to); });
    if (ready == pending.end()) {
      throw PlanningError(std::format(
          "Move cycle through '{}'; rename would overwrite a planned source",
          safe_path_to_string(pending.front().from)));
    }
    unmoved.erase(ready->from);
    result.moves.push_back(std::move(*ready));
    pending.erase(ready);
  }

  std::sort(result.unchanged.begin(), result.unchanged.end());
  std::sort(result.unplannable.begin(), result.unplannable.end());
  return result;
}
