#include "Pipeline.hpp"

#include <algorithm>
#include <format>
#include <set>
#include <system_error>

#include "IOManager.hpp"
#include "WorkerPool.hpp"
#include "utils.hpp"

struct Pipeline::Context {
  const PipelineSpec& spec;
  const RunOptions& options;
  BatchReport& report;
  std::optional<std::stop_token> stoken;
  std::optional<TimezoneOffset> camera;
  std::optional<TimezoneOffset> target;
  // Index of the running stage in the pipeline.
  size_t position = 0;

  bool stopped() const { return stoken && stoken->stop_requested(); }
  std::vector<PhotoRecord>& records() { return report.records; }
};

namespace {

bool move_file(const fs::path& from, const fs::path& to, std::error_code& ec) {
  fs::rename(from, to, ec);
  if (ec == std::errc::cross_device_link) {
    ec.clear();
    fs::copy_file(from, to, fs::copy_options::none, ec);
    if (!ec) fs::remove(from, ec);
  }
  return !ec;
}

bool path_exists(const fs::path& p) {
  std::error_code ec;
  return fs::exists(p, ec);
}

// Longest root containing the file, else the file's own directory.
fs::path root_for(const fs::path& path, const std::vector<fs::path>& roots) {
  const fs::path* best = nullptr;
  for (const auto& root : roots) {
    if (!path_starts_with(path, root)) continue;
    if (!best || root.native().size() > best->native().size()) best = &root;
  }
  return best ? *best : path.parent_path();
}

void mark_cancelled(PhotoRecord& record, Stage stage) {
  record.outcomes[stage] =
      StageResult::skipped("cancelled", ErrorKind::CANCELLED);
}

}  // namespace

Pipeline::Pipeline(const Config& config, const TimezoneResolver& resolver,
                   MetadataTool& metadata, GeotagTool& geotagger)
    : m_config(config),
      m_resolver(resolver),
      m_metadata(metadata),
      m_geotagger(geotagger),
      m_planner(config.naming) {}

std::vector<PhotoRecord> Pipeline::load(
    const std::vector<fs::path>& paths,
    std::optional<std::stop_token> stoken) const {
  std::vector<PhotoRecord> records(paths.size());
  for (size_t i = 0; i < paths.size(); ++i) {
    records[i].original_path = paths[i];
    records[i].current_path = paths[i];
  }

  IOManager::log(std::format("Reading metadata of {} files...", paths.size()));
  for_each_bounded(records.size(), m_config.concurrency, stoken, [&](size_t i) {
    PhotoRecord& record = records[i];
    try {
      const Tags tags = m_metadata.read_tags(record.current_path);
      record.capture_raw = tags.date_time_original;
      if (record.capture_raw) {
        record.local_time = parse_exif_timestamp(*record.capture_raw);
      }
      record.camera_offset = m_resolver.detect(tags);
      if (tags.gps_date_stamp && tags.gps_time_stamp) {
        record.gps_time =
            parse_gps_timestamp(*tags.gps_date_stamp, *tags.gps_time_stamp);
      }
      record.coordinate = tags.coordinate;
    } catch (const RecordError& e) {
      record.read_error = e.what();
      IOManager::log(std::format("Could not read tags of '{}': {}",
                                 safe_path_to_string(record.current_path),
                                 e.what()));
    }
  });
  return records;
}

std::map<fs::path, std::optional<TimezoneOffset>>
Pipeline::detect_directory_offsets(
    const std::vector<PhotoRecord>& records) const {
  std::map<fs::path, std::vector<const PhotoRecord*>> by_dir;
  for (const auto& record : records) {
    by_dir[record.current_path.parent_path()].push_back(&record);
  }

  std::map<fs::path, std::optional<TimezoneOffset>> result;
  for (auto& [dir, members] : by_dir) {
    std::sort(members.begin(), members.end(), [](const auto* a, const auto* b) {
      return a->current_path < b->current_path;
    });

    std::optional<TimezoneOffset> offset;
    for (const auto* record : members) {
      if (record->camera_offset) {
        offset = record->camera_offset;
        break;
      }
    }
    if (!offset) {
      for (const auto* record : members) {
        if (!record->gps_time || !record->local_time ||
            record->utc_shift_applied) {
          continue;
        }
        try {
          offset = m_resolver.infer(*record->local_time, *record->gps_time);
          IOManager::log(std::format(
              "Inferred camera offset {} for '{}' from GPS time of '{}'",
              offset->to_string(), safe_path_to_string(dir),
              safe_path_to_string(record->current_path.filename())));
          break;
        } catch (const TimezoneError& e) {
          IOManager::log(std::format("Cannot infer offset from '{}': {}",
                                     safe_path_to_string(record->current_path),
                                     e.what()));
        }
      }
    }
    result.emplace(dir, offset);
  }
  return result;
}

BatchReport Pipeline::run(const PipelineSpec& spec, const RunOptions& options,
                          std::vector<PhotoRecord> records,
                          std::optional<std::stop_token> stoken) const {
  BatchReport report;
  report.pipeline = spec;
  report.records = std::move(records);
  report.dry_run = m_config.dry_run;
  report.camera_timezone = options.camera_timezone;
  report.target_timezone = options.target_timezone;

  Context ctx{spec, options, report, stoken};

  // Identifiers are resolved up front: a bad one must stop the run before
  // any file is touched.
  if (options.camera_timezone) {
    ctx.camera = m_resolver.resolve(*options.camera_timezone);
  }
  if (std::find(spec.begin(), spec.end(), Stage::SET_TIME) != spec.end()) {
    if (!options.target_timezone) {
      throw TimezoneError("set-time needs a target timezone");
    }
    ctx.target = m_resolver.resolve(*options.target_timezone, options.dst);
  }

  for (auto& record : report.records) {
    if (options.assume_utc && !record.utc_time && record.local_time) {
      record.utc_time = record.local_time;
      record.utc_shift_applied = true;
      record.camera_offset = TimezoneOffset::utc();
    }
    for (Stage stage : spec) record.outcomes[stage] = StageResult{};
  }

  report.state = RunState::RUNNING;
  for (size_t i = 0; i < spec.size(); ++i) {
    const Stage stage = spec[i];
    ctx.position = i;
    report.stage_index = i;

    if (ctx.stopped()) {
      report.state = RunState::ABORTED;
      report.aborted_stage = stage;
      report.abort_reason = "cancelled";
      IOManager::log(std::format("Run cancelled before stage '{}'.",
                                 to_string(stage)));
      return report;
    }

    IOManager::log(std::format("Stage {}/{}: {}", i + 1, spec.size(),
                               to_string(stage)));
    try {
      run_stage(stage, ctx);
    } catch (const PipelineError& e) {
      report.state = RunState::ABORTED;
      report.aborted_stage = stage;
      report.abort_reason =
          std::format("{}: {}", to_string(e.kind()), e.what());
      IOManager::log(std::format("Aborting run at stage '{}': {}",
                                 to_string(stage), report.abort_reason));
      return report;
    }

    if (ctx.stopped()) {
      report.state = RunState::ABORTED;
      report.aborted_stage = stage;
      report.abort_reason = "cancelled";
      IOManager::log(std::format("Run cancelled during stage '{}'.",
                                 to_string(stage)));
      return report;
    }
  }

  report.state = RunState::COMPLETED;
  IOManager::log(std::format("Run completed. {} of {} records have failures.",
                             report.failed_records(), report.records.size()));
  return report;
}

void Pipeline::run_stage(Stage stage, Context& ctx) const {
  switch (stage) {
    case Stage::SHIFT_TO_UTC:
      shift_to_utc(ctx);
      break;
    case Stage::ORGANIZE:
      organize(ctx);
      break;
    case Stage::GEOTAG:
      geotag(ctx);
      break;
    case Stage::SET_TIME:
      set_time(ctx);
      break;
    case Stage::RENAME:
      rename(ctx);
      break;
  }
}

std::vector<size_t> Pipeline::eligible(const Context& ctx, Stage stage) const {
  std::vector<size_t> result;
  auto& records = ctx.report.records;
  for (size_t i = 0; i < records.size(); ++i) {
    if (records[i].read_error) {
      records[i].outcomes[stage] =
          ctx.position == 0
              ? StageResult::failure(
                    ErrorKind::IO,
                    std::format("cannot read tags: {}", *records[i].read_error))
              : StageResult::skipped("failed in an earlier stage");
      continue;
    }
    bool failed_before = false;
    for (size_t p = 0; p < ctx.position; ++p) {
      if (records[i].outcome(ctx.spec[p]).status == StageStatus::FAILED) {
        failed_before = true;
        break;
      }
    }
    if (failed_before) {
      records[i].outcomes[stage] =
          StageResult::skipped("failed in an earlier stage");
    } else {
      result.push_back(i);
    }
  }
  return result;
}

void Pipeline::shift_to_utc(Context& ctx) const {
  auto& records = ctx.records();
  const auto indices = eligible(ctx, Stage::SHIFT_TO_UTC);

  std::map<fs::path, std::optional<TimezoneOffset>> dir_offsets;
  if (!ctx.camera) dir_offsets = detect_directory_offsets(records);

  std::map<int, std::vector<size_t>> groups;
  std::map<int, TimezoneOffset> group_offset;
  for (size_t i : indices) {
    PhotoRecord& record = records[i];
    if (record.applied_offset) {
      record.outcomes[Stage::SHIFT_TO_UTC] = StageResult::skipped(
          std::format("already converted to {}",
                      record.applied_offset->to_string()));
      continue;
    }

    std::optional<TimezoneOffset> offset;
    if (record.utc_shift_applied) {
      offset = record.camera_offset.value_or(TimezoneOffset::utc());
    } else if (ctx.camera) {
      if (record.camera_offset && !(*record.camera_offset == *ctx.camera)) {
        IOManager::log(std::format(
            "'{}' carries offset {} but {} was given; using {}",
            safe_path_to_string(record.current_path),
            record.camera_offset->to_string(), ctx.camera->to_string(),
            ctx.camera->to_string()));
      }
      offset = ctx.camera;
    } else if (record.camera_offset) {
      offset = record.camera_offset;
    } else if (auto it = dir_offsets.find(record.current_path.parent_path());
               it != dir_offsets.end()) {
      offset = it->second;
    }

    if (!offset) {
      record.outcomes[Stage::SHIFT_TO_UTC] = StageResult::failure(
          ErrorKind::MISSING_OFFSET,
          "no timezone in metadata and no GPS reference; pass "
          "--camera-timezone");
      continue;
    }
    groups[offset->minutes()].push_back(i);
    group_offset.emplace(offset->minutes(), *offset);
  }

  const ShiftEngine engine(Stage::SHIFT_TO_UTC);
  std::vector<size_t> shifted;
  for (const auto& [minutes, members] : groups) {
    const TimezoneOffset& offset = group_offset.at(minutes);
    const auto summary = engine.shift_batch(records, members, offset,
                                            ShiftDirection::TO_UTC, ctx.stoken);
    IOManager::log(std::format(
        "Offset {}: {} shifted to UTC, {} skipped, {} failed",
        offset.to_string(), summary.shifted, summary.skipped, summary.failed));
    for (size_t i : members) {
      if (records[i].outcome(Stage::SHIFT_TO_UTC).status ==
          StageStatus::SUCCESS) {
        shifted.push_back(i);
      }
    }
  }

  write_back(
      ctx, Stage::SHIFT_TO_UTC, shifted,
      [](const PhotoRecord& record) {
        Tags tags;
        tags.date_time_original = format_exif_timestamp(*record.utc_time);
        tags.offset_time_original = format_offset(0);
        return tags;
      },
      [](PhotoRecord& record) {
        record.utc_shift_applied = false;
        record.utc_time.reset();
      });
}

void Pipeline::organize(Context& ctx) const {
  auto& records = ctx.records();

  std::map<fs::path, std::vector<size_t>> by_root;
  for (size_t i : eligible(ctx, Stage::ORGANIZE)) {
    by_root[root_for(records[i].current_path, ctx.options.roots)].push_back(i);
  }

  // Every root is planned before any file moves.
  std::vector<std::pair<fs::path, RenamePlan>> plans;
  for (const auto& [root, indices] : by_root) {
    plans.emplace_back(root, m_planner.plan(records, indices,
                                            PlanMode::ORGANIZE, root,
                                            path_exists));
  }

  for (const auto& [root, plan] : plans) {
    for (size_t i : plan.unplannable) {
      records[i].outcomes[Stage::ORGANIZE] = StageResult::failure(
          ErrorKind::TIMESTAMP_PARSE,
          "no UTC timestamp; run shift-to-utc first or pass --assume-utc");
    }
    apply_plan(ctx, Stage::ORGANIZE, plan);

    if (!m_config.dry_run) IOManager::remove_empty_dirs(root, false);
  }
}

void Pipeline::geotag(Context& ctx) const {
  auto& records = ctx.records();
  std::vector<size_t> todo;
  for (size_t i : eligible(ctx, Stage::GEOTAG)) {
    if (records[i].coordinate) {
      records[i].outcomes[Stage::GEOTAG] =
          StageResult::skipped("already geotagged");
    } else {
      todo.push_back(i);
    }
  }

  const auto& tracks = ctx.options.track_files;
  if (tracks.empty()) {
    IOManager::log("No GPX files found, skipping geotag.");
    for (size_t i : todo) {
      records[i].outcomes[Stage::GEOTAG] =
          StageResult::skipped("no track files");
    }
    return;
  }
  if (todo.empty()) return;

  if (ctx.stopped()) {
    for (size_t i : todo) mark_cancelled(records[i], Stage::GEOTAG);
    return;
  }
  if (m_config.dry_run) {
    IOManager::log(
        std::format("DRY-RUN: Would geotag {} files using {} GPX files.",
                    todo.size(), tracks.size()));
    for (size_t i : todo) {
      records[i].outcomes[Stage::GEOTAG] = StageResult::success(
          std::format("DRY-RUN: would geotag with {} track files",
                      tracks.size()));
    }
    return;
  }

  std::vector<fs::path> paths;
  paths.reserve(todo.size());
  for (size_t i : todo) paths.push_back(records[i].current_path);

  const auto outcomes = m_geotagger.geotag_batch(paths, tracks);

  size_t tagged = 0;
  for (size_t i : todo) {
    PhotoRecord& record = records[i];
    auto it = outcomes.find(record.current_path);
    if (it == outcomes.end()) {
      record.outcomes[Stage::GEOTAG] =
          StageResult::skipped("not reported by geotagger");
      continue;
    }
    const GeotagOutcome& outcome = it->second;
    switch (outcome.status) {
      case GeotagStatus::TAGGED:
        record.coordinate = outcome.coordinate;
        record.outcomes[Stage::GEOTAG] = StageResult::success(
            outcome.coordinate
                ? std::format("{:.6f}, {:.6f}", outcome.coordinate->latitude,
                              outcome.coordinate->longitude)
                : std::string{});
        ++tagged;
        break;
      case GeotagStatus::NO_MATCH:
        record.outcomes[Stage::GEOTAG] = StageResult::skipped(
            outcome.message.empty() ? "no track point in range"
                                    : outcome.message);
        break;
      case GeotagStatus::FAILED:
        record.outcomes[Stage::GEOTAG] =
            StageResult::failure(ErrorKind::TOOL, outcome.message);
        break;
    }
  }
  IOManager::log(
      std::format("Geotagged {} of {} files.", tagged, todo.size()));
}

void Pipeline::set_time(Context& ctx) const {
  auto& records = ctx.records();
  const TimezoneOffset& target = *ctx.target;

  std::vector<size_t> todo;
  for (size_t i : eligible(ctx, Stage::SET_TIME)) {
    PhotoRecord& record = records[i];
    if (record.applied_offset && *record.applied_offset == target &&
        !record.utc_shift_applied) {
      record.outcomes[Stage::SET_TIME] = StageResult::skipped(
          std::format("already set to {}", target.to_string()));
      continue;
    }
    todo.push_back(i);
  }

  // Kept so a failed write can put the record back as it was.
  std::map<size_t, std::optional<Timestamp>> previous_local;
  std::map<size_t, std::optional<TimezoneOffset>> previous_applied;
  std::map<size_t, bool> previous_in_utc;
  for (size_t i : todo) {
    previous_local.emplace(i, records[i].local_time);
    previous_applied.emplace(i, records[i].applied_offset);
    previous_in_utc.emplace(i, records[i].utc_shift_applied);
    // Converted to another zone earlier: start again from the kept UTC time.
    if (records[i].applied_offset && records[i].utc_time) {
      records[i].utc_shift_applied = true;
    }
  }

  const ShiftEngine engine(Stage::SET_TIME);
  const auto summary = engine.shift_batch(
      records, todo, target, ShiftDirection::TO_LOCAL, ctx.stoken);
  IOManager::log(std::format(
      "Set time to {} ({}): {} converted, {} skipped, {} failed",
      target.label(), target.to_string(), summary.shifted, summary.skipped,
      summary.failed));

  std::vector<size_t> converted;
  std::map<const PhotoRecord*, size_t> index_of;
  for (size_t i : todo) {
    if (records[i].outcome(Stage::SET_TIME).status == StageStatus::SUCCESS) {
      converted.push_back(i);
      index_of.emplace(&records[i], i);
    } else {
      records[i].utc_shift_applied = previous_in_utc.at(i);
    }
  }

  write_back(
      ctx, Stage::SET_TIME, converted,
      [&target](const PhotoRecord& record) {
        Tags tags;
        tags.date_time_original = format_exif_timestamp(*record.local_time);
        tags.offset_time_original = target.to_string();
        // The camera's own TimeZone tag excludes daylight saving.
        tags.timezone_minutes = target.minutes() - (target.dst() ? 60 : 0);
        tags.timezone_city = target.city_id();
        tags.daylight_savings = target.dst();
        return tags;
      },
      [&](PhotoRecord& record) {
        const size_t i = index_of.at(&record);
        record.utc_shift_applied = previous_in_utc.at(i);
        record.local_time = previous_local.at(i);
        record.applied_offset = previous_applied.at(i);
      });
}

void Pipeline::rename(Context& ctx) const {
  auto& records = ctx.records();
  const auto indices = eligible(ctx, Stage::RENAME);

  const RenamePlan plan = m_planner.plan(records, indices, PlanMode::RENAME,
                                         fs::path(), path_exists);
  for (size_t i : plan.unplannable) {
    records[i].outcomes[Stage::RENAME] = StageResult::failure(
        ErrorKind::TIMESTAMP_PARSE,
        m_config.naming.use_local_time
            ? "no local time; run set-time first"
            : "no UTC timestamp; run shift-to-utc first or pass --assume-utc");
  }
  apply_plan(ctx, Stage::RENAME, plan);
}

void Pipeline::apply_plan(Context& ctx, Stage stage,
                          const RenamePlan& plan) const {
  auto& records = ctx.records();
  for (size_t i : plan.unchanged) {
    records[i].outcomes[stage] = StageResult::skipped("already in place");
  }

  IOManager::log(std::format("{}: {} moves planned, {} already in place.",
                             to_string(stage), plan.moves.size(),
                             plan.unchanged.size()));

  // Sequential on purpose: the plan order guarantees each target is free
  // only when the moves before it have run.
  for (const auto& move : plan.moves) {
    PhotoRecord& record = records[move.record];
    if (ctx.stopped()) {
      mark_cancelled(record, stage);
      continue;
    }

    if (m_config.dry_run) {
      IOManager::log(std::format("DRY-RUN: Move '{}' -> '{}'",
                                 safe_path_to_string(move.from),
                                 safe_path_to_string(move.to)));
      record.current_path = move.to;
      record.outcomes[stage] = StageResult::success(std::format(
          "DRY-RUN: would move to {}", safe_path_to_string(move.to)));
      continue;
    }

    std::error_code ec;
    const fs::path parent_dir = move.to.parent_path();
    if (!path_exists(parent_dir)) {
      fs::create_directories(parent_dir, ec);
      if (!ec) {
        IOManager::log(std::format("[DIR] Creating directory: '{}'",
                                   safe_path_to_string(parent_dir)));
      }
    }
    if (!ec && path_exists(move.to)) {
      ec = std::make_error_code(std::errc::file_exists);
    }
    if (!ec) move_file(move.from, move.to, ec);

    if (ec) {
      IOManager::log(std::format("ERROR moving file '{}' -> '{}': {}",
                                 safe_path_to_string(move.from),
                                 safe_path_to_string(move.to), ec.message()));
      record.outcomes[stage] = StageResult::failure(
          ErrorKind::IO,
          std::format("cannot move to '{}': {}", safe_path_to_string(move.to),
                      ec.message()));
      continue;
    }

    IOManager::log(std::format("Moving '{}' -> '{}'",
                               safe_path_to_string(move.from),
                               safe_path_to_string(move.to)));
    record.current_path = move.to;
    ctx.report.moves.push_back({ActionType::MOVE, move.from, move.to});
    record.outcomes[stage] =
        StageResult::success(safe_path_to_string(move.to.filename()));
  }
}

void Pipeline::write_back(
    Context& ctx, Stage stage, const std::vector<size_t>& indices,
    const std::function<Tags(const PhotoRecord&)>& make_tags,
    const std::function<void(PhotoRecord&)>& revert) const {
  auto& records = ctx.records();
  if (indices.empty()) return;

  if (m_config.dry_run) {
    IOManager::log(std::format("DRY-RUN: Would write {} tags to {} files.",
                               to_string(stage), indices.size()));
    for (size_t i : indices) {
      auto& outcome = records[i].outcomes[stage];
      outcome.message = "DRY-RUN: " + outcome.message;
    }
    return;
  }

  std::vector<char> visited(indices.size(), 0);
  try {
    for_each_bounded(
        indices.size(), m_config.concurrency, ctx.stoken, [&](size_t n) {
          visited[n] = 1;
          PhotoRecord& record = records[indices[n]];
          try {
            m_metadata.write_tags(record.current_path, make_tags(record));
          } catch (const RecordError& e) {
            revert(record);
            record.outcomes[stage] = StageResult::failure(e.kind(), e.what());
          } catch (const ToolError& e) {
            revert(record);
            record.outcomes[stage] =
                StageResult::failure(ErrorKind::TOOL, e.what());
            throw;
          }
        });
  } catch (const ToolError& e) {
    for (size_t n = 0; n < indices.size(); ++n) {
      if (visited[n]) continue;
      PhotoRecord& record = records[indices[n]];
      revert(record);
      record.outcomes[stage] = StageResult::failure(
          ErrorKind::TOOL, std::format("not written: {}", e.what()));
    }
    throw;
  }

  for (size_t n = 0; n < indices.size(); ++n) {
    if (visited[n]) continue;
    revert(records[indices[n]]);
    mark_cancelled(records[indices[n]], stage);
  }
}

size_t restore_markers(std::vector<PhotoRecord>& records,
                       const BatchReport& previous) {
  std::map<fs::path, const PhotoRecord*> by_path;
  for (const auto& record : previous.records) {
    by_path[record.current_path] = &record;
  }

  size_t restored = 0;
  for (auto& record : records) {
    auto it = by_path.find(record.current_path);
    if (it == by_path.end()) continue;
    const PhotoRecord& old = *it->second;

    record.original_path = old.original_path;
    record.utc_shift_applied = old.utc_shift_applied;
    record.utc_time = old.utc_time;
    // Once shifted, the file's own capture tag no longer holds camera time.
    if (old.local_time) record.local_time = old.local_time;
    if (old.camera_offset) record.camera_offset = old.camera_offset;
    record.applied_offset = old.applied_offset;
    if (old.coordinate) record.coordinate = old.coordinate;
    record.outcomes = old.outcomes;
    ++restored;
  }
  return restored;
}

size_t carry_over(BatchReport& report, const BatchReport& previous,
                  const std::vector<fs::path>& loaded) {
  std::set<fs::path> superseded(loaded.begin(), loaded.end());
  for (const auto& record : report.records) {
    superseded.insert(record.current_path);
  }

  size_t kept = 0;
  for (const auto& old : previous.records) {
    if (superseded.contains(old.current_path)) continue;
    report.records.push_back(old);
    ++kept;
  }
  report.moves.insert(report.moves.begin(), previous.moves.begin(),
                      previous.moves.end());
  return kept;
}
