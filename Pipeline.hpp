#pragma once

#include <functional>
#include <map>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "ExternalTools.hpp"
#include "RenamePlanner.hpp"
#include "ShiftEngine.hpp"
#include "TimezoneResolver.hpp"

struct RunOptions {
  // Timezone the camera clock was set to. When given it is authoritative and
  // no detection or inference happens.
  std::optional<std::string> camera_timezone;
  // Timezone written by set-time.
  std::optional<std::string> target_timezone;
  bool dst = false;
  std::vector<fs::path> track_files;
  // Input directories. Organize files each record under the longest root
  // containing it, one directory per day; a file outside every root is
  // organized next to itself.
  std::vector<fs::path> roots;
  // Treat capture times of records never shifted as already being UTC.
  bool assume_utc = false;
};

// Sequences the stages over one batch and turns every outcome into the
// BatchReport. Stages run strictly one after another; inside a stage records
// are handled independently on a bounded worker pool.
//
//   NotStarted -> Running(stage) -> Completed
//                                -> Aborted(stage, reason)
//
// A ToolError or PlanningError aborts the run at the stage boundary and
// leaves earlier effects in place. Per-record errors are recorded and the
// stage carries on.
class Pipeline {
 public:
  Pipeline(const Config& config, const TimezoneResolver& resolver,
           MetadataTool& metadata, GeotagTool& geotagger);

  // Reads tags of every file. A ToolError here means nothing can run.
  std::vector<PhotoRecord> load(
      const std::vector<fs::path>& paths,
      std::optional<std::stop_token> stoken = std::nullopt) const;

  // Throws TimezoneError before any stage starts if an identifier in
  // `options` cannot be resolved.
  BatchReport run(const PipelineSpec& spec, const RunOptions& options,
                  std::vector<PhotoRecord> records,
                  std::optional<std::stop_token> stoken = std::nullopt) const;

  // Camera offset per directory: the first record carrying one in its
  // tags, else one inferred from a GPS-timestamped photo.
  std::map<fs::path, std::optional<TimezoneOffset>> detect_directory_offsets(
      const std::vector<PhotoRecord>& records) const;

 private:
  struct Context;

  void run_stage(Stage stage, Context& ctx) const;
  void shift_to_utc(Context& ctx) const;
  void organize(Context& ctx) const;
  void geotag(Context& ctx) const;
  void set_time(Context& ctx) const;
  void rename(Context& ctx) const;

  std::vector<size_t> eligible(const Context& ctx, Stage stage) const;
  void apply_plan(Context& ctx, Stage stage, const RenamePlan& plan) const;
  void write_back(Context& ctx, Stage stage, const std::vector<size_t>& indices,
                  const std::function<Tags(const PhotoRecord&)>& make_tags,
                  const std::function<void(PhotoRecord&)>& revert) const;

  const Config& m_config;
  const TimezoneResolver& m_resolver;
  MetadataTool& m_metadata;
  GeotagTool& m_geotagger;
  RenamePlanner m_planner;
};

// Copies per-record markers from a previous report onto freshly loaded
// records with the same current path, so re-running a stage skips work that
// was already applied.
size_t restore_markers(std::vector<PhotoRecord>& records,
                       const BatchReport& previous);

// Keeps what a narrower run must not drop from the previous report: its
// moves, so they stay undoable, and the records of files this run did not
// load from `loaded`. Returns the number of records carried over.
size_t carry_over(BatchReport& report, const BatchReport& previous,
                  const std::vector<fs::path>& loaded);
