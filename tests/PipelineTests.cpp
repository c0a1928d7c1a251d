#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <set>
#include <stop_token>
#include <vector>

#include "../IOManager.hpp"
#include "../Pipeline.hpp"

namespace fs = std::filesystem;

namespace {

// In-memory tags keyed by file name, so they follow a file across moves.
// Writes are merged back into the stored tags like a real tool would.
class FakeMetadataTool : public MetadataTool {
 public:
  Tags read_tags(const fs::path& path) override {
    std::scoped_lock lock(m_mutex);
    auto it = tags.find(path.filename().string());
    if (it == tags.end()) {
      throw RecordError(ErrorKind::IO, "no metadata in " + path.string());
    }
    return it->second;
  }

  void write_tags(const fs::path& path, const Tags& update) override {
    std::scoped_lock lock(m_mutex);
    const std::string name = path.filename().string();
    if (broken) throw ToolError("metadata tool exited with signal 11");
    if (read_only.contains(name)) {
      throw RecordError(ErrorKind::IO, "permission denied: " + name);
    }
    writes[name].push_back(update);

    Tags& stored = tags[name];
    if (update.date_time_original) {
      stored.date_time_original = update.date_time_original;
    }
    if (update.offset_time_original) {
      stored.offset_time_original = update.offset_time_original;
    }
    if (update.timezone_minutes) {
      stored.timezone_minutes = update.timezone_minutes;
    }
    if (update.coordinate) stored.coordinate = update.coordinate;
  }

  size_t write_count() {
    std::scoped_lock lock(m_mutex);
    size_t count = 0;
    for (const auto& [name, list] : writes) count += list.size();
    return count;
  }

  std::map<std::string, Tags> tags;
  std::map<std::string, std::vector<Tags>> writes;
  std::set<std::string> read_only;
  bool broken = false;

 private:
  std::mutex m_mutex;
};

class FakeGeotagTool : public GeotagTool {
 public:
  std::map<fs::path, GeotagOutcome> geotag_batch(
      const std::vector<fs::path>& images,
      const std::vector<fs::path>& track_files) override {
    ++calls;
    requested = images;
    if (broken) throw ToolError("gpicsync: command not found");
    std::map<fs::path, GeotagOutcome> result;
    for (const auto& image : images) {
      if (coordinate) {
        result[image] = {GeotagStatus::TAGGED, coordinate, ""};
      } else {
        result[image] = {GeotagStatus::NO_MATCH, std::nullopt,
                         "no track point in range"};
      }
    }
    return result;
  }

  bool broken = false;
  std::optional<Coordinate> coordinate;
  size_t calls = 0;
  std::vector<fs::path> requested;
};

}  // namespace

class PipelineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    test_dir = fs::temp_directory_path() / "photo_process_pipeline_test";
    fs::create_directories(test_dir);
    for (const auto& entry : fs::directory_iterator(test_dir)) {
      fs::remove_all(entry.path());
    }
    config.concurrency = 2;
    options.roots = {test_dir};
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(test_dir, ec);
  }

  // Creates an empty photo on disk and registers its capture time.
  fs::path AddPhoto(const fs::path& relative_path, const std::string& capture,
                    std::optional<std::string> offset = std::nullopt) {
    fs::path full_path = test_dir / relative_path;
    fs::create_directories(full_path.parent_path());
    std::ofstream ofs(full_path);
    ofs << "dummy content";
    ofs.close();

    Tags tags;
    tags.date_time_original = capture;
    tags.offset_time_original = offset;
    metadata.tags[full_path.filename().string()] = tags;
    return full_path;
  }

  Pipeline MakePipeline() {
    return Pipeline(config, resolver, metadata, geotagger);
  }

  static const PhotoRecord& Find(const BatchReport& report,
                                 const fs::path& original) {
    for (const auto& record : report.records) {
      if (record.original_path == original) return record;
    }
    throw std::runtime_error("no record for " + original.string());
  }

  fs::path test_dir;
  Config config;
  RunOptions options;
  TimezoneResolver resolver{TimezoneTable::builtin()};
  FakeMetadataTool metadata;
  FakeGeotagTool geotagger;
};

TEST_F(PipelineTest, ProcessOrganizesAndRenamesByUtc) {
  // 1. Arrange: camera at +02:00, two shots in the same second.
  const fs::path first = AddPhoto("IMG_0001.JPG", "2024:06:01 10:00:01");
  const fs::path second = AddPhoto("IMG_0002.JPG", "2024:06:01 10:00:01");
  const fs::path third = AddPhoto("IMG_0003.JPG", "2024:06:01 10:05:00");
  options.camera_timezone = "+02:00";
  options.target_timezone = "+02:00";
  const Pipeline pipeline = MakePipeline();

  // 2. Act
  const BatchReport report = pipeline.run(
      process_pipeline(), options, pipeline.load({first, second, third}));

  // 3. Assert
  EXPECT_EQ(report.state, RunState::COMPLETED);
  EXPECT_EQ(report.failed_records(), 0);

  const fs::path day = test_dir / "2024-06-01";
  EXPECT_TRUE(fs::exists(day / "2024-06-01_08-00-01.jpg"));
  EXPECT_TRUE(fs::exists(day / "2024-06-01_08-00-01_2.jpg"));
  EXPECT_TRUE(fs::exists(day / "2024-06-01_08-05-00.jpg"));
  EXPECT_FALSE(fs::exists(first));

  EXPECT_EQ(Find(report, first).current_path, day / "2024-06-01_08-00-01.jpg");
  EXPECT_EQ(Find(report, second).current_path,
            day / "2024-06-01_08-00-01_2.jpg");

  // Shift wrote UTC, set-time wrote the local time back with its offset.
  const auto& writes = metadata.writes.at("IMG_0001.JPG");
  ASSERT_EQ(writes.size(), 2);
  EXPECT_EQ(writes[0].date_time_original, "2024:06:01 08:00:01");
  EXPECT_EQ(writes[0].offset_time_original, "+00:00");
  EXPECT_EQ(writes[1].date_time_original, "2024:06:01 10:00:01");
  EXPECT_EQ(writes[1].offset_time_original, "+02:00");
  EXPECT_EQ(writes[1].timezone_minutes, 120);

  // One organize move and one rename move per file.
  EXPECT_EQ(report.moves.size(), 6);
  EXPECT_EQ(Find(report, first).outcome(Stage::GEOTAG).status,
            StageStatus::SKIPPED);
}

TEST_F(PipelineTest, DryRunTouchesNothing) {
  const fs::path photo = AddPhoto("IMG_0001.JPG", "2024:06:01 10:00:01");
  config.dry_run = true;
  options.camera_timezone = "Paris";
  options.target_timezone = "Paris";
  const Pipeline pipeline = MakePipeline();

  const BatchReport report =
      pipeline.run(process_pipeline(), options, pipeline.load({photo}));

  EXPECT_EQ(report.state, RunState::COMPLETED);
  EXPECT_TRUE(report.dry_run);
  EXPECT_TRUE(fs::exists(photo));
  EXPECT_FALSE(fs::exists(test_dir / "2024-06-01"));
  EXPECT_EQ(metadata.write_count(), 0);
  EXPECT_TRUE(report.moves.empty());
  // Later stages still plan against where the file would have gone.
  EXPECT_EQ(Find(report, photo).current_path,
            test_dir / "2024-06-01" / "2024-06-01_09-00-01.jpg");
}

TEST_F(PipelineTest, UnknownTimezoneStopsBeforeAnyStage) {
  const fs::path photo = AddPhoto("IMG_0001.JPG", "2024:06:01 10:00:01");
  options.camera_timezone = "Nowhere";
  const Pipeline pipeline = MakePipeline();
  auto records = pipeline.load({photo});

  EXPECT_THROW(pipeline.run(process_pipeline(), options, records),
               TimezoneError);
  EXPECT_TRUE(fs::exists(photo));
  EXPECT_EQ(metadata.write_count(), 0);
}

TEST_F(PipelineTest, SetTimeWithoutTargetIsRejected) {
  const fs::path photo = AddPhoto("IMG_0001.JPG", "2024:06:01 10:00:01");
  const Pipeline pipeline = MakePipeline();

  EXPECT_THROW(
      pipeline.run({Stage::SET_TIME}, options, pipeline.load({photo})),
      TimezoneError);
}

TEST_F(PipelineTest, GeotagToolFailureAbortsLaterStages) {
  const fs::path photo = AddPhoto("IMG_0001.JPG", "2024:06:01 10:00:01");
  options.camera_timezone = "+02:00";
  options.target_timezone = "+02:00";
  options.track_files = {test_dir / "track.gpx"};
  geotagger.broken = true;
  const Pipeline pipeline = MakePipeline();

  const BatchReport report =
      pipeline.run(process_pipeline(), options, pipeline.load({photo}));

  EXPECT_EQ(report.state, RunState::ABORTED);
  ASSERT_TRUE(report.aborted_stage.has_value());
  EXPECT_EQ(*report.aborted_stage, Stage::GEOTAG);
  EXPECT_TRUE(report.abort_reason.starts_with("ToolError"));

  const PhotoRecord& record = Find(report, photo);
  EXPECT_EQ(record.outcome(Stage::SHIFT_TO_UTC).status, StageStatus::SUCCESS);
  EXPECT_EQ(record.outcome(Stage::ORGANIZE).status, StageStatus::SUCCESS);
  EXPECT_EQ(record.outcome(Stage::SET_TIME).status, StageStatus::PENDING);
  EXPECT_EQ(record.outcome(Stage::RENAME).status, StageStatus::PENDING);
  // Effects of completed stages stay in place.
  EXPECT_TRUE(fs::exists(test_dir / "2024-06-01" / "IMG_0001.JPG"));
}

TEST_F(PipelineTest, ShiftIsNotAppliedTwice) {
  const fs::path photo = AddPhoto("IMG_0001.JPG", "2024:06:01 10:00:01");
  options.camera_timezone = "+02:00";
  const Pipeline pipeline = MakePipeline();

  const BatchReport first =
      pipeline.run({Stage::SHIFT_TO_UTC}, options, pipeline.load({photo}));
  const BatchReport second =
      pipeline.run({Stage::SHIFT_TO_UTC}, options, first.records);

  const PhotoRecord& record = Find(second, photo);
  EXPECT_EQ(*record.utc_time, parse_exif_timestamp("2024:06:01 08:00:01"));
  EXPECT_EQ(record.outcome(Stage::SHIFT_TO_UTC).status, StageStatus::SKIPPED);
  EXPECT_EQ(metadata.write_count(), 1);
}

TEST_F(PipelineTest, MarkersFromPreviousReportSurviveReload) {
  const fs::path photo = AddPhoto("IMG_0001.JPG", "2024:06:01 10:00:01");
  options.camera_timezone = "+02:00";
  const Pipeline pipeline = MakePipeline();
  const BatchReport previous =
      pipeline.run({Stage::SHIFT_TO_UTC}, options, pipeline.load({photo}));

  // A new invocation reads the file again; its tag now holds UTC.
  auto records = pipeline.load({photo});
  ASSERT_EQ(restore_markers(records, previous), 1);
  const BatchReport again =
      pipeline.run({Stage::SHIFT_TO_UTC}, options, std::move(records));

  const PhotoRecord& record = Find(again, photo);
  EXPECT_TRUE(record.utc_shift_applied);
  EXPECT_EQ(*record.local_time, parse_exif_timestamp("2024:06:01 10:00:01"));
  EXPECT_EQ(*record.utc_time, parse_exif_timestamp("2024:06:01 08:00:01"));
  EXPECT_EQ(metadata.write_count(), 1);
}

TEST_F(PipelineTest, OffsetComesFromTagsOrDirectoryOrFails) {
  const fs::path tagged =
      AddPhoto("tokyo/IMG_0001.JPG", "2024:06:01 10:00:00", "+09:00");
  const fs::path neighbour =
      AddPhoto("tokyo/IMG_0002.JPG", "2024:06:01 11:00:00");
  const fs::path unknown = AddPhoto("misc/IMG_0003.JPG", "2024:06:01 12:00:00");
  const Pipeline pipeline = MakePipeline();

  const BatchReport report =
      pipeline.run({Stage::SHIFT_TO_UTC}, options,
                   pipeline.load({tagged, neighbour, unknown}));

  EXPECT_EQ(report.state, RunState::COMPLETED);
  EXPECT_EQ(*Find(report, tagged).utc_time,
            parse_exif_timestamp("2024:06:01 01:00:00"));
  EXPECT_EQ(*Find(report, neighbour).utc_time,
            parse_exif_timestamp("2024:06:01 02:00:00"));
  const StageResult& missing =
      Find(report, unknown).outcome(Stage::SHIFT_TO_UTC);
  EXPECT_EQ(missing.status, StageStatus::FAILED);
  EXPECT_EQ(missing.error, ErrorKind::MISSING_OFFSET);
  EXPECT_EQ(report.failed_records(), 1);
}

TEST_F(PipelineTest, OffsetIsInferredFromGpsTime) {
  const fs::path photo = AddPhoto("IMG_0001.JPG", "2024:06:01 10:00:00");
  Tags& tags = metadata.tags["IMG_0001.JPG"];
  tags.gps_date_stamp = "2024:06:01";
  tags.gps_time_stamp = "04:30:00";
  const Pipeline pipeline = MakePipeline();

  const BatchReport report =
      pipeline.run({Stage::SHIFT_TO_UTC}, options, pipeline.load({photo}));

  const PhotoRecord& record = Find(report, photo);
  EXPECT_EQ(*record.utc_time, parse_exif_timestamp("2024:06:01 04:30:00"));
  EXPECT_EQ(record.camera_offset->minutes(), 330);
}

TEST_F(PipelineTest, ExplicitCameraTimezoneOverridesTags) {
  const fs::path photo =
      AddPhoto("IMG_0001.JPG", "2024:06:01 10:00:00", "+09:00");
  options.camera_timezone = "+02:00";
  const Pipeline pipeline = MakePipeline();

  const BatchReport report =
      pipeline.run({Stage::SHIFT_TO_UTC}, options, pipeline.load({photo}));

  EXPECT_EQ(*Find(report, photo).utc_time,
            parse_exif_timestamp("2024:06:01 08:00:00"));
}

TEST_F(PipelineTest, FailedWriteRevertsOnlyThatRecord) {
  const fs::path ok = AddPhoto("IMG_0001.JPG", "2024:06:01 10:00:01");
  const fs::path locked = AddPhoto("IMG_0002.JPG", "2024:06:01 10:00:02");
  metadata.read_only.insert("IMG_0002.JPG");
  options.camera_timezone = "+02:00";
  const Pipeline pipeline = MakePipeline();

  const BatchReport report =
      pipeline.run({Stage::SHIFT_TO_UTC, Stage::RENAME}, options,
                   pipeline.load({ok, locked}));

  EXPECT_EQ(report.state, RunState::COMPLETED);
  const PhotoRecord& failed = Find(report, locked);
  EXPECT_EQ(failed.outcome(Stage::SHIFT_TO_UTC).error, ErrorKind::IO);
  EXPECT_FALSE(failed.utc_shift_applied);
  // A record that failed earlier is not renamed.
  EXPECT_EQ(failed.outcome(Stage::RENAME).status, StageStatus::SKIPPED);
  EXPECT_TRUE(fs::exists(locked));
  EXPECT_TRUE(fs::exists(test_dir / "2024-06-01_08-00-01.jpg"));
}

TEST_F(PipelineTest, BrokenMetadataToolAbortsAndReverts) {
  const fs::path a = AddPhoto("IMG_0001.JPG", "2024:06:01 10:00:01");
  const fs::path b = AddPhoto("IMG_0002.JPG", "2024:06:01 10:00:02");
  options.camera_timezone = "+02:00";
  const Pipeline pipeline = MakePipeline();
  auto records = pipeline.load({a, b});
  metadata.broken = true;

  const BatchReport report =
      pipeline.run({Stage::SHIFT_TO_UTC, Stage::RENAME}, options, records);

  EXPECT_EQ(report.state, RunState::ABORTED);
  EXPECT_EQ(report.aborted_stage, Stage::SHIFT_TO_UTC);
  for (const auto& record : report.records) {
    EXPECT_FALSE(record.utc_shift_applied);
    EXPECT_EQ(record.outcome(Stage::SHIFT_TO_UTC).error, ErrorKind::TOOL);
    EXPECT_EQ(record.outcome(Stage::RENAME).status, StageStatus::PENDING);
  }
}

TEST_F(PipelineTest, OccupiedTargetAbortsOrganize) {
  const fs::path photo = AddPhoto("in/IMG_0001.JPG", "2024:06:01 10:00:01");
  const fs::path blocker = test_dir / "2024-06-01" / "IMG_0001.JPG";
  fs::create_directories(blocker.parent_path());
  std::ofstream(blocker) << "someone else";
  options.assume_utc = true;
  const Pipeline pipeline = MakePipeline();

  const BatchReport report =
      pipeline.run({Stage::ORGANIZE}, options, pipeline.load({photo}));

  EXPECT_EQ(report.state, RunState::ABORTED);
  EXPECT_TRUE(report.abort_reason.starts_with("PlanningError"));
  EXPECT_TRUE(fs::exists(photo));
}

TEST_F(PipelineTest, GeotagRecordsCoordinatesAndSkipsTaggedPhotos) {
  const fs::path fresh = AddPhoto("IMG_0001.JPG", "2024:06:01 10:00:01");
  const fs::path tagged = AddPhoto("IMG_0002.JPG", "2024:06:01 10:00:02");
  metadata.tags["IMG_0002.JPG"].coordinate = Coordinate{1.0, 2.0};
  geotagger.coordinate = Coordinate{47.5, 8.5};
  options.track_files = {test_dir / "track.gpx"};
  const Pipeline pipeline = MakePipeline();

  const BatchReport report =
      pipeline.run({Stage::GEOTAG}, options, pipeline.load({fresh, tagged}));

  ASSERT_EQ(geotagger.requested.size(), 1);
  EXPECT_EQ(geotagger.requested[0], fresh);
  EXPECT_EQ(Find(report, fresh).coordinate, (Coordinate{47.5, 8.5}));
  EXPECT_EQ(Find(report, fresh).outcome(Stage::GEOTAG).status,
            StageStatus::SUCCESS);
  EXPECT_EQ(Find(report, tagged).outcome(Stage::GEOTAG).status,
            StageStatus::SKIPPED);
}

TEST_F(PipelineTest, GeotagWithoutTracksSkipsEverything) {
  const fs::path photo = AddPhoto("IMG_0001.JPG", "2024:06:01 10:00:01");
  const Pipeline pipeline = MakePipeline();

  const BatchReport report =
      pipeline.run({Stage::GEOTAG}, options, pipeline.load({photo}));

  EXPECT_EQ(geotagger.calls, 0);
  EXPECT_EQ(Find(report, photo).outcome(Stage::GEOTAG).status,
            StageStatus::SKIPPED);
}

TEST_F(PipelineTest, SetTimeWritesCameraTimezoneTags) {
  const fs::path photo = AddPhoto("IMG_0001.JPG", "2024:06:01 08:00:00");
  options.assume_utc = true;
  options.target_timezone = "Paris";
  options.dst = true;
  const Pipeline pipeline = MakePipeline();

  const BatchReport first =
      pipeline.run({Stage::SET_TIME}, options, pipeline.load({photo}));
  const BatchReport second =
      pipeline.run({Stage::SET_TIME}, options, first.records);

  const auto& writes = metadata.writes.at("IMG_0001.JPG");
  ASSERT_EQ(writes.size(), 1);
  EXPECT_EQ(writes[0].date_time_original, "2024:06:01 10:00:00");
  EXPECT_EQ(writes[0].offset_time_original, "+02:00");
  EXPECT_EQ(writes[0].timezone_minutes, 60);
  EXPECT_EQ(writes[0].timezone_city, 19);
  EXPECT_EQ(writes[0].daylight_savings, true);
  EXPECT_EQ(Find(second, photo).outcome(Stage::SET_TIME).status,
            StageStatus::SKIPPED);
}

TEST_F(PipelineTest, CancelledRunStopsAtStageBoundary) {
  const fs::path photo = AddPhoto("IMG_0001.JPG", "2024:06:01 10:00:01");
  options.camera_timezone = "+02:00";
  options.target_timezone = "+02:00";
  const Pipeline pipeline = MakePipeline();
  auto records = pipeline.load({photo});
  std::stop_source stop;
  stop.request_stop();

  const BatchReport report = pipeline.run(process_pipeline(), options,
                                          records, stop.get_token());

  EXPECT_EQ(report.state, RunState::ABORTED);
  EXPECT_EQ(report.abort_reason, "cancelled");
  EXPECT_EQ(report.aborted_stage, Stage::SHIFT_TO_UTC);
  EXPECT_TRUE(fs::exists(photo));
  EXPECT_EQ(metadata.write_count(), 0);
}

TEST_F(PipelineTest, DetectsOffsetPerDirectory) {
  AddPhoto("a/IMG_0001.JPG", "2024:06:01 10:00:00", "-05:00");
  AddPhoto("b/IMG_0002.JPG", "2024:06:01 10:00:00");
  const Pipeline pipeline = MakePipeline();

  const auto offsets = pipeline.detect_directory_offsets(pipeline.load(
      {test_dir / "a" / "IMG_0001.JPG", test_dir / "b" / "IMG_0002.JPG"}));

  ASSERT_EQ(offsets.size(), 2);
  ASSERT_TRUE(offsets.at(test_dir / "a").has_value());
  EXPECT_EQ(offsets.at(test_dir / "a")->minutes(), -300);
  EXPECT_FALSE(offsets.at(test_dir / "b").has_value());
}

TEST_F(PipelineTest, NarrowerRunKeepsMarkersOfOtherFiles) {
  const fs::path a = AddPhoto("IMG_0001.JPG", "2024:06:01 10:00:01");
  const fs::path b = AddPhoto("IMG_0002.JPG", "2024:06:01 10:00:02");
  options.camera_timezone = "+02:00";
  const Pipeline pipeline = MakePipeline();
  const fs::path report_path = test_dir / "report.json";

  // First invocation shifts both files.
  IOManager::save_report(
      report_path,
      pipeline.run({Stage::SHIFT_TO_UTC}, options, pipeline.load({a, b})));

  // Second invocation only renames a.
  auto previous = IOManager::load_report(report_path);
  ASSERT_TRUE(previous.has_value());
  auto subset = pipeline.load({a});
  restore_markers(subset, *previous);
  BatchReport narrower =
      pipeline.run({Stage::RENAME}, options, std::move(subset));
  EXPECT_EQ(carry_over(narrower, *previous, {a}), 1);
  IOManager::save_report(report_path, narrower);

  // Third invocation shifts b again and must find it already in UTC.
  previous = IOManager::load_report(report_path);
  ASSERT_TRUE(previous.has_value());
  EXPECT_EQ(previous->records.size(), 2);
  auto records = pipeline.load({b});
  ASSERT_EQ(restore_markers(records, *previous), 1);
  const BatchReport again =
      pipeline.run({Stage::SHIFT_TO_UTC}, options, std::move(records));

  const PhotoRecord& record = Find(again, b);
  EXPECT_EQ(record.outcome(Stage::SHIFT_TO_UTC).status, StageStatus::SKIPPED);
  EXPECT_EQ(*record.utc_time, parse_exif_timestamp("2024:06:01 08:00:02"));
  EXPECT_EQ(metadata.writes.at("IMG_0002.JPG").size(), 1);
}

TEST_F(PipelineTest, OrganizesEachInputDirectoryUnderItself) {
  const fs::path first = AddPhoto("trip/IMG_0001.JPG", "2024:06:01 10:00:01");
  const fs::path second = AddPhoto("home/IMG_0002.JPG", "2024:06:02 10:00:01");
  fs::create_directories(test_dir / "home" / "empty");
  options.roots = {test_dir / "trip", test_dir / "home"};
  options.assume_utc = true;
  const Pipeline pipeline = MakePipeline();

  const BatchReport report =
      pipeline.run({Stage::ORGANIZE}, options, pipeline.load({first, second}));

  EXPECT_EQ(report.state, RunState::COMPLETED);
  EXPECT_TRUE(
      fs::exists(test_dir / "trip" / "2024-06-01" / "IMG_0001.JPG"));
  EXPECT_TRUE(
      fs::exists(test_dir / "home" / "2024-06-02" / "IMG_0002.JPG"));
  EXPECT_FALSE(fs::exists(test_dir / "2024-06-01"));
  EXPECT_FALSE(fs::exists(test_dir / "2024-06-02"));
  // Each root is cleaned up, not only the first.
  EXPECT_FALSE(fs::exists(test_dir / "home" / "empty"));
}

TEST_F(PipelineTest, MalformedNamingPatternAbortsRename) {
  const fs::path photo = AddPhoto("IMG_0001.JPG", "2024:06:01 10:00:01");
  config.naming.file_format = "%Y}";
  options.camera_timezone = "+02:00";
  const Pipeline pipeline = MakePipeline();

  const BatchReport report =
      pipeline.run({Stage::SHIFT_TO_UTC, Stage::RENAME}, options,
                   pipeline.load({photo}));

  EXPECT_EQ(report.state, RunState::ABORTED);
  EXPECT_EQ(report.aborted_stage, Stage::RENAME);
  EXPECT_TRUE(report.abort_reason.starts_with("PlanningError"));
  // The shift already written is still reported so it can be saved.
  const PhotoRecord& record = Find(report, photo);
  EXPECT_TRUE(record.utc_shift_applied);
  EXPECT_EQ(record.outcome(Stage::SHIFT_TO_UTC).status, StageStatus::SUCCESS);
  EXPECT_TRUE(fs::exists(photo));
}

TEST_F(PipelineTest, UnreadableTagsFailTheRecordAtTheFirstStage) {
  const fs::path ok = AddPhoto("IMG_0001.JPG", "2024:06:01 10:00:01");
  const fs::path unreadable = test_dir / "IMG_0002.JPG";
  std::ofstream(unreadable) << "not a photo";
  options.camera_timezone = "+02:00";
  const Pipeline pipeline = MakePipeline();

  const BatchReport report =
      pipeline.run({Stage::SHIFT_TO_UTC, Stage::RENAME}, options,
                   pipeline.load({ok, unreadable}));

  EXPECT_EQ(report.state, RunState::COMPLETED);
  const PhotoRecord& broken = Find(report, unreadable);
  const StageResult& shift = broken.outcome(Stage::SHIFT_TO_UTC);
  EXPECT_EQ(shift.status, StageStatus::FAILED);
  EXPECT_EQ(shift.error, ErrorKind::IO);
  EXPECT_TRUE(shift.message.starts_with("cannot read tags"));
  EXPECT_EQ(broken.outcome(Stage::RENAME).status, StageStatus::SKIPPED);
  EXPECT_TRUE(fs::exists(unreadable));
  EXPECT_EQ(Find(report, ok).outcome(Stage::RENAME).status,
            StageStatus::SUCCESS);
}

TEST_F(PipelineTest, FailedSetTimeWriteRestoresEarlierConversion) {
  const fs::path photo = AddPhoto("IMG_0001.JPG", "2024:06:01 08:00:00");
  options.assume_utc = true;
  options.target_timezone = "Paris";
  options.dst = true;
  const Pipeline pipeline = MakePipeline();
  const BatchReport first =
      pipeline.run({Stage::SET_TIME}, options, pipeline.load({photo}));

  metadata.read_only.insert("IMG_0001.JPG");
  options.target_timezone = "+05:00";
  options.dst = false;
  const BatchReport second =
      pipeline.run({Stage::SET_TIME}, options, first.records);

  const PhotoRecord& record = Find(second, photo);
  EXPECT_EQ(record.outcome(Stage::SET_TIME).error, ErrorKind::IO);
  EXPECT_FALSE(record.utc_shift_applied);
  ASSERT_TRUE(record.applied_offset.has_value());
  EXPECT_EQ(record.applied_offset->minutes(), 120);
  EXPECT_EQ(*record.local_time, parse_exif_timestamp("2024:06:01 10:00:00"));
}
