#include <algorithm>
#include <boost/program_options.hpp>
#include <chrono>
#include <csignal>
#include <exception>
#include <exiv2/exiv2.hpp>
#include <format>
#include <iostream>
#include <memory>
#include <print>
#include <stop_token>
#include <thread>
#include <vector>

#include "ExiftoolMetadataTool.hpp"
#include "Exiv2MetadataTool.hpp"
#include "GpicsyncGeotagTool.hpp"
#include "IOManager.hpp"
#include "Pipeline.hpp"
#include "ReportView.hpp"
#include "types.hpp"
#include "utils.hpp"

namespace po = boost::program_options;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitAborted = 1;
constexpr int kExitRecordFailures = 2;

volatile std::sig_atomic_t g_interrupted = 0;

void on_interrupt(int) { g_interrupted = 1; }

// Keeps the XMP toolkit initialized for the lifetime of main.
struct Exiv2Session {
  Exiv2Session() {
    Exiv2::XmpParser::initialize();
    Exiv2::LogMsg::setLevel(Exiv2::LogMsg::error);
  }
  ~Exiv2Session() { Exiv2::XmpParser::terminate(); }
};

const char* kUsage =
    "Usage: photo_process <command> [options] <files or directories>...\n"
    "\n"
    "Commands:\n"
    "  process          shift-to-utc, organize, geotag, set-time, rename\n"
    "                   (dry run unless --force)\n"
    "  shift-to-utc     convert capture times from camera time to UTC\n"
    "  organize         move files into one directory per day\n"
    "  geotag           write coordinates from GPX track logs\n"
    "  set-time         write capture times in the target timezone\n"
    "  rename           rename files after their capture time\n"
    "  detect-timezone  print the camera offset found per directory\n"
    "  undo             move files back to where the last report found them\n";

std::optional<PipelineSpec> pipeline_for(const std::string& command) {
  if (command == "process") return process_pipeline();
  if (auto stage = parse_stage(command)) return PipelineSpec{*stage};
  return std::nullopt;
}

fs::path executable_dir(const char* argv0) {
  fs::path exePath = argv0 ? fs::path(argv0).parent_path() : fs::path();
  if (exePath.empty()) exePath = fs::current_path();
  return exePath;
}

// Built-in defaults when no config file exists; nullopt when one exists but
// cannot be used.
std::optional<Config> find_config(const po::variables_map& flags,
                                  const fs::path& exeDir) {
  if (flags.contains("config")) {
    return IOManager::load_config(flags["config"].as<std::string>());
  }
  for (const auto& configPath : IOManager::config_search_paths(exeDir)) {
    IOManager::log(std::format("Trying config path: {}",
                               safe_path_to_string(configPath)));
    if (fs::exists(configPath)) {
      IOManager::log(std::format("Found config.json at: {}",
                                 safe_path_to_string(configPath)));
      return IOManager::load_config(configPath);
    }
  }
  IOManager::log("No config.json found. Using built-in defaults.");
  return Config{};
}

void apply_overrides(const po::variables_map& flags,
                     const std::string& command, Config& config) {
  if (flags.contains("suffix")) {
    config.suffixes.clear();
    for (const auto& s : flags["suffix"].as<std::vector<std::string>>()) {
      std::string ext = string_to_lower_ascii(s);
      if (ext.starts_with(".")) ext.erase(0, 1);
      config.suffixes.push_back(ext);
    }
  }
  if (flags.contains("timerange")) {
    config.timerange = flags["timerange"].as<int>();
  }
  if (flags.contains("jobs")) {
    config.concurrency = std::max(flags["jobs"].as<unsigned>(), 1u);
  }
  if (flags["dry-run"].as<bool>()) config.dry_run = true;
  if (command == "process" && !flags["force"].as<bool>()) {
    config.dry_run = true;
  }
}

// Absolute, like the paths the scan returns.
fs::path root_of(const fs::path& input) {
  std::error_code ec;
  fs::path abs = fs::weakly_canonical(input, ec);
  if (ec) abs = fs::absolute(input, ec);
  if (fs::is_directory(abs, ec)) return abs;
  fs::path parent = abs.parent_path();
  return parent.empty() ? fs::current_path() : parent;
}

std::unique_ptr<MetadataTool> make_metadata_tool(const Config& config) {
  if (config.metadata_tool == "exiv2") {
    return std::make_unique<Exiv2MetadataTool>();
  }
  if (config.metadata_tool == "exiftool") {
    return std::make_unique<ExiftoolMetadataTool>();
  }
  throw ToolError(
      std::format("unknown metadata tool '{}'", config.metadata_tool));
}

int exit_code_for(const BatchReport& report) {
  if (report.state != RunState::COMPLETED) return kExitAborted;
  return report.failed_records() ? kExitRecordFailures : kExitOk;
}

int run_command(const po::variables_map& flags, const std::string& command,
                const fs::path& exeDir) {
  auto configOpt = find_config(flags, exeDir);
  if (!configOpt) {
    IOManager::log("CRITICAL: Failed to load configuration.");
    std::println(stderr, "Failed to load config.json. Check the log.");
    return kExitAborted;
  }
  Config config = std::move(*configOpt);
  apply_overrides(flags, command, config);
  if (config.log_file != Config{}.log_file) {
    IOManager::initialize_logger(config.log_file);
  }

  std::vector<fs::path> inputs;
  if (flags.contains("inputs")) {
    for (const auto& s : flags["inputs"].as<std::vector<std::string>>()) {
      inputs.push_back(path_from_utf8(s));
    }
  }
  if (inputs.empty()) {
    std::println(stderr, "No input files or directories given.\n\n{}",
                 kUsage);
    return kExitAborted;
  }

  std::vector<fs::path> roots;
  for (const auto& input : inputs) {
    fs::path root = root_of(input);
    if (std::find(roots.begin(), roots.end(), root) == roots.end()) {
      roots.push_back(std::move(root));
    }
  }
  const fs::path reportPath =
      flags.contains("report")
          ? path_from_utf8(flags["report"].as<std::string>())
          : IOManager::locate_report(roots, config.report_name);
  IOManager::log(std::format("Using report '{}'.",
                             safe_path_to_string(reportPath)));

  if (command == "undo") {
    IOManager::run_undo(reportPath);
    return kExitOk;
  }

  std::optional<PipelineSpec> spec;
  if (command != "detect-timezone") {
    spec = pipeline_for(command);
    if (!spec) {
      std::println(stderr, "Unknown command '{}'.\n\n{}", command, kUsage);
      return kExitAborted;
    }
  }

  const ScanResult scan = IOManager::scan_inputs(inputs, config.suffixes);
  IOManager::log(std::format("Found {} files and {} track logs.",
                             scan.images.size(), scan.tracks.size()));
  if (scan.images.empty()) {
    std::println("No matching files found.");
    return kExitOk;
  }

  std::unique_ptr<MetadataTool> metadata = make_metadata_tool(config);
  GpicsyncGeotagTool geotagger(*metadata, config.geotag_command,
                               config.timerange);
  const TimezoneResolver resolver(
      TimezoneTable::builtin().with_overrides(config.timezones));
  const Pipeline pipeline(config, resolver, *metadata, geotagger);

  std::stop_source stop;
  std::signal(SIGINT, on_interrupt);
  std::jthread watcher([&stop](std::stop_token st) {
    while (!st.stop_requested()) {
      if (g_interrupted) {
        IOManager::log("Interrupt received. Stopping after current files...");
        stop.request_stop();
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  });

  std::vector<PhotoRecord> records =
      pipeline.load(scan.images, stop.get_token());
  if (stop.stop_requested()) {
    IOManager::log("Cancelled while reading metadata.");
    return kExitAborted;
  }

  if (command == "detect-timezone") {
    std::print("{}",
               render_offsets(pipeline.detect_directory_offsets(records)));
    return kExitOk;
  }

  const auto previous = IOManager::load_report(reportPath);
  if (previous) {
    const size_t restored = restore_markers(records, *previous);
    IOManager::log(std::format("Restored markers of {} records from '{}'.",
                               restored, safe_path_to_string(reportPath)));
  }

  RunOptions options;
  if (flags.contains("camera-timezone")) {
    options.camera_timezone = flags["camera-timezone"].as<std::string>();
  }
  if (flags.contains("timezone")) {
    options.target_timezone = flags["timezone"].as<std::string>();
  }
  options.dst = flags["dst"].as<bool>();
  options.assume_utc = flags["assume-utc"].as<bool>();
  options.roots = roots;
  if (flags.contains("gpx")) {
    for (const auto& s : flags["gpx"].as<std::vector<std::string>>()) {
      options.track_files.push_back(path_from_utf8(s));
    }
  }
  for (const auto& track : scan.tracks) {
    if (std::find(options.track_files.begin(), options.track_files.end(),
                  track) == options.track_files.end()) {
      options.track_files.push_back(track);
    }
  }

  BatchReport report;
  try {
    report = pipeline.run(*spec, options, std::move(records), stop.get_token());
  } catch (const TimezoneError& e) {
    IOManager::log(std::format("CRITICAL: {}", e.what()));
    std::println(stderr, "{}: {}", to_string(e.kind()), e.what());
    return kExitAborted;
  }

  const std::string summary = render_report(report);
  const int exitCode = exit_code_for(report);

  if (config.dry_run) {
    IOManager::log("Dry run. Report not saved.");
  } else {
    if (previous) {
      const size_t kept = carry_over(report, *previous, scan.images);
      IOManager::log(std::format(
          "Kept {} records of files outside this run in the report.", kept));
    }
    IOManager::save_report(reportPath, report);
  }

  std::print("{}", summary);
  return exitCode;
}

}  // namespace

int main(int argc, char* argv[]) {
  Exiv2Session exiv2;

  try {
    po::options_description visible("Options");
    visible.add_options()("help,h", "List command line options")(
        "timezone,z", po::value<std::string>(),
        "Target timezone for set-time: city name or offset like +02:00")(
        "camera-timezone", po::value<std::string>(),
        "Timezone the camera clock was set to. Skips detection.")(
        "dst", po::bool_switch(), "Target timezone is in daylight saving")(
        "gpx,g", po::value<std::vector<std::string>>()->composing(),
        "GPX track log (repeatable)")(
        "assume-utc", po::bool_switch(),
        "Treat unshifted capture times as UTC already")(
        "force", po::bool_switch(), "Let 'process' change files")(
        "dry-run", po::bool_switch(), "Plan and report without changes")(
        "config", po::value<std::string>(), "Path to config.json")(
        "report", po::value<std::string>(), "Path of the JSON run report")(
        "suffix,e", po::value<std::vector<std::string>>()->composing(),
        "File suffix to include (repeatable)")(
        "timerange", po::value<int>(),
        "Max seconds between photo and track point")(
        "jobs,j", po::value<unsigned>(), "Files handled in parallel")(
        "verbose,v", po::bool_switch(), "Echo the log to stderr");

    po::options_description hidden;
    hidden.add_options()("command", po::value<std::string>())(
        "inputs", po::value<std::vector<std::string>>());

    po::options_description all;
    all.add(visible).add(hidden);

    po::positional_options_description positional;
    positional.add("command", 1).add("inputs", -1);

    po::variables_map flags;
    po::store(po::command_line_parser(argc, argv)
                  .options(all)
                  .positional(positional)
                  .run(),
              flags);
    po::notify(flags);

    if (flags.contains("help") || !flags.contains("command")) {
      std::cout << kUsage << "\n" << visible << std::endl;
      return flags.contains("help") ? kExitOk : kExitAborted;
    }

    if (flags["verbose"].as<bool>()) {
      IOManager::set_log_handler([](std::string_view message) {
        std::println(stderr, "{}", message);
      });
    }
    IOManager::initialize_logger(Config{}.log_file);
    IOManager::log("--- photo_process started ---");

    const std::string command = flags["command"].as<std::string>();
    const fs::path exeDir = executable_dir(argc > 0 ? argv[0] : nullptr);
    const int code = run_command(flags, command, exeDir);
    IOManager::log(std::format("--- photo_process exited ({}) ---", code));
    return code;

  } catch (const po::error& e) {
    std::println(stderr, "error: {}\n\n{}", e.what(), kUsage);
    return kExitAborted;
  } catch (const PipelineError& e) {
    IOManager::log(
        std::format("FATAL: {}: {}", to_string(e.kind()), e.what()));
    std::println(stderr, "{}: {}", to_string(e.kind()), e.what());
    return kExitAborted;
  } catch (const std::exception& e) {
    IOManager::log(std::format("FATAL EXCEPTION: {}", e.what()));
    std::println(stderr, "Exception: {}", e.what());
    std::println(stderr, "Check the log for details.");
    return kExitAborted;
  }
}
