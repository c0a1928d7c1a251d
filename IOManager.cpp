#include "IOManager.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <fstream>
#include <functional>
#include <mutex>
#include <set>
#include <system_error>

#include "TimezoneResolver.hpp"
#include "utils.hpp"

namespace {
std::ofstream g_log_file;

std::mutex log_mutex;

std::function<void(std::string_view)> g_log_handler = nullptr;

bool has_suffix(const fs::path& p, const std::vector<std::string>& suffixes) {
  std::string ext = string_to_lower_ascii(safe_path_to_string(p.extension()));
  if (ext.starts_with(".")) ext.erase(0, 1);
  return std::find(suffixes.begin(), suffixes.end(), ext) != suffixes.end();
}

bool is_track(const fs::path& p) {
  return string_to_lower_ascii(safe_path_to_string(p.extension())) == ".gpx";
}

// Throws std::format_error when a pattern cannot format a sample time.
void check_naming(const NamingScheme& naming) {
  const Timestamp sample{std::chrono::sys_days{
      std::chrono::year{2024} / std::chrono::June / 1}};
  format_timestamp(sample, naming.directory_format);
  format_timestamp(sample, naming.file_format);
  with_sequence_suffix("IMG_0001.JPG", 2, naming.sequence_format);
}

fs::path common_ancestor(const std::vector<fs::path>& paths) {
  fs::path common = paths.front();
  for (const auto& p : paths) {
    fs::path prefix;
    auto a = common.begin();
    auto b = p.begin();
    for (; a != common.end() && b != p.end() && *a == *b; ++a, ++b) {
      prefix /= *a;
    }
    common = prefix;
  }
  return common;
}

}  // namespace

void IOManager::initialize_logger(const fs::path& logPath) {
  std::scoped_lock lock(log_mutex);
  if (g_log_file.is_open()) g_log_file.close();
  g_log_file.open(logPath, std::ios_base::app);
}

void IOManager::set_log_handler(std::function<void(std::string_view)> handler) {
  std::scoped_lock lock(log_mutex);
  g_log_handler = handler;
}

void IOManager::log(std::string_view message) {
  std::scoped_lock lock(log_mutex);

  auto now = std::chrono::floor<std::chrono::seconds>(
      std::chrono::system_clock::now());
  auto time_str = std::format("{:%Y-%m-%d %H:%M:%S}", now);
  std::string full_message = std::format("{} | {}", time_str, message);

  if (g_log_handler) {
    g_log_handler(full_message);
  }

  if (g_log_file.is_open()) {
    g_log_file << full_message << "\n" << std::flush;
  }
}

std::vector<fs::path> IOManager::config_search_paths(const fs::path& exeDir) {
  return {exeDir / "config.json", fs::current_path() / "config.json",
          exeDir.parent_path() / "config.json"};
}

std::optional<Config> IOManager::load_config(const fs::path& configPath) {
  if (!fs::exists(configPath)) {
    log(std::format("Error: Config file not found at {}",
                    safe_path_to_string(configPath)));
    return std::nullopt;
  }
  std::ifstream configFile(configPath);
  try {
    json configJson = json::parse(configFile);
    Config config;
    if (configJson.contains("suffixes")) {
      config.suffixes.clear();
      for (const auto& s : configJson["suffixes"]) {
        std::string ext = string_to_lower_ascii(s.get<std::string>());
        if (ext.starts_with(".")) ext.erase(0, 1);
        config.suffixes.push_back(ext);
      }
    }
    config.timerange = configJson.value("timerange", config.timerange);
    config.concurrency = configJson.value("concurrency", config.concurrency);
    config.dry_run = configJson.value("dry_run", config.dry_run);
    if (configJson.contains("naming")) {
      config.naming = configJson["naming"].get<NamingScheme>();
      check_naming(config.naming);
    }
    if (configJson.contains("timezones")) {
      for (const auto& [name, entry] : configJson["timezones"].items()) {
        const std::string offset = entry.at("offset").get<std::string>();
        auto minutes = parse_offset(offset);
        if (!minutes) {
          throw TimezoneError(std::format(
              "timezone '{}' has invalid offset '{}'", name, offset));
        }
        config.timezones[name] = CityEntry{*minutes, entry.value("id", 0)};
      }
    }
    config.metadata_tool =
        configJson.value("metadata_tool", config.metadata_tool);
    config.geotag_command =
        configJson.value("geotag_command", config.geotag_command);
    config.report_name = configJson.value("report_name", config.report_name);
    if (configJson.contains("log_file")) {
      config.log_file = configJson["log_file"].get<std::string>();
    }
    return config;
  } catch (const json::exception& e) {
    log(std::format("Error parsing config.json: {}", e.what()));
    return std::nullopt;
  } catch (const PipelineError& e) {
    log(std::format("Error in config.json: {}", e.what()));
    return std::nullopt;
  } catch (const std::format_error& e) {
    log(std::format("Error in config.json: invalid naming pattern: {}",
                    e.what()));
    return std::nullopt;
  }
}

fs::path IOManager::locate_report(std::vector<fs::path> roots,
                                  const std::string& reportName) {
  if (roots.empty()) return fs::current_path() / reportName;
  std::sort(roots.begin(), roots.end());

  for (const auto& root : roots) {
    for (fs::path dir = root; !dir.empty(); dir = dir.parent_path()) {
      std::error_code ec;
      if (fs::exists(dir / reportName, ec)) return dir / reportName;
      if (dir == dir.parent_path()) break;
    }
  }

  const fs::path common = common_ancestor(roots);
  if (common.empty() || common == common.root_path()) {
    return roots.front() / reportName;
  }
  return common / reportName;
}

ScanResult IOManager::scan_inputs(const std::vector<fs::path>& inputs,
                                  const std::vector<std::string>& suffixes) {
  std::set<fs::path> images;
  std::set<fs::path> tracks;

  auto consider = [&](const fs::path& p) {
    if (is_track(p)) {
      tracks.insert(p);
    } else if (has_suffix(p, suffixes)) {
      images.insert(p);
    }
  };

  for (const auto& input : inputs) {
    std::error_code ec;
    const fs::path abs = fs::weakly_canonical(input, ec);
    if (ec || !fs::exists(abs)) {
      log(std::format("Warning: Path '{}' does not exist, skipping.",
                      safe_path_to_string(input)));
      continue;
    }
    if (fs::is_regular_file(abs)) {
      consider(abs);
      continue;
    }
    try {
      for (const auto& entry : fs::recursive_directory_iterator(
               abs, fs::directory_options::skip_permission_denied)) {
        if (entry.is_regular_file()) consider(entry.path());
      }
    } catch (const fs::filesystem_error& e) {
      log(std::format("Error during directory scan of '{}': {}. Skipping.",
                      safe_path_to_string(abs), e.what()));
    }
  }

  log(std::format("Found {} media files and {} track files.", images.size(),
                  tracks.size()));
  return {{images.begin(), images.end()}, {tracks.begin(), tracks.end()}};
}

size_t IOManager::remove_empty_dirs(const fs::path& root, bool dryRun) {
  std::error_code ec;
  if (!fs::is_directory(root, ec)) return 0;

  std::vector<fs::path> dirs;
  for (const auto& entry : fs::recursive_directory_iterator(
           root, fs::directory_options::skip_permission_denied, ec)) {
    if (entry.is_directory()) dirs.push_back(entry.path());
  }
  // Longest paths first so children go before their parents.
  std::sort(dirs.begin(), dirs.end(), [](const auto& a, const auto& b) {
    return a.native().size() > b.native().size();
  });

  size_t removed = 0;
  for (const auto& dir : dirs) {
    if (!fs::is_empty(dir, ec) || ec) continue;
    if (dryRun) {
      log(std::format("DRY-RUN: Removing empty directory: '{}'",
                      safe_path_to_string(dir)));
    } else {
      fs::remove(dir, ec);
      if (ec) {
        log(std::format("Failed to remove '{}': {}", safe_path_to_string(dir),
                        ec.message()));
        continue;
      }
      log(std::format("Removed empty directory: '{}'",
                      safe_path_to_string(dir)));
    }
    ++removed;
  }
  return removed;
}

std::optional<BatchReport> IOManager::load_report(const fs::path& reportPath) {
  if (!fs::exists(reportPath)) return std::nullopt;
  std::ifstream reportFile(reportPath);
  try {
    return json::parse(reportFile).get<BatchReport>();
  } catch (const json::exception& e) {
    log(std::format("Ignoring unreadable report '{}': {}",
                    safe_path_to_string(reportPath), e.what()));
  } catch (const std::invalid_argument& e) {
    log(std::format("Ignoring unreadable report '{}': {}",
                    safe_path_to_string(reportPath), e.what()));
  } catch (const PipelineError& e) {
    log(std::format("Ignoring report '{}': {}",
                    safe_path_to_string(reportPath), e.what()));
  }
  return std::nullopt;
}

void IOManager::save_report(const fs::path& reportPath,
                            const BatchReport& report) {
  std::ofstream r_file(reportPath);
  if (!r_file) {
    log(std::format("Error: cannot write report '{}'",
                    safe_path_to_string(reportPath)));
    return;
  }
  r_file << json(report).dump(2);
  log(std::format("Report saved to '{}' ({} records, {} moves).",
                  safe_path_to_string(reportPath), report.records.size(),
                  report.moves.size()));
}

void IOManager::run_undo(const fs::path& reportPath) {
  auto report = load_report(reportPath);
  if (!report) {
    log("No report found. Nothing to undo.");
    return;
  }
  if (report->moves.empty()) {
    log("Report lists no moves. Nothing to undo.");
    return;
  }

  log("Starting undo operation...");
  std::vector<JournalEntry> remaining;
  for (auto it = report->moves.rbegin(); it != report->moves.rend(); ++it) {
    const auto& entry = *it;
    if (entry.action != ActionType::MOVE) continue;
    log(std::format("Undoing move: '{}' -> '{}'", safe_path_to_string(entry.to),
                    safe_path_to_string(entry.from)));
    try {
      if (fs::exists(entry.from)) {
        throw fs::filesystem_error(
            "original path is occupied", entry.from,
            std::make_error_code(std::errc::file_exists));
      }
      if (entry.from.has_parent_path() &&
          !fs::exists(entry.from.parent_path())) {
        fs::create_directories(entry.from.parent_path());
      }
      fs::rename(entry.to, entry.from);
      for (auto& record : report->records) {
        if (record.current_path == entry.to) record.current_path = entry.from;
      }
    } catch (const fs::filesystem_error& e) {
      log(std::format("   Error undoing move: {}", e.what()));
      remaining.push_back(entry);
    }
  }
  std::reverse(remaining.begin(), remaining.end());
  report->moves = std::move(remaining);
  save_report(reportPath, *report);
  log("Undo complete. Tag changes are not reverted.");
}
