#pragma once

#include <functional>
#include <optional>

#include "types.hpp"

struct ScanResult {
  std::vector<fs::path> images;
  std::vector<fs::path> tracks;
};

namespace IOManager {
void initialize_logger(const fs::path& logPath);

void set_log_handler(std::function<void(std::string_view)> handler);

void log(std::string_view message);

std::vector<fs::path> config_search_paths(const fs::path& exeDir);
std::optional<Config> load_config(const fs::path& configPath);

// Files matching the configured suffixes and .gpx track logs, from plain
// file arguments and recursively from directories. Sorted, de-duplicated.
ScanResult scan_inputs(const std::vector<fs::path>& inputs,
                       const std::vector<std::string>& suffixes);

// Deletes directories under root that are empty, deepest first.
size_t remove_empty_dirs(const fs::path& root, bool dryRun);

// The report shared by runs over these roots: the nearest existing one at or
// above a root, else a new one in their common directory (the first root
// when they only share the filesystem root). Independent of root order.
fs::path locate_report(std::vector<fs::path> roots,
                       const std::string& reportName);

std::optional<BatchReport> load_report(const fs::path& reportPath);
void save_report(const fs::path& reportPath, const BatchReport& report);

// Moves every file listed in the report back, newest move first, and
// rewrites the report without those moves.
void run_undo(const fs::path& reportPath);
}  // namespace IOManager
