#include "ReportView.hpp"

#include <array>
#include <format>
#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>
#include <vector>

#include "utils.hpp"

using namespace ftxui;

namespace {

std::string to_text(const Element& document) {
  auto screen = Screen::Create(Dimension::Fit(document));
  Render(screen, document);
  return screen.ToString() + "\n";
}

void style_table(Table& table) {
  table.SelectAll().Border(LIGHT);
  table.SelectAll().SeparatorVertical(LIGHT);
  table.SelectRow(0).Decorate(bold);
  table.SelectRow(0).SeparatorHorizontal(LIGHT);
  table.SelectRow(0).Border(LIGHT);
}

Element state_line(const BatchReport& report) {
  const std::string state = json(report.state).get<std::string>();
  std::string line = std::format(" Run {}: {} records, {} with failures ",
                                 state, report.records.size(),
                                 report.failed_records());
  if (report.dry_run) line += "(dry run) ";

  Element element = text(line) | bold;
  switch (report.state) {
    case RunState::COMPLETED:
      return element | color(report.failed_records() ? Color::Yellow
                                                     : Color::Green);
    case RunState::ABORTED:
      return element | color(Color::Red);
    default:
      return element;
  }
}

Element stage_table(const BatchReport& report) {
  std::vector<std::vector<std::string>> rows = {
      {"Stage", "Succeeded", "Skipped", "Failed", "Pending"}};
  for (Stage stage : report.pipeline) {
    std::array<size_t, 4> counts{};
    for (const auto& record : report.records) {
      counts[static_cast<size_t>(record.outcome(stage).status)]++;
    }
    rows.push_back({to_string(stage),
                    std::to_string(counts[size_t(StageStatus::SUCCESS)]),
                    std::to_string(counts[size_t(StageStatus::SKIPPED)]),
                    std::to_string(counts[size_t(StageStatus::FAILED)]),
                    std::to_string(counts[size_t(StageStatus::PENDING)])});
  }

  Table table(std::move(rows));
  style_table(table);
  for (size_t i = 0; i < report.pipeline.size(); ++i) {
    if (report.aborted_stage == report.pipeline[i]) {
      table.SelectRow(static_cast<int>(i) + 1).Decorate(color(Color::Red));
    }
  }
  return table.Render();
}

Element failure_table(const BatchReport& report) {
  std::vector<std::vector<std::string>> rows = {
      {"File", "Stage", "Error", "Message"}};
  for (const auto& record : report.records) {
    for (const auto& [stage, result] : record.outcomes) {
      if (result.status != StageStatus::FAILED) continue;
      rows.push_back({safe_path_to_string(record.current_path),
                      to_string(stage), to_string(result.error),
                      result.message});
    }
  }
  if (rows.size() == 1) return text("No record failures.");

  Table table(std::move(rows));
  style_table(table);
  return table.Render();
}

}  // namespace

std::string render_report(const BatchReport& report) {
  Elements lines = {state_line(report)};
  if (report.state == RunState::ABORTED && report.aborted_stage) {
    lines.push_back(text(std::format(" Aborted at '{}': {}",
                                     to_string(*report.aborted_stage),
                                     report.abort_reason)) |
                    color(Color::Red));
  }
  if (!report.pipeline.empty()) lines.push_back(stage_table(report));
  lines.push_back(failure_table(report));
  return to_text(vbox(std::move(lines)));
}

std::string render_offsets(
    const std::map<fs::path, std::optional<TimezoneOffset>>& offsets) {
  std::vector<std::vector<std::string>> rows = {
      {"Directory", "Offset", "Source"}};
  for (const auto& [dir, offset] : offsets) {
    if (offset) {
      rows.push_back(
          {safe_path_to_string(dir), offset->to_string(), offset->label()});
    } else {
      rows.push_back({safe_path_to_string(dir), "unknown", "-"});
    }
  }

  Table table(std::move(rows));
  style_table(table);
  return to_text(table.Render());
}
