#include "ShiftEngine.hpp"

#include <format>
#include <numeric>

#include "utils.hpp"

ShiftSummary ShiftEngine::shift_batch(
    std::vector<PhotoRecord>& records, const std::vector<size_t>& indices,
    const TimezoneOffset& offset, ShiftDirection direction,
    std::optional<std::stop_token> stoken) const {
  ShiftSummary summary;
  for (size_t i : indices) {
    PhotoRecord& record = records.at(i);
    if (stoken && stoken->stop_requested()) {
      record.outcomes[m_stage] =
          StageResult::skipped("cancelled", ErrorKind::CANCELLED);
      ++summary.skipped;
      continue;
    }
    switch (shift_record(record, offset, direction).status) {
      case StageStatus::SUCCESS:
        ++summary.shifted;
        break;
      case StageStatus::FAILED:
        ++summary.failed;
        break;
      default:
        ++summary.skipped;
        break;
    }
  }
  return summary;
}

ShiftSummary ShiftEngine::shift_batch(
    std::vector<PhotoRecord>& records, const TimezoneOffset& offset,
    ShiftDirection direction, std::optional<std::stop_token> stoken) const {
  std::vector<size_t> all(records.size());
  std::iota(all.begin(), all.end(), size_t{0});
  return shift_batch(records, all, offset, direction, stoken);
}

StageResult ShiftEngine::shift_record(PhotoRecord& record,
                                      const TimezoneOffset& offset,
                                      ShiftDirection direction) const {
  StageResult result;
  if (direction == ShiftDirection::TO_UTC) {
    if (record.utc_shift_applied) {
      result = StageResult::skipped("already shifted to UTC");
    } else {
      if (!record.local_time && record.capture_raw) {
        record.local_time = parse_exif_timestamp(*record.capture_raw);
      }
      if (!record.local_time) {
        result = StageResult::failure(
            ErrorKind::TIMESTAMP_PARSE,
            std::format("Unreadable capture time '{}' in '{}'",
                        record.capture_raw.value_or(""),
                        safe_path_to_string(record.current_path)));
      } else {
        record.utc_time = *record.local_time - offset.duration();
        record.utc_shift_applied = true;
        record.camera_offset = offset;
        result = StageResult::success(std::format(
            "{} -> {} UTC", format_exif_timestamp(*record.local_time),
            format_exif_timestamp(*record.utc_time)));
      }
    }
  } else {
    if (!record.utc_shift_applied || !record.utc_time) {
      result = StageResult::skipped("timestamp is not in UTC");
    } else {
      record.local_time = *record.utc_time + offset.duration();
      record.utc_shift_applied = false;
      record.applied_offset = offset;
      result = StageResult::success(std::format(
          "{} UTC -> {} {}", format_exif_timestamp(*record.utc_time),
          format_exif_timestamp(*record.local_time), offset.to_string()));
    }
  }
  record.outcomes[m_stage] = result;
  return result;
}
