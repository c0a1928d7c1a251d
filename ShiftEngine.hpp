#pragma once

#include <optional>
#include <stop_token>
#include <vector>

#include "types.hpp"

enum class ShiftDirection { TO_UTC, TO_LOCAL };

struct ShiftSummary {
  size_t shifted = 0;
  size_t skipped = 0;
  size_t failed = 0;
};

// Applies one uniform offset to a set of records. Each record carries its own
// utc_shift_applied marker, so repeating a shift never moves a timestamp
// twice, and a record that fails to parse never blocks the others.
class ShiftEngine {
 public:
  // Outcomes are recorded under `stage`.
  explicit ShiftEngine(Stage stage) : m_stage(stage) {}

  ShiftSummary shift_batch(
      std::vector<PhotoRecord>& records, const std::vector<size_t>& indices,
      const TimezoneOffset& offset, ShiftDirection direction,
      std::optional<std::stop_token> stoken = std::nullopt) const;

  // Every record of the batch.
  ShiftSummary shift_batch(
      std::vector<PhotoRecord>& records, const TimezoneOffset& offset,
      ShiftDirection direction,
      std::optional<std::stop_token> stoken = std::nullopt) const;

  // Shifts a single record. Returns the outcome that was recorded.
  StageResult shift_record(PhotoRecord& record, const TimezoneOffset& offset,
                           ShiftDirection direction) const;

 private:
  Stage m_stage;
};
