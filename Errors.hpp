#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

enum class ErrorKind {
  NONE,
  UNKNOWN_TIMEZONE,
  TIMESTAMP_PARSE,
  MISSING_OFFSET,
  PLANNING,
  TOOL,
  IO,
  CANCELLED
};
NLOHMANN_JSON_SERIALIZE_ENUM(
    ErrorKind, {{ErrorKind::NONE, "None"},
                {ErrorKind::UNKNOWN_TIMEZONE, "UnknownTimezone"},
                {ErrorKind::TIMESTAMP_PARSE, "TimestampParseError"},
                {ErrorKind::MISSING_OFFSET, "MissingOffset"},
                {ErrorKind::PLANNING, "PlanningError"},
                {ErrorKind::TOOL, "ToolError"},
                {ErrorKind::IO, "IOError"},
                {ErrorKind::CANCELLED, "Cancelled"}});

inline std::string to_string(ErrorKind kind) {
  return nlohmann::json(kind).get<std::string>();
}

class PipelineError : public std::runtime_error {
 public:
  PipelineError(ErrorKind kind, const std::string& message)
      : std::runtime_error(message), m_kind(kind) {}

  ErrorKind kind() const noexcept { return m_kind; }

 private:
  ErrorKind m_kind;
};

// Unresolvable timezone identifier. Always fatal to the run.
class TimezoneError : public PipelineError {
 public:
  explicit TimezoneError(const std::string& message)
      : PipelineError(ErrorKind::UNKNOWN_TIMEZONE, message) {}
};

// Unresolved collision or move cycle. Nothing of the plan is applied.
class PlanningError : public PipelineError {
 public:
  explicit PlanningError(const std::string& message)
      : PipelineError(ErrorKind::PLANNING, message) {}
};

// The external tool itself is unusable. Escalated to a stage failure.
class ToolError : public PipelineError {
 public:
  explicit ToolError(const std::string& message)
      : PipelineError(ErrorKind::TOOL, message) {}
};

// A problem confined to one file. Recorded on that record only.
class RecordError : public PipelineError {
 public:
  using PipelineError::PipelineError;
};
