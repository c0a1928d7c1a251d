#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

// Seconds since the epoch. Camera-local capture times are held in the same
// type as naive wall-clock values; only PhotoRecord::utc_time is true UTC.
using Timestamp = std::chrono::sys_seconds;

// Accepts "YYYY:MM:DD HH:MM:SS" as written by cameras, and the ISO variants
// "YYYY-MM-DD HH:MM:SS" / "YYYY-MM-DDTHH:MM:SS". Trailing sub-second or
// offset text is ignored.
std::optional<Timestamp> parse_exif_timestamp(std::string_view text);

// GPSDateStamp ("YYYY:MM:DD") plus GPSTimeStamp ("HH:MM:SS" or "HH MM SS").
std::optional<Timestamp> parse_gps_timestamp(std::string_view date,
                                             std::string_view time);

std::string format_exif_timestamp(Timestamp ts);
std::string format_iso_timestamp(Timestamp ts);

// strftime-style pattern, e.g. "%Y-%m-%d_%H-%M-%S". Throws std::format_error
// on a malformed pattern.
std::string format_timestamp(Timestamp ts, std::string_view pattern);
