#pragma once

#include <algorithm>
#include <filesystem>
#include <format>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

// A central, thread-safe utility to convert a std::filesystem::path to a
// UTF-8 encoded std::string, suitable for logging, sorting and display.
inline std::string safe_path_to_string(const fs::path& p) {
  // path::u8string() is locale-independent and returns a UTF-8 encoded string.
  // On C++20/23, this returns a std::u8string, which needs to be converted.
  auto u8str = p.u8string();
  return std::string(reinterpret_cast<const char*>(u8str.c_str()),
                     u8str.length());
}

// Inverse of safe_path_to_string.
inline fs::path path_from_utf8(std::string_view utf8) {
  return fs::path(std::u8string(reinterpret_cast<const char8_t*>(utf8.data()),
                                utf8.size()));
}

// A simple, locale-independent function to convert a string to lowercase.
// It only handles basic ASCII characters, which is safe and sufficient for
// things like file extensions, city names and common keywords.
inline std::string string_to_lower_ascii(std::string_view sv) {
  std::string result;
  result.reserve(sv.length());
  for (char c : sv) {
    if (c >= 'A' && c <= 'Z') {
      result += static_cast<char>(c + ('a' - 'A'));
    } else {
      result += c;
    }
  }
  return result;
}

inline std::string_view trim_ascii(std::string_view sv) {
  const auto is_space = [](char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
  };
  while (!sv.empty() && is_space(sv.front())) sv.remove_prefix(1);
  while (!sv.empty() && is_space(sv.back())) sv.remove_suffix(1);
  return sv;
}

// Component-wise: "/a/bc" does not start with "/a/b".
inline bool path_starts_with(const fs::path& path, const fs::path& prefix) {
  if (prefix.empty()) return false;
  return std::mismatch(path.begin(), path.end(), prefix.begin(),
                       prefix.end())
             .second == prefix.end();
}

// Appends a sequence marker to the stem, e.g. "a.jpg" + 2 -> "a_2.jpg" for
// the default "_{}" format.
inline fs::path with_sequence_suffix(const fs::path& path, size_t sequence,
                                     std::string_view sequence_format) {
  const std::string stem_str = safe_path_to_string(path.stem());
  const std::string suffix =
      std::vformat(sequence_format, std::make_format_args(sequence));
  const std::string new_filename_str =
      stem_str + suffix + safe_path_to_string(path.extension());
  return path.parent_path() / path_from_utf8(new_filename_str);
}
