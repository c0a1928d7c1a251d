#pragma once

#include <string>

#include "ExternalTools.hpp"

// Metadata access by shelling out to exiftool. Slower than Exiv2 but covers
// video containers as well.
class ExiftoolMetadataTool : public MetadataTool {
 public:
  explicit ExiftoolMetadataTool(std::string program = "exiftool");

  Tags read_tags(const fs::path& path) override;
  void write_tags(const fs::path& path, const Tags& tags) override;

 private:
  void check_exit(int exit_code, const fs::path& path,
                  const std::string& output) const;

  std::string m_program;
};
