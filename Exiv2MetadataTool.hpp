#pragma once

#include "ExternalTools.hpp"

// In-process metadata access through Exiv2. Exiv2 is not safe for concurrent
// use, so every call holds one process-wide lock.
class Exiv2MetadataTool : public MetadataTool {
 public:
  Tags read_tags(const fs::path& path) override;
  void write_tags(const fs::path& path, const Tags& tags) override;
};
