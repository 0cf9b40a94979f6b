#pragma once
#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

namespace psm {

// Source of raw, group-qualified tags ("EXIF:FNumber" -> 2.8) for one file.
// Implementations must be safe to call from several threads at once.
class MetadataReader {
public:
  virtual ~MetadataReader() = default;

  // Throws ExtractionError when the file's metadata cannot be read.
  virtual nlohmann::json readTags(const std::string& path) = 0;
};

// Runs `exiftool -G -n -j <path>` once per file. The child is killed if it
// has not finished within `timeout`.
class ExifToolReader : public MetadataReader {
public:
  explicit ExifToolReader(std::string executable = "exiftool",
                          std::chrono::milliseconds timeout = std::chrono::seconds(30));

  nlohmann::json readTags(const std::string& path) override;

private:
  std::string               executable_;
  std::chrono::milliseconds timeout_;
};

} // namespace psm
