#pragma once
#include <string>

#include "MetadataRecord.hpp"

namespace psm {

class MetadataReader;

// Tag names read from the reader output (exiftool group-qualified names).
namespace tags {
constexpr const char* kRating           = "XMP:Rating";
constexpr const char* kAperture         = "EXIF:FNumber";
constexpr const char* kLensId           = "Composite:LensSpec";
constexpr const char* kCaptureTime      = "EXIF:DateTimeOriginal";
constexpr const char* kFocalLength      = "EXIF:FocalLength";
constexpr const char* kExposureTime     = "EXIF:ExposureTime";
constexpr const char* kColorTemperature = "EXIF:WhiteBalance";
} // namespace tags

// Maps one file's tags onto a MetadataRecord. Absent (or null) tags take
// the field defaults; a present tag that cannot be coerced fails the whole
// file with ExtractionError.
class MetadataExtractor {
public:
  explicit MetadataExtractor(MetadataReader& reader) : reader_(reader) {}

  MetadataRecord extract(const std::string& localPath) const;

private:
  MetadataReader& reader_;
};

} // namespace psm
