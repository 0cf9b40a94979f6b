#pragma once
#include <string>

namespace psm {

struct MetadataRecord {
  std::string file_name;          // primary key
  int         rating = 0;
  double      aperture = 0.0;
  std::string lens_id;
  std::string capture_time;       // as the camera formats it
  double      focal_length = 0.0;
  double      exposure_time = 0.0;
  int         color_temperature = 0;

  // Same capture regardless of file name.
  bool sameFingerprint(const MetadataRecord& o) const {
    return rating == o.rating && aperture == o.aperture && lens_id == o.lens_id &&
           capture_time == o.capture_time && focal_length == o.focal_length &&
           exposure_time == o.exposure_time && color_temperature == o.color_temperature;
  }

  bool operator==(const MetadataRecord& o) const {
    return file_name == o.file_name && sameFingerprint(o);
  }
  bool operator!=(const MetadataRecord& o) const { return !(*this == o); }
};

} // namespace psm
