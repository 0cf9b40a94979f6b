#include "MetadataExtractor.hpp"

#include <cctype>
#include <cmath>
#include <filesystem>
#include <limits>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "core/Errors.hpp"
#include "ExifToolReader.hpp"

using nlohmann::json;

namespace psm {

namespace {

std::string trimmed(const std::string& s) {
  size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

[[noreturn]] void malformed(const std::string& path, const char* tag, const json& v) {
  throw ExtractionError("malformed " + std::string(tag) + " in " + path + ": " + v.dump());
}

const json* find_tag(const json& tags, const char* tag) {
  auto it = tags.find(tag);
  if (it == tags.end() || it->is_null()) return nullptr;
  return &*it;
}

int get_int(const json& tags, const char* tag, int def, const std::string& path) {
  const json* v = find_tag(tags, tag);
  if (!v) return def;

  long long n = 0;
  if (v->is_number_unsigned()) {
    if (v->get<unsigned long long>() >
        static_cast<unsigned long long>(std::numeric_limits<int>::max())) {
      malformed(path, tag, *v);
    }
    n = static_cast<long long>(v->get<unsigned long long>());
  } else if (v->is_number_integer()) {
    n = v->get<long long>();
  } else if (v->is_number_float()) {
    double d = v->get<double>();
    if (!std::isfinite(d)) malformed(path, tag, *v);
    n = static_cast<long long>(std::trunc(d));
  } else if (v->is_string()) {
    const std::string s = trimmed(v->get<std::string>());
    size_t pos = 0;
    try {
      n = std::stoll(s, &pos);
    } catch (const std::logic_error&) {
      malformed(path, tag, *v);
    }
    if (pos != s.size()) malformed(path, tag, *v);
  } else {
    malformed(path, tag, *v);
  }

  if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max()) {
    malformed(path, tag, *v);
  }
  return static_cast<int>(n);
}

double get_real(const json& tags, const char* tag, double def, const std::string& path) {
  const json* v = find_tag(tags, tag);
  if (!v) return def;

  if (v->is_number()) return v->get<double>();
  if (!v->is_string()) malformed(path, tag, *v);

  const std::string s = trimmed(v->get<std::string>());
  size_t pos = 0;
  double d = 0.0;
  try {
    d = std::stod(s, &pos);
  } catch (const std::logic_error&) {
    malformed(path, tag, *v);
  }
  if (pos != s.size()) malformed(path, tag, *v);
  return d;
}

std::string get_text(const json& tags, const char* tag) {
  const json* v = find_tag(tags, tag);
  if (!v) return {};
  return v->is_string() ? v->get<std::string>() : v->dump();
}

} // namespace

MetadataRecord MetadataExtractor::extract(const std::string& localPath) const {
  const json t = reader_.readTags(localPath);
  if (!t.is_object()) throw ExtractionError("no tag object for " + localPath);

  MetadataRecord r;
  r.file_name         = std::filesystem::path(localPath).filename().string();
  r.rating            = get_int(t, tags::kRating, 0, localPath);
  r.aperture          = get_real(t, tags::kAperture, 0.0, localPath);
  r.lens_id           = get_text(t, tags::kLensId);
  r.capture_time      = get_text(t, tags::kCaptureTime);
  r.focal_length      = get_real(t, tags::kFocalLength, 0.0, localPath);
  r.exposure_time     = get_real(t, tags::kExposureTime, 0.0, localPath);
  r.color_temperature = get_int(t, tags::kColorTemperature, 0, localPath);
  return r;
}

} // namespace psm
