#include "Exiv2MetadataTool.hpp"

#include <cmath>
#include <exiv2/exiv2.hpp>
#include <format>
#include <mutex>

#include "utils.hpp"

namespace {
std::mutex g_exiv2_mutex;

constexpr const char* kDateTimeOriginal = "Exif.Photo.DateTimeOriginal";
constexpr const char* kDateTimeDigitized = "Exif.Photo.DateTimeDigitized";
constexpr const char* kDateTime = "Exif.Image.DateTime";
constexpr const char* kOffsetTime = "Exif.Photo.OffsetTime";
constexpr const char* kOffsetTimeOriginal = "Exif.Photo.OffsetTimeOriginal";
constexpr const char* kOffsetTimeDigitized = "Exif.Photo.OffsetTimeDigitized";
constexpr const char* kCanonTimeZone = "Exif.CanonTi.TimeZone";
constexpr const char* kCanonTimeZoneCity = "Exif.CanonTi.TimeZoneCity";
constexpr const char* kCanonDaylightSavings = "Exif.CanonTi.DaylightSavings";

std::optional<std::string> string_tag(Exiv2::ExifData& exif, const char* key) {
  auto pos = exif.findKey(Exiv2::ExifKey(key));
  if (pos == exif.end() || pos->count() == 0) return std::nullopt;
  std::string value(trim_ascii(pos->toString()));
  if (value.empty()) return std::nullopt;
  return value;
}

std::optional<int> int_tag(Exiv2::ExifData& exif, const char* key) {
  auto pos = exif.findKey(Exiv2::ExifKey(key));
  if (pos == exif.end() || pos->count() == 0) return std::nullopt;
  return static_cast<int>(pos->toInt64());
}

double rational_to_double(const Exiv2::Rational& r) {
  return r.second == 0 ? 0.0 : static_cast<double>(r.first) / r.second;
}

// Degrees/minutes/seconds triple plus N/S or E/W reference.
std::optional<double> gps_angle(Exiv2::ExifData& exif, const char* key,
                                const char* ref_key, char negative_ref) {
  auto pos = exif.findKey(Exiv2::ExifKey(key));
  if (pos == exif.end() || pos->count() < 3) return std::nullopt;
  double angle = rational_to_double(pos->toRational(0)) +
                 rational_to_double(pos->toRational(1)) / 60.0 +
                 rational_to_double(pos->toRational(2)) / 3600.0;
  if (auto ref = string_tag(exif, ref_key); ref && (*ref)[0] == negative_ref) {
    angle = -angle;
  }
  return angle;
}

std::string to_gps_rational(double angle) {
  angle = std::fabs(angle);
  const int degrees = static_cast<int>(angle);
  const double rest = (angle - degrees) * 60.0;
  const int minutes = static_cast<int>(rest);
  const long centiseconds = std::lround((rest - minutes) * 60.0 * 100.0);
  return std::format("{}/1 {}/1 {}/100", degrees, minutes, centiseconds);
}

void set_if_present(Exiv2::ExifData& exif, const char* key, int32_t value) {
  // Maker note tags are only rewritten, never created.
  auto pos = exif.findKey(Exiv2::ExifKey(key));
  if (pos != exif.end()) *pos = value;
}

}  // namespace

Tags Exiv2MetadataTool::read_tags(const fs::path& path) {
  std::scoped_lock lock(g_exiv2_mutex);

  try {
    Exiv2::Image::UniquePtr image =
        Exiv2::ImageFactory::open(safe_path_to_string(path));
    if (!image.get()) {
      throw RecordError(ErrorKind::IO,
                        std::format("Exiv2 cannot open '{}'",
                                    safe_path_to_string(path)));
    }
    image->readMetadata();
    auto& exif = image->exifData();

    Tags tags;
    if (exif.empty()) return tags;

    tags.date_time_original = string_tag(exif, kDateTimeOriginal);
    tags.offset_time_original = string_tag(exif, kOffsetTimeOriginal);
    tags.timezone_minutes = int_tag(exif, kCanonTimeZone);
    tags.timezone_city = int_tag(exif, kCanonTimeZoneCity);
    if (auto dst = int_tag(exif, kCanonDaylightSavings)) {
      tags.daylight_savings = *dst != 0;
    }

    tags.gps_date_stamp = string_tag(exif, "Exif.GPSInfo.GPSDateStamp");
    auto time_pos = exif.findKey(Exiv2::ExifKey("Exif.GPSInfo.GPSTimeStamp"));
    if (time_pos != exif.end() && time_pos->count() >= 3) {
      tags.gps_time_stamp = std::format(
          "{:02}:{:02}:{:02}",
          static_cast<int>(rational_to_double(time_pos->toRational(0))),
          static_cast<int>(rational_to_double(time_pos->toRational(1))),
          static_cast<int>(rational_to_double(time_pos->toRational(2))));
    }

    auto lat = gps_angle(exif, "Exif.GPSInfo.GPSLatitude",
                         "Exif.GPSInfo.GPSLatitudeRef", 'S');
    auto lon = gps_angle(exif, "Exif.GPSInfo.GPSLongitude",
                         "Exif.GPSInfo.GPSLongitudeRef", 'W');
    if (lat && lon) {
      Coordinate c{*lat, *lon, std::nullopt};
      auto alt = exif.findKey(Exiv2::ExifKey("Exif.GPSInfo.GPSAltitude"));
      if (alt != exif.end() && alt->count() > 0) {
        c.altitude = rational_to_double(alt->toRational(0));
      }
      tags.coordinate = c;
    }
    return tags;
  } catch (const Exiv2::Error& e) {
    throw RecordError(ErrorKind::IO,
                      std::format("Exiv2 error reading '{}': {}",
                                  safe_path_to_string(path), e.what()));
  }
}

void Exiv2MetadataTool::write_tags(const fs::path& path, const Tags& tags) {
  std::scoped_lock lock(g_exiv2_mutex);

  try {
    Exiv2::Image::UniquePtr image =
        Exiv2::ImageFactory::open(safe_path_to_string(path));
    image->readMetadata();
    auto& exif = image->exifData();

    if (tags.date_time_original) {
      exif[kDateTimeOriginal] = *tags.date_time_original;
      exif[kDateTimeDigitized] = *tags.date_time_original;
      exif[kDateTime] = *tags.date_time_original;
    }

    if (tags.offset_time_original) {
      exif[kOffsetTime] = *tags.offset_time_original;
      exif[kOffsetTimeOriginal] = *tags.offset_time_original;
      exif[kOffsetTimeDigitized] = *tags.offset_time_original;
    }

    if (tags.timezone_minutes) {
      set_if_present(exif, kCanonTimeZone, *tags.timezone_minutes);
    }
    if (tags.timezone_city) {
      set_if_present(exif, kCanonTimeZoneCity, *tags.timezone_city);
    }
    if (tags.daylight_savings) {
      set_if_present(exif, kCanonDaylightSavings,
                     *tags.daylight_savings ? 60 : 0);
    }

    if (tags.coordinate) {
      const Coordinate& c = *tags.coordinate;
      exif["Exif.GPSInfo.GPSLatitude"] = to_gps_rational(c.latitude);
      exif["Exif.GPSInfo.GPSLatitudeRef"] =
          std::string(c.latitude < 0 ? "S" : "N");
      exif["Exif.GPSInfo.GPSLongitude"] = to_gps_rational(c.longitude);
      exif["Exif.GPSInfo.GPSLongitudeRef"] =
          std::string(c.longitude < 0 ? "W" : "E");
      if (c.altitude) {
        exif["Exif.GPSInfo.GPSAltitude"] = std::format(
            "{}/100", std::lround(std::fabs(*c.altitude) * 100.0));
        exif["Exif.GPSInfo.GPSAltitudeRef"] =
            std::string(*c.altitude < 0 ? "1" : "0");
      }
    }

    image->writeMetadata();
  } catch (const Exiv2::Error& e) {
    throw RecordError(ErrorKind::IO,
                      std::format("Exiv2 error writing '{}': {}",
                                  safe_path_to_string(path), e.what()));
  }
}
