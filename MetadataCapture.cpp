#include "MetadataCapture.hpp"

#include <array>
#include <ctime>
#include <exiv2/exiv2.hpp>
#include <iomanip>
#include <mutex>
#include <regex>
#include <sstream>

#include "IOManager.hpp"
#include "utils.hpp"

namespace {
std::mutex g_exiv2_mutex;

constexpr std::array<std::string_view, 10> kBrowsers = {
    "Safari", "Google Chrome", "Chrome", "Microsoft Edge", "Edge",
    "Brave Browser", "Brave", "Arc", "Opera", "Vivaldi"};

std::optional<std::string> exif_string(const Exiv2::ExifData& exif,
                                       const char* key) {
  auto it = exif.findKey(Exiv2::ExifKey(key));
  if (it == exif.end() || it->count() == 0) return std::nullopt;
  std::string value = it->toString();
  while (!value.empty() && (value.back() == '\0' || value.back() == ' ')) {
    value.pop_back();
  }
  if (value.empty()) return std::nullopt;
  return value;
}

std::optional<std::string> xmp_string(const Exiv2::XmpData& xmp,
                                      const char* key) {
  auto it = xmp.findKey(Exiv2::XmpKey(key));
  if (it == xmp.end() || it->count() == 0) return std::nullopt;
  std::string value = it->toString();
  if (value.empty()) return std::nullopt;
  return value;
}

// Xmp.dc.title is a language alternative; prefer its default entry.
std::optional<std::string> xmp_title(const Exiv2::XmpData& xmp) {
  auto it = xmp.findKey(Exiv2::XmpKey("Xmp.dc.title"));
  if (it == xmp.end() || it->count() == 0) return std::nullopt;
  if (const auto* alt =
          dynamic_cast<const Exiv2::LangAltValue*>(&it->value())) {
    std::string value = alt->toString("x-default");
    if (!value.empty()) return value;
  }
  return xmp_string(xmp, "Xmp.dc.title");
}

// Exif dates look like "2026:02:01 14:03:59" and are in local time.
std::optional<std::chrono::system_clock::time_point> parse_exif_date(
    const std::string& text) {
  std::tm tm{};
  std::istringstream in(text);
  in >> std::get_time(&tm, "%Y:%m:%d %H:%M:%S");
  if (in.fail()) return std::nullopt;
  tm.tm_isdst = -1;
  std::time_t t = std::mktime(&tm);
  if (t == static_cast<std::time_t>(-1)) return std::nullopt;
  return std::chrono::system_clock::from_time_t(t);
}

}  // namespace

std::optional<ScreenshotMetadata> ImageMetadataProvider::capture(
    const fs::path& screenshot) {
  std::scoped_lock lock(g_exiv2_mutex);

  try {
    Exiv2::Image::UniquePtr image =
        Exiv2::ImageFactory::open(safe_path_to_string(screenshot));
    if (!image.get()) return std::nullopt;
    image->readMetadata();
    const auto& exifData = image->exifData();
    const auto& xmpData = image->xmpData();

    auto app = exif_string(exifData, "Exif.Image.Software");
    if (!app) app = xmp_string(xmpData, "Xmp.xmp.CreatorTool");
    if (!app) return std::nullopt;

    ScreenshotMetadata metadata;
    metadata.app_name = *app;
    auto title = exif_string(exifData, "Exif.Image.ImageDescription");
    if (!title) title = xmp_title(xmpData);
    metadata.window_title = title.value_or("Unknown");

    std::optional<std::chrono::system_clock::time_point> taken;
    if (auto date = exif_string(exifData, "Exif.Photo.DateTimeOriginal")) {
      taken = parse_exif_date(*date);
    }
    if (!taken) {
      std::error_code ec;
      auto ftime = fs::last_write_time(screenshot, ec);
      taken = ec ? std::chrono::system_clock::now()
                 : std::chrono::time_point_cast<
                       std::chrono::system_clock::duration>(
                       std::chrono::file_clock::to_sys(ftime));
    }
    metadata.timestamp = *taken;
    metadata.domain = MetadataCapture::extract_domain_from_title(
        metadata.window_title, metadata.app_name);
    return metadata;
  } catch (const Exiv2::Error& e) {
    IOManager::log(std::format("Non-critical Exiv2 error reading '{}': {}",
                               safe_path_to_string(screenshot), e.what()));
  } catch (const std::exception& e) {
    IOManager::log(
        std::format("Non-critical standard exception reading '{}': {}",
                    safe_path_to_string(screenshot), e.what()));
  }
  return std::nullopt;
}

bool MetadataCapture::is_browser(std::string_view appName) {
  for (const auto& browser : kBrowsers) {
    if (appName.find(browser) != std::string_view::npos) return true;
  }
  return false;
}

std::optional<std::string> MetadataCapture::extract_domain_from_title(
    std::string_view title, std::string_view appName) {
  if (!is_browser(appName)) return std::nullopt;

  static const std::regex domain_pattern(R"(([a-zA-Z0-9-]+\.[a-zA-Z]{2,}))");
  std::match_results<std::string_view::const_iterator> match;
  if (std::regex_search(title.begin(), title.end(), match, domain_pattern)) {
    return string_to_lower_ascii(match[1].str());
  }
  return std::nullopt;
}

std::optional<MetadataVars> MetadataCapture::to_template_vars(
    const std::optional<ScreenshotMetadata>& metadata) {
  if (!metadata) return std::nullopt;
  return MetadataVars{metadata->app_name, metadata->domain.value_or("")};
}
