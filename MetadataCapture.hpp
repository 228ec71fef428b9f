#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "types.hpp"

// Supplies the application context a screenshot was taken in. Returning
// nothing is normal (unsupported platform, permission denied, no data).
class MetadataProvider {
 public:
  virtual ~MetadataProvider() = default;
  virtual std::optional<ScreenshotMetadata> capture(
      const fs::path& screenshot) = 0;
};

// Reads the capturing application, title and capture time that screenshot
// tools embed in the image (Exif/XMP).
class ImageMetadataProvider : public MetadataProvider {
 public:
  std::optional<ScreenshotMetadata> capture(const fs::path& screenshot) override;
};

namespace MetadataCapture {
bool is_browser(std::string_view appName);

// First "name.tld" looking token of a browser window title, lower-cased.
std::optional<std::string> extract_domain_from_title(std::string_view title,
                                                     std::string_view appName);

// The {app}/{domain} projection used by destination templates.
std::optional<MetadataVars> to_template_vars(
    const std::optional<ScreenshotMetadata>& metadata);
}  // namespace MetadataCapture
