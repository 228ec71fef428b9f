#include "DestinationResolver.hpp"

#include <format>
#include <system_error>

#include "TemplateExpander.hpp"
#include "utils.hpp"

DestinationResolver::DestinationResolver(Clock clock)
    : m_clock(clock ? std::move(clock)
                    : Clock([] { return std::chrono::system_clock::now(); })) {}

fs::path DestinationResolver::resolve(
    const Action& action, const fs::path& source, const AgentConfig& config,
    const std::optional<MetadataVars>& metadata, bool dry_run) const {
  const std::string file_name = safe_path_to_string(source.filename());

  std::string destination =
      TemplateExpander::expand(action.config.destination, config.paths, metadata);
  destination = TemplateExpander::expand_category(destination, file_name);

  fs::path dest_path;
  if (action.config.pattern) {
    dest_path = apply_pattern(destination, *action.config.pattern, source);
  } else if (path_from_utf8(destination).extension().empty()) {
    // No extension and no pattern: the destination is a directory.
    dest_path = path_from_utf8(destination) / source.filename();
  } else {
    dest_path = path_from_utf8(destination);
  }

  if (action.config.create_dirs.value_or(true) && !dry_run) {
    const fs::path dest_dir = dest_path.parent_path();
    if (!dest_dir.empty()) {
      std::error_code ec;
      fs::create_directories(dest_dir, ec);
      if (ec && ec != std::errc::file_exists) {
        throw fs::filesystem_error("Failed to create destination directory",
                                   dest_dir, ec);
      }
    }
  }

  return resolve_collision(dest_path, dry_run);
}

fs::path DestinationResolver::apply_pattern(const std::string& destination,
                                            const std::string& pattern,
                                            const fs::path& source) const {
  const std::string ext = safe_path_to_string(source.extension());

  // Only a single segment with an extension names a file. A multi-segment
  // destination such as "Organized/Chrome/site.example.com" is a directory
  // even though its last segment looks like it has an extension.
  const fs::path dest = path_from_utf8(destination);
  const bool single_segment =
      destination.find(fs::path::preferred_separator) == std::string::npos;
  const bool dest_has_filename = single_segment && !dest.extension().empty();
  const fs::path dest_dir = dest_has_filename ? dest.parent_path() : dest;

  std::string file_name =
      TemplateExpander::expand_pattern(pattern, source, m_clock());
  if (!file_name.ends_with(ext)) {
    file_name += ext;
  }

  return dest_dir / path_from_utf8(file_name);
}

fs::path DestinationResolver::resolve_collision(const fs::path& target,
                                                bool dry_run) {
  if (dry_run) {
    return target;
  }

  std::error_code ec;
  if (!fs::exists(fs::symlink_status(target, ec))) {
    return target;
  }

  const fs::path parent_dir = target.parent_path();
  const std::string stem_str = safe_path_to_string(target.stem());
  const std::string ext_str = safe_path_to_string(target.extension());

  int counter = 1;
  fs::path candidate;
  do {
    candidate = parent_dir / path_from_utf8(std::format(
                                 "{}-{}{}", stem_str, counter++, ext_str));
  } while (fs::exists(fs::symlink_status(candidate, ec)));

  return candidate;
}
