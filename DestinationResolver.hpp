#pragma once

#include <chrono>
#include <functional>
#include <optional>

#include "types.hpp"

// Turns an action's templated destination into a concrete, collision-free
// path. Templates are expanded on every call, so date placeholders reflect
// the moment the action runs.
class DestinationResolver {
 public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  explicit DestinationResolver(Clock clock = nullptr);

  // Throws fs::filesystem_error when the destination directory cannot be
  // created for any reason other than it already existing. In dry-run mode
  // nothing is created and collisions are not checked.
  fs::path resolve(const Action& action, const fs::path& source,
                   const AgentConfig& config,
                   const std::optional<MetadataVars>& metadata,
                   bool dry_run) const;

  // Applies a rename pattern: the expanded pattern replaces the file name,
  // relative to the directory named by `destination`.
  fs::path apply_pattern(const std::string& destination,
                         const std::string& pattern,
                         const fs::path& source) const;

  // Returns `target` if nothing exists there, otherwise the first free
  // "name-N.ext" sibling. Returns `target` unchanged in dry-run mode.
  static fs::path resolve_collision(const fs::path& target, bool dry_run);

 private:
  Clock m_clock;
};
