#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "types.hpp"

namespace IOManager {
// Opens (appending) the agent log. Lines logged before this call only reach
// the log handler.
void initialize_logger(const fs::path& logPath);

void set_log_handler(std::function<void(std::string_view)> handler);

void log(std::string_view message);

// Resolves an XDG user directory, e.g. ("DOWNLOAD", "Downloads"): the
// XDG_<NAME>_DIR variable, then ~/.config/user-dirs.dirs, then $HOME/<fallback>.
std::optional<fs::path> get_user_dir(std::string_view xdgName,
                                     std::string_view fallback);

AgentConfig default_config();

// Reads the config file and deep-merges it over default_config(). A missing
// file is created with the defaults; a malformed one is logged and ignored.
AgentConfig load_config(const fs::path& configPath);
void save_config(const fs::path& configPath, const AgentConfig& config);

// `autofiler config` keys: downloadsMode and screenshotMode (or their
// kebab-case spellings) address the settings, anything else a path.
std::optional<std::string> get_config_value(const AgentConfig& config,
                                            std::string_view key);

// Returns true when a mode setting changed, which means the template rules
// should be regenerated. Throws std::invalid_argument on an unknown mode.
bool set_config_value(AgentConfig& config, std::string_view key,
                      const std::string& value);
}  // namespace IOManager
