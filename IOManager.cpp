#include "IOManager.hpp"

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <mutex>
#include <stdexcept>

#include "utils.hpp"

namespace {
std::ofstream g_log_stream;

std::mutex log_mutex;

std::function<void(std::string_view)> g_log_handler = nullptr;

std::optional<fs::path> home_directory() {
  const char* home_dir = std::getenv("HOME");
  if (!home_dir || !*home_dir) return std::nullopt;
  return fs::path(home_dir);
}

// Recursively copies keys of `overlay` into `base`; objects merge, every
// other value replaces.
void deep_merge(json& base, const json& overlay) {
  for (const auto& [key, value] : overlay.items()) {
    if (value.is_object() && base.contains(key) && base[key].is_object()) {
      deep_merge(base[key], value);
    } else {
      base[key] = value;
    }
  }
}

}  // namespace

void IOManager::initialize_logger(const fs::path& logPath) {
  std::scoped_lock lock(log_mutex);
  if (g_log_stream.is_open()) g_log_stream.close();
  std::error_code ec;
  if (logPath.has_parent_path()) {
    fs::create_directories(logPath.parent_path(), ec);
  }
  g_log_stream.open(logPath, std::ios_base::app);
}

void IOManager::set_log_handler(std::function<void(std::string_view)> handler) {
  std::scoped_lock lock(log_mutex);
  g_log_handler = handler;
}

void IOManager::log(std::string_view message) {
  std::scoped_lock lock(log_mutex);

  auto now = std::chrono::floor<std::chrono::seconds>(
      std::chrono::system_clock::now());
  auto time_str = std::format("{:%Y-%m-%d %H:%M:%S}", now);
  std::string full_message = std::format("{} | {}", time_str, message);

  if (g_log_handler) {
    g_log_handler(full_message);
  }

  if (g_log_stream.is_open()) {
    g_log_stream << full_message << "\n" << std::flush;
  }
}

std::optional<fs::path> IOManager::get_user_dir(std::string_view xdgName,
                                                std::string_view fallback) {
  auto home = home_directory();
  if (!home) return std::nullopt;
  const std::string home_str = safe_path_to_string(*home);
  const std::string key = std::format("XDG_{}_DIR", xdgName);

  const char* env_value = std::getenv(key.c_str());
  if (env_value && *env_value) {
    std::string p(env_value);
    if (p.starts_with("$HOME")) {
      p.replace(0, 5, home_str);
      return path_from_utf8(p);
    }
    if (fs::path(p).is_absolute()) return path_from_utf8(p);
  }

  fs::path user_dirs_file = *home / ".config/user-dirs.dirs";
  std::error_code ec;
  if (fs::exists(user_dirs_file, ec)) {
    std::ifstream file(user_dirs_file);
    std::string line;
    const std::string prefix = key + "=";
    while (std::getline(file, line)) {
      if (line.empty() || line[0] == '#') continue;
      if (!line.starts_with(prefix)) continue;

      auto first_quote = line.find('"');
      if (first_quote == std::string::npos) continue;
      auto last_quote = line.rfind('"');
      if (last_quote == std::string::npos || last_quote <= first_quote)
        continue;

      std::string path_str =
          line.substr(first_quote + 1, last_quote - first_quote - 1);
      if (path_str.starts_with("$HOME")) {
        path_str.replace(0, 5, home_str);
      }
      return path_from_utf8(path_str);
    }
  }
  return *home / fallback;
}

AgentConfig IOManager::default_config() {
  AgentConfig config;
  const fs::path home = home_directory().value_or(fs::current_path());
  auto user_dir = [&](std::string_view xdg, std::string_view fallback) {
    return safe_path_to_string(
        get_user_dir(xdg, fallback).value_or(home / fallback));
  };

  config.paths["downloads"] = user_dir("DOWNLOAD", "Downloads");
  config.paths["documents"] = user_dir("DOCUMENTS", "Documents");
  config.paths["desktop"] = user_dir("DESKTOP", "Desktop");
  config.paths["pictures"] = user_dir("PICTURES", "Pictures");
  config.paths["screenshots"] = safe_path_to_string(
      path_from_utf8(config.paths["downloads"]) / "Screenshots");
  config.paths["videos"] = user_dir("VIDEOS", "Videos");
  config.paths["music"] = user_dir("MUSIC", "Music");
  config.paths["home"] = safe_path_to_string(home);
  return config;
}

AgentConfig IOManager::load_config(const fs::path& configPath) {
  AgentConfig defaults = default_config();

  std::error_code ec;
  if (!fs::exists(configPath, ec)) {
    log(std::format("No config at {}, writing defaults.",
                    safe_path_to_string(configPath)));
    try {
      save_config(configPath, defaults);
    } catch (const std::exception& e) {
      log(std::format("Error writing default config: {}", e.what()));
    }
    return defaults;
  }

  std::ifstream configFile(configPath);
  try {
    json merged = defaults;
    deep_merge(merged, json::parse(configFile));
    return merged.get<AgentConfig>();
  } catch (const json::exception& e) {
    log(std::format("Error parsing {}: {}. Using defaults.",
                    safe_path_to_string(configPath), e.what()));
    return defaults;
  }
}

void IOManager::save_config(const fs::path& configPath,
                            const AgentConfig& config) {
  if (configPath.has_parent_path()) {
    fs::create_directories(configPath.parent_path());
  }
  // Several workers may write the defaults at once. Each writes its own
  // file and renames it into place so readers never see half a config.
  const fs::path tmp =
      configPath.string() + "." + generate_uuid() + ".tmp";
  {
    std::ofstream config_file(tmp, std::ios::trunc);
    if (!config_file) {
      throw std::runtime_error(std::format("Cannot open {} for writing",
                                           safe_path_to_string(tmp)));
    }
    config_file << json(config).dump(2);
    if (!config_file.flush()) {
      throw std::runtime_error(
          std::format("Cannot write {}", safe_path_to_string(tmp)));
    }
  }
  std::error_code ec;
  fs::rename(tmp, configPath, ec);
  if (ec) {
    std::error_code remove_ec;
    fs::remove(tmp, remove_ec);
    throw fs::filesystem_error("Cannot replace config", tmp, configPath, ec);
  }
}

namespace {
std::string_view normalize_key(std::string_view key) {
  if (key == "downloads-mode") return "downloadsMode";
  if (key == "screenshot-mode") return "screenshotMode";
  return key;
}
}  // namespace

std::optional<std::string> IOManager::get_config_value(
    const AgentConfig& config, std::string_view key) {
  key = normalize_key(key);
  if (key == "downloadsMode") return config.settings.downloadsMode;
  if (key == "screenshotMode") return config.settings.screenshotMode;
  auto it = config.paths.find(std::string(key));
  if (it == config.paths.end()) return std::nullopt;
  return it->second;
}

bool IOManager::set_config_value(AgentConfig& config, std::string_view key,
                                 const std::string& value) {
  key = normalize_key(key);
  if (key == "downloadsMode") {
    if (value != "nested" && value != "system") {
      throw std::invalid_argument(std::format(
          "Invalid downloadsMode '{}' (expected nested or system)", value));
    }
    const bool changed = config.settings.downloadsMode != value;
    config.settings.downloadsMode = value;
    return changed;
  }
  if (key == "screenshotMode") {
    if (value != "metadata" && value != "by-app" && value != "by-date") {
      throw std::invalid_argument(std::format(
          "Invalid screenshotMode '{}' (expected metadata, by-app or by-date)",
          value));
    }
    const bool changed = config.settings.screenshotMode != value;
    config.settings.screenshotMode = value;
    return changed;
  }
  if (key.empty()) {
    throw std::invalid_argument("Config key must not be empty");
  }
  config.paths[std::string(key)] = value;
  return false;
}
