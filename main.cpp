#include <signal.h>

#include <algorithm>
#include <exception>
#include <exiv2/exiv2.hpp>
#include <memory>
#include <optional>
#include <print>
#include <stdexcept>
#include <string_view>
#include <vector>

#include "EventDispatcher.hpp"
#include "FolderWatcher.hpp"
#include "IOManager.hpp"
#include "MetadataCapture.hpp"
#include "RuleEngine.hpp"
#include "RuleStore.hpp"
#include "RuleTemplates.hpp"
#include "UI.hpp"
#include "types.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

void print_usage() {
  std::println(R"(autofiler - local file automation

Usage:
  autofiler [--dry-run] [--headless]   Start watching the rule folders
  autofiler rules                      List all rules by priority
  autofiler preview <file>             Show what the matching rule would do
  autofiler init                       Write the starter rules for the settings
  autofiler config [--key [value]]     Show, read or change config values
  autofiler runs [ruleId]              Show recorded runs, newest last

Data (rules.json, runs.json, config.json, agent.log) lives in ./.autofiler)");
}

int list_rules(JsonRuleStore& store) {
  auto rules = store.list_rules();
  std::stable_sort(rules.begin(), rules.end(), [](const Rule& a, const Rule& b) {
    return a.priority > b.priority;
  });
  if (rules.empty()) {
    std::println("No rules found in {}.",
                 safe_path_to_string(store.data_dir() / "rules.json"));
    return 0;
  }
  for (const auto& rule : rules) {
    std::println("{} {:>5}  {}  [{}]  {} condition(s), {} action(s)",
                 rule.enabled ? "[on] " : "[off]", rule.priority, rule.name,
                 rule.trigger.folder_template(), rule.conditions.size(),
                 rule.actions.size());
  }
  return 0;
}

int preview_file(JsonRuleStore& store, const fs::path& configPath,
                 const fs::path& file) {
  const fs::path target = fs::absolute(file).lexically_normal();
  RuleEngine engine;
  ImageMetadataProvider metadata;
  EventDispatcher dispatcher(
      store, engine, [configPath] { return IOManager::load_config(configPath); },
      &metadata, DispatcherOptions{true});
  dispatcher.set_rules(store.list_enabled_rules());

  // Same folder routing and selection as the agent, but nothing is touched.
  auto rule = dispatcher.select_rule(target, EventKind::CREATED);
  if (!rule) {
    std::println("No rule watching this folder matches {}.",
                 safe_path_to_string(file));
    return 0;
  }

  std::println("Rule: {} (priority {})", rule->name, rule->priority);
  const RuleRun run =
      dispatcher.execute_rule(*rule, target, TriggeredBy::MANUAL, true);
  for (const auto& result : run.actions) {
    if (result.status == ActionStatus::SUCCESS) {
      std::println("  ✓ {} -> {}", action_type_name(result.action.type),
                   safe_path_to_string(*result.destination_path));
    } else {
      std::println("  ✗ {}: {}", action_type_name(result.action.type),
                   result.error.value_or("unknown error"));
    }
  }
  return 0;
}

int init_rules(JsonRuleStore& store, const fs::path& configPath) {
  const AgentConfig config = IOManager::load_config(configPath);
  std::println("Creating rules (downloads: {}, screenshots: {})",
               config.settings.downloadsMode, config.settings.screenshotMode);
  for (const auto& rule : RuleTemplates::all(config.settings)) {
    store.save_rule(rule);
    std::println("✓ Created: {} (→ {})", rule.name,
                 rule.actions.front().config.destination);
  }
  IOManager::log("Template rules written.");
  std::println("\nRun `autofiler rules` to review them.");
  return 0;
}

int configure(const fs::path& configPath,
              const std::vector<std::string_view>& args) {
  AgentConfig config = IOManager::load_config(configPath);
  if (args.empty()) {
    std::println("Paths:");
    for (const auto& [name, path] : config.paths) {
      std::println("  {:<12} {}", name, path);
    }
    std::println("Settings:");
    std::println("  {:<12} {}", "downloadsMode", config.settings.downloadsMode);
    std::println("  {:<12} {}", "screenshotMode",
                 config.settings.screenshotMode);
    return 0;
  }

  if (!args[0].starts_with("--") || args.size() > 2) {
    print_usage();
    return 1;
  }
  const std::string_view key = args[0].substr(2);
  if (args.size() == 1) {
    std::println("{}", IOManager::get_config_value(config, key)
                           .value_or("(not set)"));
    return 0;
  }

  const std::string value(args[1]);
  bool modeChanged = false;
  try {
    modeChanged = IOManager::set_config_value(config, key, value);
  } catch (const std::invalid_argument& e) {
    std::println(stderr, "{}", e.what());
    return 1;
  }
  IOManager::save_config(configPath, config);
  IOManager::log(std::format("Config {} set to {}", key, value));
  std::println("✓ {} = {}", key, value);
  if (modeChanged) {
    std::println("Existing rules keep their destinations. Remove rules.json "
                 "and run `autofiler init` to regenerate them.");
  }
  return 0;
}

int list_runs(JsonRuleStore& store, const std::optional<std::string>& ruleId) {
  const auto runs = store.list_runs(ruleId);
  if (runs.empty()) {
    std::println("No runs recorded.");
    return 0;
  }
  for (const auto& run : runs) {
    std::println("{}  {:<9}  {}{}  {}", run.started_at,
                 json(run.status).get<std::string>(),
                 run.dry_run ? "(dry run) " : "",
                 safe_path_to_string(run.file_path),
                 run.error.value_or(""));
  }
  return 0;
}

int start_agent(JsonRuleStore& store, const fs::path& configPath, bool dryRun,
                bool headless) {
  sigset_t stop_signals;
  sigemptyset(&stop_signals);
  sigaddset(&stop_signals, SIGINT);
  sigaddset(&stop_signals, SIGTERM);
  if (headless) {
    // Block before any thread starts so only sigwait below sees them.
    pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);
  }

  IOManager::load_config(configPath);
  auto rules = store.list_enabled_rules();
  if (rules.empty()) {
    IOManager::log("No enabled rules found.");
    std::println(stderr, "No enabled rules found in {}.",
                 safe_path_to_string(store.data_dir() / "rules.json"));
    return 1;
  }
  IOManager::log(std::format("Loaded {} rule(s){}", rules.size(),
                             dryRun ? " (dry run)" : ""));

  RuleEngine engine;
  ImageMetadataProvider metadata;
  EventDispatcher dispatcher(
      store, engine, [configPath] { return IOManager::load_config(configPath); },
      &metadata, DispatcherOptions{dryRun});
  dispatcher.set_rules(rules);

  std::vector<fs::path> folders;
  for (const auto& [folder, count] : dispatcher.watched_folders()) {
    IOManager::log(std::format("  {} ({} rule(s))", safe_path_to_string(folder),
                               count));
    folders.push_back(folder);
  }

  FolderWatcher watcher(folders, [&dispatcher](const fs::path& path,
                                               EventKind kind) {
    dispatcher.dispatch(path, kind);
  });
  watcher.start();
  IOManager::log(std::format("Watching {} folder(s)...", folders.size()));

  if (headless) {
    for (const auto& folder : folders) {
      std::println("Watching {}", safe_path_to_string(folder));
    }
    int signal_number = 0;
    sigwait(&stop_signals, &signal_number);
    IOManager::log(std::format("Received signal {}. Shutting down...",
                               signal_number));
  } else {
    auto application = std::make_shared<UI>(dispatcher);
    application->run();
  }

  watcher.stop();
  dispatcher.shutdown();
  IOManager::log("All in-flight files finished.");
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  Exiv2::XmpParser::initialize();

  try {
    const fs::path dataDir = fs::current_path() / ".autofiler";
    const fs::path configPath = dataDir / "config.json";
    IOManager::initialize_logger(dataDir / "agent.log");
    IOManager::log("--- autofiler started ---");

    bool dryRun = false;
    bool headless = false;
    std::vector<std::string_view> positional;
    for (int i = 1; i < argc; ++i) {
      std::string_view arg = argv[i];
      if (arg == "--dry-run") {
        dryRun = true;
      } else if (arg == "--headless") {
        headless = true;
      } else if (arg == "--help" || arg == "-h") {
        print_usage();
        Exiv2::XmpParser::terminate();
        return 0;
      } else {
        positional.push_back(arg);
      }
    }

    JsonRuleStore store(dataDir);
    int exit_code = 0;
    if (positional.empty() || positional[0] == "start") {
      exit_code = start_agent(store, configPath, dryRun, headless);
    } else if (positional[0] == "rules") {
      exit_code = list_rules(store);
    } else if (positional[0] == "preview" && positional.size() == 2) {
      exit_code = preview_file(store, configPath, path_from_utf8(positional[1]));
    } else if (positional[0] == "init" && positional.size() == 1) {
      exit_code = init_rules(store, configPath);
    } else if (positional[0] == "config") {
      exit_code = configure(configPath,
                            std::vector<std::string_view>(
                                positional.begin() + 1, positional.end()));
    } else if (positional[0] == "runs" && positional.size() <= 2) {
      exit_code = list_runs(store, positional.size() == 2
                                       ? std::optional<std::string>(
                                             std::string(positional[1]))
                                       : std::nullopt);
    } else {
      print_usage();
      exit_code = 1;
    }

    IOManager::log("--- autofiler exited ---");
    Exiv2::XmpParser::terminate();
    return exit_code;

  } catch (const std::exception& e) {
    IOManager::log(std::format("FATAL EXCEPTION: {}", e.what()));
    std::println(stderr, "\n=== FATAL ERROR ===");
    std::println(stderr, "Exception: {}", e.what());
    std::println(stderr, "Check .autofiler/agent.log for details.");
    Exiv2::XmpParser::terminate();
    return 1;
  }
}
