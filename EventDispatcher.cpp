#include "EventDispatcher.hpp"

#include <algorithm>

#include "IOManager.hpp"
#include "TemplateExpander.hpp"
#include "utils.hpp"

namespace {

std::string path_key(const fs::path& path) {
  return path.lexically_normal().string();
}

bool is_inside(const fs::path& path, const fs::path& folder) {
  const fs::path rel = path.lexically_normal().lexically_relative(folder);
  if (rel.empty()) return false;
  const std::string first = safe_path_to_string(*rel.begin());
  return first != ".." && first != ".";
}

bool is_screenshot_rule(const Rule& rule) {
  return rule.trigger.type == TriggerType::SCREENSHOT ||
         std::find(rule.tags.begin(), rule.tags.end(), "screenshot") !=
             rule.tags.end();
}

}  // namespace

EventDispatcher::EventDispatcher(RuleStore& store, const RuleEngine& engine,
                                 ConfigLoader loadConfig,
                                 MetadataProvider* metadata,
                                 DispatcherOptions options)
    : m_store(store),
      m_engine(engine),
      m_loadConfig(std::move(loadConfig)),
      m_metadata(metadata),
      m_options(options) {}

EventDispatcher::~EventDispatcher() { shutdown(); }

void EventDispatcher::set_rules(const std::vector<Rule>& rules) {
  const AgentConfig config = m_loadConfig();
  std::vector<std::pair<fs::path, std::vector<Rule>>> grouped;

  for (const auto& rule : rules) {
    if (!rule.enabled) continue;
    if (rule.trigger.type != TriggerType::FILE_CREATED &&
        rule.trigger.type != TriggerType::FILE_MODIFIED &&
        rule.trigger.type != TriggerType::SCREENSHOT) {
      continue;
    }
    const std::string folder_template = rule.trigger.folder_template();
    if (folder_template.empty()) {
      IOManager::log(std::format("Rule '{}' has no trigger folder. Skipping.",
                                 rule.name));
      continue;
    }

    fs::path folder =
        path_from_utf8(TemplateExpander::expand(folder_template, config.paths))
            .lexically_normal();
    if (!folder.has_filename() && folder.has_relative_path()) {
      folder = folder.parent_path();
    }
    auto it = std::find_if(grouped.begin(), grouped.end(),
                           [&](const auto& g) { return g.first == folder; });
    if (it == grouped.end()) {
      grouped.emplace_back(folder, std::vector<Rule>{rule});
    } else {
      it->second.push_back(rule);
    }
  }

  std::scoped_lock lock(m_mutex);
  m_folder_rules = std::move(grouped);
}

std::vector<std::pair<fs::path, size_t>> EventDispatcher::watched_folders()
    const {
  std::scoped_lock lock(m_mutex);
  std::vector<std::pair<fs::path, size_t>> folders;
  for (const auto& [folder, rules] : m_folder_rules) {
    folders.emplace_back(folder, rules.size());
  }
  return folders;
}

std::vector<Rule> EventDispatcher::rules_for(const fs::path& path,
                                             EventKind kind) const {
  std::scoped_lock lock(m_mutex);
  std::vector<Rule> candidates;
  for (const auto& [folder, rules] : m_folder_rules) {
    if (!is_inside(path, folder)) continue;
    for (const auto& rule : rules) {
      // Screenshot rules only react to new files.
      if (rule.trigger.type == TriggerType::SCREENSHOT &&
          kind != EventKind::CREATED) {
        continue;
      }
      candidates.push_back(rule);
    }
  }
  return candidates;
}

bool EventDispatcher::dispatch(const fs::path& path, EventKind kind) {
  const std::string key = path_key(path);
  std::scoped_lock lock(m_mutex);
  if (!m_accepting) return false;
  if (m_in_flight.contains(key)) return false;
  const bool watched = std::any_of(
      m_folder_rules.begin(), m_folder_rules.end(),
      [&path](const auto& group) { return is_inside(path, group.first); });
  if (!watched) return false;

  m_in_flight.insert(key);
  cleanup_finished_workers();

  auto done = std::make_shared<std::atomic<bool>>(false);
  m_workers.push_back(
      {std::jthread([this, path, kind, key, done](const std::stop_token& stoken) {
         handle(path, kind);

         std::unique_lock wait_lock(m_mutex);
         // Duplicate notifications keep arriving for a moment after an
         // editor's atomic save; keep the path marked until they settle.
         m_cv.wait_for(wait_lock, stoken, m_options.settle_delay,
                       [] { return false; });
         m_in_flight.erase(key);
         wait_lock.unlock();
         m_cv.notify_all();
         done->store(true);
       }),
       done});
  return true;
}

std::optional<Rule> EventDispatcher::select_rule(const fs::path& path,
                                                EventKind kind) const {
  auto matching = RuleEngine::find_matching_rules(rules_for(path, kind), path);
  if (matching.empty()) return std::nullopt;
  // Only the highest priority match runs.
  return std::move(matching.front());
}

void EventDispatcher::handle(const fs::path& path, EventKind kind) {
  try {
    auto rule = select_rule(path, kind);
    if (!rule) {
      return;
    }

    IOManager::log(std::format("File: {}", safe_path_to_string(path.filename())));
    execute_rule(*rule, path, TriggeredBy::FILE_EVENT, m_options.dry_run);
    ++m_handled;
  } catch (const std::exception& e) {
    IOManager::log(std::format("ERROR handling '{}': {}",
                               safe_path_to_string(path), e.what()));
  }
}

RuleRun EventDispatcher::execute_rule(const Rule& rule, const fs::path& path,
                                      TriggeredBy triggeredBy, bool dryRun) {
  IOManager::log(std::format("  -> Rule: {}", rule.name));

  RuleRun run;
  run.id = generate_uuid();
  run.rule_id = rule.id;
  run.status = RunStatus::RUNNING;
  run.triggered_by = triggeredBy;
  run.file_path = path;
  run.tags = rule.tags;
  run.dry_run = dryRun;
  run.started_at = iso_timestamp();

  std::error_code ec;
  if (auto size = fs::file_size(path, ec); !ec) {
    run.file_size = size;
  }

  std::optional<ScreenshotMetadata> metadata;
  if (is_screenshot_rule(rule) && m_metadata) {
    metadata = m_metadata->capture(path);
    if (metadata) {
      IOManager::log(std::format("    App: {}", metadata->app_name));
      if (!metadata->window_title.empty() &&
          metadata->window_title != "Unknown") {
        IOManager::log(std::format("    Window: {}", metadata->window_title));
      }
      if (metadata->domain) {
        IOManager::log(std::format("    Domain: {}", *metadata->domain));
      }
    } else {
      IOManager::log("    (No screenshot metadata available, using defaults)");
    }
  }

  record(run);

  try {
    const AgentConfig config = m_loadConfig();
    run.actions = m_engine.execute_actions(
        rule.actions, path, config, dryRun,
        MetadataCapture::to_template_vars(metadata));

    const bool all_success = std::all_of(
        run.actions.begin(), run.actions.end(), [](const ActionResult& r) {
          return r.status == ActionStatus::SUCCESS;
        });
    run.status = all_success ? RunStatus::COMPLETED : RunStatus::FAILED;
    for (auto it = run.actions.rbegin(); it != run.actions.rend(); ++it) {
      if (it->status == ActionStatus::SUCCESS && it->destination_path) {
        run.destination_path = it->destination_path;
        break;
      }
    }
  } catch (const std::exception& e) {
    run.status = RunStatus::FAILED;
    run.error = e.what();
  }
  run.completed_at = iso_timestamp();
  record(run);

  for (const auto& result : run.actions) {
    if (result.status == ActionStatus::SUCCESS) {
      IOManager::log(std::format(
          "    ✓ {}: {}", action_type_name(result.action.type),
          safe_path_to_string(
              result.destination_path.value_or(fs::path()).filename())));
    } else {
      IOManager::log(std::format("    ✗ {}: {}",
                                 action_type_name(result.action.type),
                                 result.error.value_or("unknown error")));
    }
  }
  if (run.error) {
    IOManager::log(std::format("    ✗ Error: {}", *run.error));
  }

  return run;
}

void EventDispatcher::record(const RuleRun& run) {
  try {
    m_store.record_run(run);
  } catch (const std::exception& e) {
    IOManager::log(std::format("Warning: Could not record run {}: {}", run.id,
                               e.what()));
  }
}

void EventDispatcher::cleanup_finished_workers() {
  std::erase_if(m_workers, [](Worker& w) {
    if (!w.done->load()) return false;
    w.thread.join();
    return true;
  });
}

void EventDispatcher::shutdown() {
  std::vector<Worker> workers;
  {
    std::scoped_lock lock(m_mutex);
    m_accepting = false;
    workers.swap(m_workers);
  }
  for (auto& w : workers) {
    w.thread.request_stop();
  }
  for (auto& w : workers) {
    if (w.thread.joinable()) w.thread.join();
  }
}

void EventDispatcher::wait_until_idle() {
  std::unique_lock lock(m_mutex);
  m_cv.wait(lock, [this] { return m_in_flight.empty(); });
}

size_t EventDispatcher::in_flight_count() const {
  std::scoped_lock lock(m_mutex);
  return m_in_flight.size();
}
