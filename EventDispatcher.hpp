#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <unordered_set>
#include <vector>

#include "MetadataCapture.hpp"
#include "RuleEngine.hpp"
#include "RuleStore.hpp"

struct DispatcherOptions {
  bool dry_run = false;
  // How long a path stays marked in-flight after its handling finished.
  std::chrono::milliseconds settle_delay{1000};
};

// Turns folder notifications into rule executions. At most one handling per
// path is in flight: a path is marked on receipt and unmarked a settle delay
// after its chain finished, so bursts of events for one file run its rule
// once. Distinct paths run concurrently, each on its own worker thread.
class EventDispatcher {
 public:
  using ConfigLoader = std::function<AgentConfig()>;

  EventDispatcher(RuleStore& store, const RuleEngine& engine,
                  ConfigLoader loadConfig, MetadataProvider* metadata = nullptr,
                  DispatcherOptions options = {});
  ~EventDispatcher();

  EventDispatcher(const EventDispatcher&) = delete;
  EventDispatcher& operator=(const EventDispatcher&) = delete;

  // Groups enabled rules by their expanded trigger folder.
  void set_rules(const std::vector<Rule>& rules);
  std::vector<std::pair<fs::path, size_t>> watched_folders() const;

  // Returns false when the event was dropped: duplicate of an in-flight
  // path, after shutdown, or outside every watched folder.
  bool dispatch(const fs::path& path, EventKind kind);

  // Runs one rule's action chain against `path` and records the run as
  // running, then completed or failed.
  RuleRun execute_rule(const Rule& rule, const fs::path& path,
                       TriggeredBy triggeredBy, bool dryRun);

  // Rules of the folders containing `path` that react to `kind`, in list order.
  std::vector<Rule> rules_for(const fs::path& path, EventKind kind) const;

  // The rule an event of `kind` for `path` would run: the highest priority
  // match among rules_for(path, kind).
  std::optional<Rule> select_rule(const fs::path& path, EventKind kind) const;

  // Stops accepting events, cuts settle delays short and joins the workers.
  // In-flight chains run to completion.
  void shutdown();
  void wait_until_idle();

  size_t in_flight_count() const;
  size_t handled_count() const { return m_handled.load(); }
  bool dry_run() const { return m_options.dry_run; }

 private:
  struct Worker {
    std::jthread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void handle(const fs::path& path, EventKind kind);
  void record(const RuleRun& run);
  void cleanup_finished_workers();

  RuleStore& m_store;
  const RuleEngine& m_engine;
  ConfigLoader m_loadConfig;
  MetadataProvider* m_metadata;
  DispatcherOptions m_options;

  mutable std::mutex m_mutex;
  std::condition_variable_any m_cv;
  std::vector<std::pair<fs::path, std::vector<Rule>>> m_folder_rules;
  std::unordered_set<std::string> m_in_flight;
  std::vector<Worker> m_workers;
  bool m_accepting = true;
  std::atomic<size_t> m_handled{0};
};
