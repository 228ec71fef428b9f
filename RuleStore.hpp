#pragma once

#include <mutex>
#include <optional>
#include <vector>

#include "types.hpp"

// Where rules come from and where run records go.
class RuleStore {
 public:
  virtual ~RuleStore() = default;

  virtual std::vector<Rule> list_enabled_rules() = 0;

  // Inserts or replaces the run with the same id. Called concurrently from
  // dispatcher workers.
  virtual void record_run(const RuleRun& run) = 0;
};

// Keeps rules.json and runs.json in a data directory. Unreadable or malformed
// files read as empty lists.
class JsonRuleStore : public RuleStore {
 public:
  explicit JsonRuleStore(fs::path dataDir);

  std::vector<Rule> list_rules() const;
  std::vector<Rule> list_enabled_rules() override;
  void save_rule(const Rule& rule);

  void record_run(const RuleRun& run) override;
  std::vector<RuleRun> list_runs(
      const std::optional<std::string>& ruleId = std::nullopt) const;

  const fs::path& data_dir() const { return m_dataDir; }

 private:
  json read_array(const fs::path& file) const;
  void write_array(const fs::path& file, const json& data) const;

  fs::path m_dataDir;
  fs::path m_rulesFile;
  fs::path m_runsFile;
  mutable std::mutex m_mutex;
};
