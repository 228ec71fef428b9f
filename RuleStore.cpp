#include "RuleStore.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>

#include "IOManager.hpp"
#include "utils.hpp"

JsonRuleStore::JsonRuleStore(fs::path dataDir)
    : m_dataDir(std::move(dataDir)),
      m_rulesFile(m_dataDir / "rules.json"),
      m_runsFile(m_dataDir / "runs.json") {}

json JsonRuleStore::read_array(const fs::path& file) const {
  std::error_code ec;
  if (!fs::exists(file, ec)) return json::array();
  std::ifstream in(file);
  try {
    json data = json::parse(in);
    if (data.is_array()) return data;
    IOManager::log(std::format("Warning: {} is not a JSON array. Ignoring.",
                               safe_path_to_string(file)));
  } catch (const json::exception& e) {
    IOManager::log(std::format("Warning: Cannot parse {}: {}",
                               safe_path_to_string(file), e.what()));
  }
  return json::array();
}

void JsonRuleStore::write_array(const fs::path& file, const json& data) const {
  fs::create_directories(m_dataDir);
  // Write beside the target and rename so readers never see half a file.
  const fs::path tmp = file.string() + ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      throw std::runtime_error(
          std::format("Cannot open {} for writing", safe_path_to_string(tmp)));
    }
    out << data.dump(2);
  }
  fs::rename(tmp, file);
}

std::vector<Rule> JsonRuleStore::list_rules() const {
  std::scoped_lock lock(m_mutex);
  std::vector<Rule> rules;
  for (const auto& entry : read_array(m_rulesFile)) {
    try {
      rules.push_back(entry.get<Rule>());
    } catch (const json::exception& e) {
      IOManager::log(
          std::format("Warning: Skipping malformed rule: {}", e.what()));
    }
  }
  return rules;
}

std::vector<Rule> JsonRuleStore::list_enabled_rules() {
  auto rules = list_rules();
  std::erase_if(rules, [](const Rule& r) { return !r.enabled; });
  return rules;
}

void JsonRuleStore::save_rule(const Rule& rule) {
  std::scoped_lock lock(m_mutex);
  json rules = read_array(m_rulesFile);
  auto it = std::find_if(rules.begin(), rules.end(), [&](const json& r) {
    return r.is_object() && r.value("id", std::string{}) == rule.id;
  });
  if (it != rules.end()) {
    *it = rule;
  } else {
    rules.push_back(rule);
  }
  write_array(m_rulesFile, rules);
}

void JsonRuleStore::record_run(const RuleRun& run) {
  std::scoped_lock lock(m_mutex);
  json runs = read_array(m_runsFile);
  auto it = std::find_if(runs.begin(), runs.end(), [&](const json& r) {
    return r.is_object() && r.value("id", std::string{}) == run.id;
  });
  if (it != runs.end()) {
    *it = run;
  } else {
    runs.push_back(run);
  }
  write_array(m_runsFile, runs);
}

std::vector<RuleRun> JsonRuleStore::list_runs(
    const std::optional<std::string>& ruleId) const {
  std::scoped_lock lock(m_mutex);
  std::vector<RuleRun> runs;
  for (const auto& entry : read_array(m_runsFile)) {
    try {
      auto run = entry.get<RuleRun>();
      if (!ruleId || run.rule_id == *ruleId) runs.push_back(std::move(run));
    } catch (const json::exception& e) {
      IOManager::log(std::format("Warning: Skipping malformed run: {}", e.what()));
    }
  }
  return runs;
}
