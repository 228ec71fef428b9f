#include "RuleEngine.hpp"

#include <algorithm>
#include <stdexcept>

#include "ConditionEvaluator.hpp"
#include "IOManager.hpp"
#include "utils.hpp"

RuleEngine::RuleEngine(PdfCompressor compressor, DestinationResolver resolver)
    : m_compressor(std::move(compressor)), m_resolver(std::move(resolver)) {}

std::vector<Rule> RuleEngine::find_matching_rules(std::vector<Rule> rules,
                                                  const fs::path& path) {
  std::stable_sort(
      rules.begin(), rules.end(),
      [](const Rule& a, const Rule& b) { return a.priority > b.priority; });
  std::erase_if(rules, [&path](const Rule& rule) {
    return !rule.enabled || !ConditionEvaluator::matches(rule.conditions, path);
  });
  return rules;
}

std::vector<ActionResult> RuleEngine::execute_actions(
    const std::vector<Action>& actions, const fs::path& sourcePath,
    const AgentConfig& config, bool dryRun,
    const std::optional<MetadataVars>& metadata) const {
  std::vector<ActionResult> results;
  results.reserve(actions.size());
  fs::path current_path = sourcePath;

  for (const auto& action : actions) {
    ActionResult result =
        execute_action(action, current_path, config, dryRun, metadata);
    if (result.status == ActionStatus::SUCCESS && result.destination_path) {
      current_path = *result.destination_path;
    }
    results.push_back(std::move(result));
  }

  return results;
}

ActionResult RuleEngine::execute_action(
    const Action& action, const fs::path& sourcePath, const AgentConfig& config,
    bool dryRun, const std::optional<MetadataVars>& metadata) const {
  ActionResult result{action, ActionStatus::PENDING, sourcePath, std::nullopt,
                      std::nullopt};

  try {
    if (action.type == ActionType::UNKNOWN) {
      throw std::runtime_error("Unknown action type");
    }

    fs::path destination =
        m_resolver.resolve(action, sourcePath, config, metadata, dryRun);

    if (dryRun) {
      IOManager::log(std::format("[DRY RUN] {} '{}' -> '{}'",
                                 action_type_name(action.type),
                                 safe_path_to_string(sourcePath),
                                 safe_path_to_string(destination)));
    } else {
      switch (action.type) {
        case ActionType::MOVE:
        case ActionType::RENAME:
          fs::rename(sourcePath, destination);
          break;
        case ActionType::COPY:
          fs::copy_file(sourcePath, destination);
          break;
        case ActionType::COMPRESS:
          m_compressor.compress(
              sourcePath, destination,
              action.config.compress ? action.config.compress->quality
                                     : CompressQuality::MEDIUM);
          break;
        case ActionType::UNKNOWN:
          break;
      }
    }

    result.status = ActionStatus::SUCCESS;
    result.destination_path = std::move(destination);
  } catch (const std::exception& e) {
    result.status = ActionStatus::FAILED;
    result.error = e.what();
  }

  return result;
}
