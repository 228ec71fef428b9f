#pragma once

#include <optional>
#include <vector>

#include "DestinationResolver.hpp"
#include "PdfCompressor.hpp"
#include "types.hpp"

class RuleEngine {
 public:
  explicit RuleEngine(PdfCompressor compressor = PdfCompressor(),
                      DestinationResolver resolver = DestinationResolver());

  // Enabled rules whose conditions all match `path`, highest priority first.
  // Rules with equal priority keep their input order.
  static std::vector<Rule> find_matching_rules(std::vector<Rule> rules,
                                               const fs::path& path);

  // Runs the actions in order. Each successful action's destination becomes
  // the input of the next one; a failed action is recorded and the chain
  // carries on from the last successful path. In dry-run mode destinations
  // are computed but nothing on disk changes.
  std::vector<ActionResult> execute_actions(
      const std::vector<Action>& actions, const fs::path& sourcePath,
      const AgentConfig& config, bool dryRun = false,
      const std::optional<MetadataVars>& metadata = std::nullopt) const;

 private:
  ActionResult execute_action(const Action& action, const fs::path& sourcePath,
                              const AgentConfig& config, bool dryRun,
                              const std::optional<MetadataVars>& metadata) const;

  PdfCompressor m_compressor;
  DestinationResolver m_resolver;
};
