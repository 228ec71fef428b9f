#pragma once

#include <vector>

#include "types.hpp"

// Starter rule sets written by `autofiler init`. Destinations depend on the
// downloads mode: "nested" keeps everything under {downloads}, "system"
// spreads files into the user folders.
namespace RuleTemplates {
// Large PDF compression plus invoice, bank, notes and fallback organizers.
std::vector<Rule> pdf_workflow(const AgentSettings& settings);

// One extension-list rule per file family, all at priority 50.
std::vector<Rule> downloads_organizer(const AgentSettings& settings);

// A single {screenshots} rule shaped by settings.screenshotMode. An unknown
// mode yields no rule.
std::vector<Rule> screenshot_organizer(const AgentSettings& settings);

std::vector<Rule> all(const AgentSettings& settings);
}  // namespace RuleTemplates
