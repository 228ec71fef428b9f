#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include "types.hpp"

// Placeholder substitution for destination and rename-pattern templates.
// Each stage rewrites the output of the previous one; nothing is re-scanned.
namespace TemplateExpander {
// Stages 1 and 2: every configured {pathKey}, then {app} and {domain}.
// Without metadata (or with empty fields) {app} becomes "Unknown" and
// {domain} becomes "General".
std::string expand(std::string_view tmpl, const PathVars& paths,
                   const std::optional<MetadataVars>& metadata = std::nullopt);

// Replaces {category} with the keyword-derived category of `file_name`.
std::string expand_category(std::string_view tmpl, std::string_view file_name);

// Date/time, {filename} and {ext} placeholders of a rename pattern, taken
// from `now` in local time.
std::string expand_pattern(std::string_view pattern, const fs::path& source,
                           std::chrono::system_clock::time_point now);

// "Invoices", "Finance", "Study" or "Unsorted".
std::string detect_category(std::string_view file_name);

// Makes free text usable as a single path segment: illegal characters become
// '-', whitespace runs collapse, the result is trimmed to 50 characters.
std::string sanitize_for_path(std::string_view input);
}  // namespace TemplateExpander
