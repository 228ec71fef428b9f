#pragma once

#include <string_view>
#include <vector>

#include "types.hpp"

// Pure predicates over a file path. Nothing here throws: unreadable files and
// malformed regular expressions evaluate to false.
namespace ConditionEvaluator {
// Logical AND over all conditions. An empty list matches every file.
bool matches(const std::vector<Condition>& conditions, const fs::path& path);

bool evaluate(const Condition& condition, const fs::path& path);

// Applies the condition's operator to an already derived file attribute.
bool match_value(std::string_view value, const Condition& condition);
}  // namespace ConditionEvaluator
