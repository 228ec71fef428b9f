#include "ConditionEvaluator.hpp"

#include <algorithm>
#include <charconv>
#include <regex>
#include <system_error>

#include "utils.hpp"

namespace {

// String form of a condition value, as it would be written in the rule file.
std::string value_as_string(const ConditionValue& value) {
  if (const auto* s = std::get_if<std::string>(&value)) {
    return *s;
  }
  if (const auto* d = std::get_if<double>(&value)) {
    return std::format("{}", *d);
  }
  std::string joined;
  for (const auto& item : std::get<std::vector<std::string>>(value)) {
    if (!joined.empty()) joined += ',';
    joined += item;
  }
  return joined;
}

std::optional<double> value_as_number(const ConditionValue& value) {
  if (const auto* d = std::get_if<double>(&value)) {
    return *d;
  }
  if (const auto* s = std::get_if<std::string>(&value)) {
    double parsed = 0.0;
    const char* first = s->data();
    const char* last = s->data() + s->size();
    while (first != last && *first == ' ') ++first;
    while (last != first && *(last - 1) == ' ') --last;
    // The whole value must be numeric: "8MB" is not a threshold.
    auto [ptr, ec] = std::from_chars(first, last, parsed);
    if (ec == std::errc() && ptr != first && ptr == last) {
      return parsed;
    }
  }
  return std::nullopt;
}

std::optional<std::uintmax_t> file_size_of(const fs::path& path) {
  std::error_code ec;
  auto size = fs::file_size(path, ec);
  if (ec) return std::nullopt;
  return size;
}

}  // namespace

bool ConditionEvaluator::matches(const std::vector<Condition>& conditions,
                                 const fs::path& path) {
  return std::all_of(
      conditions.begin(), conditions.end(),
      [&path](const Condition& c) { return evaluate(c, path); });
}

bool ConditionEvaluator::evaluate(const Condition& condition,
                                  const fs::path& path) {
  const std::string file_name = safe_path_to_string(path.filename());
  const std::string stem_lower =
      string_to_lower_ascii(safe_path_to_string(path.stem()));
  const std::string value_lower =
      string_to_lower_ascii(value_as_string(condition.value));

  switch (condition.type) {
    case ConditionType::EXTENSION: {
      std::string ext =
          string_to_lower_ascii(safe_path_to_string(path.extension()));
      if (ext.starts_with('.')) ext.erase(0, 1);
      return match_value(ext, condition);
    }
    case ConditionType::NAME_PATTERN:
      return match_value(file_name, condition);
    case ConditionType::NAME_CONTAINS:
      return stem_lower.find(value_lower) != std::string::npos;
    case ConditionType::NAME_STARTS_WITH:
      return stem_lower.starts_with(value_lower);
    case ConditionType::NAME_ENDS_WITH:
      return stem_lower.ends_with(value_lower);
    case ConditionType::SIZE_GREATER_THAN_MB: {
      auto size = file_size_of(path);
      auto threshold = value_as_number(condition.value);
      if (!size || !threshold) return false;
      return static_cast<double>(*size) / (1024.0 * 1024.0) > *threshold;
    }
    case ConditionType::SIZE: {
      auto size = file_size_of(path);
      auto threshold = value_as_number(condition.value);
      if (!size || !threshold) return false;
      const double bytes = static_cast<double>(*size);
      switch (condition.op) {
        case ConditionOperator::GREATER_THAN:
          return bytes > *threshold;
        case ConditionOperator::LESS_THAN:
          return bytes < *threshold;
        case ConditionOperator::EQUALS:
          return bytes == *threshold;
        default:
          return false;
      }
    }
    case ConditionType::PATH:
      return match_value(safe_path_to_string(path), condition);
    case ConditionType::UNKNOWN:
      break;
  }
  return false;
}

bool ConditionEvaluator::match_value(std::string_view value,
                                     const Condition& condition) {
  const std::string test_value = string_to_lower_ascii(value);

  switch (condition.op) {
    case ConditionOperator::EQUALS:
      return test_value ==
             string_to_lower_ascii(value_as_string(condition.value));
    case ConditionOperator::CONTAINS:
      return test_value.find(string_to_lower_ascii(
                 value_as_string(condition.value))) != std::string::npos;
    case ConditionOperator::MATCHES:
      try {
        std::regex re(value_as_string(condition.value),
                      std::regex::ECMAScript | std::regex::icase);
        return std::regex_search(test_value, re);
      } catch (const std::regex_error&) {
        // Patterns come from user rule files; a bad one simply never matches.
        return false;
      }
    case ConditionOperator::IN:
      if (const auto* list =
              std::get_if<std::vector<std::string>>(&condition.value)) {
        return std::any_of(list->begin(), list->end(),
                           [&test_value](const std::string& v) {
                             return string_to_lower_ascii(v) == test_value;
                           });
      }
      return false;
    default:
      return false;
  }
}
