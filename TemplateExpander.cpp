#include "TemplateExpander.hpp"

#include <array>
#include <ctime>
#include <format>
#include <utility>

#include "utils.hpp"

namespace {

constexpr std::array<std::string_view, 12> kMonthNames = {
    "January", "February", "March",     "April",   "May",      "June",
    "July",    "August",   "September", "October", "November", "December"};

// Checked in order; the first keyword found in the file name wins.
constexpr std::array<std::pair<std::string_view, std::string_view>, 20>
    kCategoryKeywords = {{{"invoice", "Invoices"},
                          {"bill", "Invoices"},
                          {"payment", "Invoices"},
                          {"receipt", "Invoices"},
                          {"tax", "Invoices"},
                          {"bank", "Finance"},
                          {"statement", "Finance"},
                          {"transaction", "Finance"},
                          {"finance", "Finance"},
                          {"credit", "Finance"},
                          {"debit", "Finance"},
                          {"notes", "Study"},
                          {"note", "Study"},
                          {"lecture", "Study"},
                          {"study", "Study"},
                          {"class", "Study"},
                          {"course", "Study"},
                          {"assignment", "Study"},
                          {"homework", "Study"},
                          {"exam", "Study"}}};

bool is_illegal_path_char(char c) {
  switch (c) {
    case '<':
    case '>':
    case ':':
    case '"':
    case '/':
    case '\\':
    case '|':
    case '?':
    case '*':
      return true;
    default:
      return false;
  }
}

bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
         c == '\v';
}

std::tm to_local_tm(std::chrono::system_clock::time_point tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm local{};
  localtime_r(&t, &local);
  return local;
}

}  // namespace

std::string TemplateExpander::expand(std::string_view tmpl,
                                     const PathVars& paths,
                                     const std::optional<MetadataVars>& metadata) {
  std::string result(tmpl);

  for (const auto& [key, value] : paths) {
    replace_all(result, std::format("{{{}}}", key), value);
  }

  const std::string app = metadata && !metadata->app_name.empty()
                              ? sanitize_for_path(metadata->app_name)
                              : "Unknown";
  const std::string domain = metadata && !metadata->domain.empty()
                                 ? sanitize_for_path(metadata->domain)
                                 : "General";
  replace_all(result, "{app}", app);
  replace_all(result, "{domain}", domain);

  return result;
}

std::string TemplateExpander::expand_category(std::string_view tmpl,
                                              std::string_view file_name) {
  std::string result(tmpl);
  replace_all(result, "{category}", detect_category(file_name));
  return result;
}

std::string TemplateExpander::expand_pattern(
    std::string_view pattern, const fs::path& source,
    std::chrono::system_clock::time_point now) {
  const std::tm local = to_local_tm(now);

  const std::pair<std::string_view, std::string> placeholders[] = {
      {"{filename}", safe_path_to_string(source.stem())},
      {"{ext}", safe_path_to_string(source.extension())},
      {"{YYYY}", std::to_string(local.tm_year + 1900)},
      {"{MM}", std::format("{:02}", local.tm_mon + 1)},
      {"{Month}", std::string(kMonthNames[local.tm_mon])},
      {"{DD}", std::format("{:02}", local.tm_mday)},
      {"{HH}", std::format("{:02}", local.tm_hour)},
      {"{mm}", std::format("{:02}", local.tm_min)},
      {"{ss}", std::format("{:02}", local.tm_sec)},
  };

  std::string result(pattern);
  for (const auto& [key, value] : placeholders) {
    replace_all(result, key, value);
  }
  return result;
}

std::string TemplateExpander::detect_category(std::string_view file_name) {
  const std::string lower = string_to_lower_ascii(file_name);
  for (const auto& [keyword, category] : kCategoryKeywords) {
    if (lower.find(keyword) != std::string::npos) {
      return std::string(category);
    }
  }
  return "Unsorted";
}

std::string TemplateExpander::sanitize_for_path(std::string_view input) {
  std::string collapsed;
  collapsed.reserve(input.size());
  bool in_space = false;
  for (char c : input) {
    if (is_illegal_path_char(c)) {
      collapsed += '-';
      in_space = false;
    } else if (is_space(c)) {
      if (!in_space) collapsed += ' ';
      in_space = true;
    } else {
      collapsed += c;
      in_space = false;
    }
  }

  const auto first = collapsed.find_first_not_of(' ');
  if (first == std::string::npos) return {};
  const auto last = collapsed.find_last_not_of(' ');
  std::string trimmed = collapsed.substr(first, last - first + 1);
  if (trimmed.size() > 50) {
    // Never split a UTF-8 sequence.
    size_t cut = 50;
    while (cut > 0 && (static_cast<unsigned char>(trimmed[cut]) & 0xC0) == 0x80)
      --cut;
    trimmed.resize(cut);
  }
  return trimmed;
}
