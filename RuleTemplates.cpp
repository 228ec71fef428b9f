#include "RuleTemplates.hpp"

#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "utils.hpp"

namespace {

struct Family {
  std::string_view label;
  std::string_view tag;
  std::vector<std::string> extensions;
  std::string_view nested;
  std::string_view system;
};

Rule make_rule(std::string name, int priority, std::vector<std::string> tags,
               std::string folder, std::vector<Condition> conditions,
               std::vector<Action> actions) {
  Rule rule;
  rule.id = generate_uuid();
  rule.name = std::move(name);
  rule.priority = priority;
  rule.tags = std::move(tags);
  rule.trigger.type = TriggerType::FILE_CREATED;
  rule.trigger.config = json{{"folder", std::move(folder)}};
  rule.conditions = std::move(conditions);
  rule.actions = std::move(actions);
  rule.createdAt = iso_timestamp();
  rule.updatedAt = rule.createdAt;
  return rule;
}

Action move_to(std::string destination,
               std::optional<std::string> pattern = std::nullopt) {
  Action action;
  action.type = ActionType::MOVE;
  action.config.destination = std::move(destination);
  action.config.pattern = std::move(pattern);
  action.config.create_dirs = true;
  return action;
}

Condition is_pdf() {
  return {ConditionType::EXTENSION, ConditionOperator::EQUALS,
          std::string("pdf")};
}

Condition name_contains(std::string word) {
  return {ConditionType::NAME_CONTAINS, ConditionOperator::CONTAINS,
          std::move(word)};
}

bool is_nested(const AgentSettings& settings) {
  return settings.downloadsMode == "nested";
}

}  // namespace

std::vector<Rule> RuleTemplates::pdf_workflow(const AgentSettings& settings) {
  const std::string base =
      std::string(is_nested(settings) ? "{downloads}" : "{documents}") +
      "/PDFs";

  Action compress;
  compress.type = ActionType::COMPRESS;
  compress.config.destination = base + "/{category}/Compressed";
  compress.config.pattern = "{filename}_compressed";
  compress.config.create_dirs = true;
  compress.config.compress = CompressOptions{CompressQuality::MEDIUM, true};

  std::vector<Rule> rules;
  rules.push_back(make_rule(
      "Large PDF Compression", 500, {"pdf", "compression", "large-files"},
      "{downloads}",
      {is_pdf(),
       {ConditionType::SIZE_GREATER_THAN_MB, ConditionOperator::EQUALS, 8.0}},
      {move_to(base + "/{category}"), std::move(compress)}));
  rules.push_back(make_rule(
      "PDF Invoice Organizer", 400, {"pdf", "invoice", "finance"},
      "{downloads}", {is_pdf(), name_contains("invoice")},
      {move_to(base + "/Invoices", "{filename}_{YYYY}-{MM}-{DD}")}));
  rules.push_back(make_rule(
      "PDF Bank Statement Organizer", 300,
      {"pdf", "bank", "finance", "statement"}, "{downloads}",
      {is_pdf(), name_contains("bank")},
      {move_to(base + "/Finance", "{filename}_{YYYY}-{MM}")}));
  rules.push_back(make_rule(
      "PDF Study Notes Organizer", 200, {"pdf", "study", "notes", "college"},
      "{downloads}", {is_pdf(), name_contains("notes")},
      {move_to(base + "/Study", "{filename}_{YYYY}-{MM}-{DD}")}));
  rules.push_back(make_rule("PDF Default Organizer", 100, {"pdf", "default"},
                            "{downloads}", {is_pdf()},
                            {move_to(base + "/Unsorted")}));
  return rules;
}

std::vector<Rule> RuleTemplates::downloads_organizer(
    const AgentSettings& settings) {
  const std::vector<Family> families = {
      {"Images", "images", {"jpg", "jpeg", "png", "gif", "webp", "svg"},
       "{downloads}/Images", "{pictures}/Downloads"},
      {"Videos", "videos", {"mp4", "mov", "avi", "mkv"},
       "{downloads}/Videos", "{videos}"},
      {"Music", "music", {"mp3", "wav", "flac", "aac"},
       "{downloads}/Music", "{music}"},
      {"Archives", "archives", {"zip", "rar", "7z", "tar", "gz"},
       "{downloads}/Archives", "{documents}/Archives"},
      {"Documents", "documents",
       {"doc", "docx", "txt", "rtf", "xls", "xlsx", "ppt", "pptx"},
       "{downloads}/Documents", "{documents}/Documents"},
      {"Installers", "installers", {"dmg", "pkg", "exe", "msi"},
       "{downloads}/Installers", "{documents}/Installers"},
      {"Code Files", "code",
       {"js", "ts", "jsx", "tsx", "py", "rb", "go", "rs", "java", "cpp", "c",
        "h"},
       "{downloads}/Code", "{documents}/Code"},
  };

  std::vector<Rule> rules;
  for (const auto& family : families) {
    rules.push_back(make_rule(
        std::format("Downloads - {} Organizer", family.label), 50,
        {"downloads", std::string(family.tag), "organizer"}, "{downloads}",
        {{ConditionType::EXTENSION, ConditionOperator::IN, family.extensions}},
        {move_to(std::string(is_nested(settings) ? family.nested
                                                 : family.system))}));
  }
  return rules;
}

std::vector<Rule> RuleTemplates::screenshot_organizer(
    const AgentSettings& settings) {
  const std::string base =
      is_nested(settings) ? "{screenshots}" : "{pictures}/Screenshots";
  const Condition images{
      ConditionType::EXTENSION, ConditionOperator::IN,
      std::vector<std::string>{"png", "jpg", "jpeg", "gif", "webp"}};

  std::vector<Rule> rules;
  if (settings.screenshotMode == "metadata") {
    rules.push_back(make_rule(
        "Screenshot Organizer with Metadata", 450,
        {"screenshot", "metadata", "organizer"}, "{screenshots}", {images},
        {move_to(base + "/Organized/{app}/{domain}",
                 "{filename}_{YYYY}-{MM}-{DD}_{HH}-{mm}")}));
  } else if (settings.screenshotMode == "by-app") {
    rules.push_back(make_rule("Screenshot - Organize by App", 450,
                              {"screenshot", "by-app", "organizer"},
                              "{screenshots}", {images},
                              {move_to(base + "/ByApp/{app}")}));
  } else if (settings.screenshotMode == "by-date") {
    rules.push_back(make_rule("Screenshot - Organize by Date", 450,
                              {"screenshot", "by-date", "organizer"},
                              "{screenshots}", {images},
                              {move_to(base + "/ByDate",
                                       "{YYYY}/{Month}/{filename}")}));
  }
  return rules;
}

std::vector<Rule> RuleTemplates::all(const AgentSettings& settings) {
  std::vector<Rule> rules = pdf_workflow(settings);
  for (auto& rule : downloads_organizer(settings)) {
    rules.push_back(std::move(rule));
  }
  for (auto& rule : screenshot_organizer(settings)) {
    rules.push_back(std::move(rule));
  }
  return rules;
}
