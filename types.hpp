#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

// Unknown strings map to the first entry of each serialized enum, so the
// first entry is always the inert "unknown" value.

enum class ConditionType {
  UNKNOWN,
  EXTENSION,
  PATH,
  SIZE,
  NAME_PATTERN,
  NAME_CONTAINS,
  NAME_STARTS_WITH,
  NAME_ENDS_WITH,
  SIZE_GREATER_THAN_MB
};
NLOHMANN_JSON_SERIALIZE_ENUM(
    ConditionType,
    {{ConditionType::UNKNOWN, nullptr},
     {ConditionType::EXTENSION, "extension"},
     {ConditionType::PATH, "path"},
     {ConditionType::SIZE, "size"},
     {ConditionType::NAME_PATTERN, "name_pattern"},
     {ConditionType::NAME_CONTAINS, "name_contains"},
     {ConditionType::NAME_STARTS_WITH, "name_starts_with"},
     {ConditionType::NAME_ENDS_WITH, "name_ends_with"},
     {ConditionType::SIZE_GREATER_THAN_MB, "size_greater_than_mb"}});

enum class ConditionOperator {
  UNKNOWN,
  EQUALS,
  CONTAINS,
  MATCHES,
  GREATER_THAN,
  LESS_THAN,
  IN
};
NLOHMANN_JSON_SERIALIZE_ENUM(ConditionOperator,
                             {{ConditionOperator::UNKNOWN, nullptr},
                              {ConditionOperator::EQUALS, "equals"},
                              {ConditionOperator::CONTAINS, "contains"},
                              {ConditionOperator::MATCHES, "matches"},
                              {ConditionOperator::GREATER_THAN, "greater_than"},
                              {ConditionOperator::LESS_THAN, "less_than"},
                              {ConditionOperator::IN, "in"}});

using ConditionValue =
    std::variant<std::string, double, std::vector<std::string>>;

struct Condition {
  ConditionType type = ConditionType::UNKNOWN;
  // A condition without an operator never matches an operator-driven type.
  ConditionOperator op = ConditionOperator::UNKNOWN;
  ConditionValue value;
};

inline void to_json(json& j, const Condition& c) {
  j = json{{"type", c.type}, {"operator", c.op}};
  std::visit([&j](const auto& v) { j["value"] = v; }, c.value);
}

inline void from_json(const json& j, Condition& c) {
  j.at("type").get_to(c.type);
  if (j.contains("operator")) {
    j.at("operator").get_to(c.op);
  }
  c.value = std::string{};
  if (j.contains("value")) {
    const auto& v = j.at("value");
    if (v.is_array()) {
      c.value = v.get<std::vector<std::string>>();
    } else if (v.is_number()) {
      c.value = v.get<double>();
    } else if (v.is_string()) {
      c.value = v.get<std::string>();
    } else if (v.is_boolean()) {
      c.value = std::string(v.get<bool>() ? "true" : "false");
    }
  }
}

enum class ActionType { UNKNOWN, MOVE, COPY, RENAME, COMPRESS };
NLOHMANN_JSON_SERIALIZE_ENUM(ActionType, {{ActionType::UNKNOWN, nullptr},
                                          {ActionType::MOVE, "move"},
                                          {ActionType::COPY, "copy"},
                                          {ActionType::RENAME, "rename"},
                                          {ActionType::COMPRESS, "compress"}});

inline std::string_view action_type_name(ActionType type) {
  switch (type) {
    case ActionType::MOVE:
      return "MOVE";
    case ActionType::COPY:
      return "COPY";
    case ActionType::RENAME:
      return "RENAME";
    case ActionType::COMPRESS:
      return "COMPRESS";
    case ActionType::UNKNOWN:
      break;
  }
  return "UNKNOWN";
}

enum class CompressQuality { MEDIUM, LOW, HIGH };
NLOHMANN_JSON_SERIALIZE_ENUM(CompressQuality,
                             {{CompressQuality::MEDIUM, "medium"},
                              {CompressQuality::LOW, "low"},
                              {CompressQuality::HIGH, "high"}});

struct CompressOptions {
  CompressQuality quality = CompressQuality::MEDIUM;
  std::optional<bool> archive_original;
};

struct ActionConfig {
  std::string destination;
  std::optional<std::string> pattern;
  std::optional<bool> create_dirs;
  std::optional<CompressOptions> compress;
};

struct Action {
  ActionType type = ActionType::UNKNOWN;
  ActionConfig config;
};

inline void to_json(json& j, const CompressOptions& c) {
  j = json{{"quality", c.quality}};
  if (c.archive_original) j["archiveOriginal"] = *c.archive_original;
}

inline void from_json(const json& j, CompressOptions& c) {
  c.quality = j.value("quality", CompressQuality::MEDIUM);
  if (j.contains("archiveOriginal")) {
    c.archive_original = j.at("archiveOriginal").get<bool>();
  }
}

inline void to_json(json& j, const Action& a) {
  json config{{"destination", a.config.destination}};
  if (a.config.pattern) config["pattern"] = *a.config.pattern;
  if (a.config.create_dirs) config["createDirs"] = *a.config.create_dirs;
  if (a.config.compress) config["compress"] = *a.config.compress;
  j = json{{"type", a.type}, {"config", std::move(config)}};
}

inline void from_json(const json& j, Action& a) {
  j.at("type").get_to(a.type);
  const auto& config = j.at("config");
  a.config.destination = config.value("destination", std::string{});
  if (config.contains("pattern") && config.at("pattern").is_string()) {
    a.config.pattern = config.at("pattern").get<std::string>();
  }
  if (config.contains("createDirs") && config.at("createDirs").is_boolean()) {
    a.config.create_dirs = config.at("createDirs").get<bool>();
  }
  if (config.contains("compress") && config.at("compress").is_object()) {
    a.config.compress = config.at("compress").get<CompressOptions>();
  }
}

enum class TriggerType { UNKNOWN, FILE_CREATED, FILE_MODIFIED, SCREENSHOT, MANUAL };
NLOHMANN_JSON_SERIALIZE_ENUM(TriggerType,
                             {{TriggerType::UNKNOWN, nullptr},
                              {TriggerType::FILE_CREATED, "file_created"},
                              {TriggerType::FILE_MODIFIED, "file_modified"},
                              {TriggerType::SCREENSHOT, "screenshot"},
                              {TriggerType::MANUAL, "manual"}});

struct Trigger {
  TriggerType type = TriggerType::UNKNOWN;
  json config = json::object();

  // The watched folder template, e.g. "{downloads}". Empty when unset.
  std::string folder_template() const {
    if (config.is_object() && config.contains("folder") &&
        config.at("folder").is_string()) {
      return config.at("folder").get<std::string>();
    }
    return {};
  }
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Trigger, type, config);

struct Rule {
  std::string id;
  std::string name;
  bool enabled = true;
  int priority = 0;
  std::vector<std::string> tags;
  Trigger trigger;
  std::vector<Condition> conditions;
  std::vector<Action> actions;
  std::string createdAt;
  std::string updatedAt;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Rule, id, name, enabled,
                                                priority, tags, trigger,
                                                conditions, actions, createdAt,
                                                updatedAt);

enum class ActionStatus { PENDING, SUCCESS, FAILED };
NLOHMANN_JSON_SERIALIZE_ENUM(ActionStatus, {{ActionStatus::PENDING, "pending"},
                                            {ActionStatus::SUCCESS, "success"},
                                            {ActionStatus::FAILED, "failed"}});

struct ActionResult {
  Action action;
  ActionStatus status = ActionStatus::PENDING;
  fs::path source_path;
  std::optional<fs::path> destination_path;
  std::optional<std::string> error;
};

inline void to_json(json& j, const ActionResult& r) {
  j = json{{"action", r.action},
           {"status", r.status},
           {"sourcePath", r.source_path}};
  if (r.destination_path) j["destinationPath"] = *r.destination_path;
  if (r.error) j["error"] = *r.error;
}

inline void from_json(const json& j, ActionResult& r) {
  j.at("action").get_to(r.action);
  j.at("status").get_to(r.status);
  r.source_path = j.value("sourcePath", std::string{});
  if (j.contains("destinationPath")) {
    r.destination_path = j.at("destinationPath").get<std::string>();
  }
  if (j.contains("error")) r.error = j.at("error").get<std::string>();
}

enum class RunStatus { PENDING, RUNNING, COMPLETED, FAILED };
NLOHMANN_JSON_SERIALIZE_ENUM(RunStatus, {{RunStatus::PENDING, "pending"},
                                         {RunStatus::RUNNING, "running"},
                                         {RunStatus::COMPLETED, "completed"},
                                         {RunStatus::FAILED, "failed"}});

enum class TriggeredBy { FILE_EVENT, MANUAL };
NLOHMANN_JSON_SERIALIZE_ENUM(TriggeredBy, {{TriggeredBy::FILE_EVENT, "file_event"},
                                           {TriggeredBy::MANUAL, "manual"}});

struct RuleRun {
  std::string id;
  std::string rule_id;
  RunStatus status = RunStatus::PENDING;
  TriggeredBy triggered_by = TriggeredBy::FILE_EVENT;
  fs::path file_path;
  std::optional<std::uintmax_t> file_size;
  std::optional<fs::path> destination_path;
  std::vector<std::string> tags;
  bool dry_run = false;
  std::vector<ActionResult> actions;
  std::string started_at;
  std::optional<std::string> completed_at;
  std::optional<std::string> error;
};

inline void to_json(json& j, const RuleRun& r) {
  j = json{{"id", r.id},
           {"ruleId", r.rule_id},
           {"status", r.status},
           {"triggeredBy", r.triggered_by},
           {"filePath", r.file_path},
           {"tags", r.tags},
           {"dryRun", r.dry_run},
           {"actions", r.actions},
           {"startedAt", r.started_at}};
  if (r.file_size) j["fileSize"] = *r.file_size;
  if (r.destination_path) j["destinationPath"] = *r.destination_path;
  if (r.completed_at) j["completedAt"] = *r.completed_at;
  if (r.error) j["error"] = *r.error;
}

inline void from_json(const json& j, RuleRun& r) {
  j.at("id").get_to(r.id);
  r.rule_id = j.value("ruleId", std::string{});
  r.status = j.value("status", RunStatus::PENDING);
  r.triggered_by = j.value("triggeredBy", TriggeredBy::FILE_EVENT);
  r.file_path = j.value("filePath", std::string{});
  r.tags = j.value("tags", std::vector<std::string>{});
  r.dry_run = j.value("dryRun", false);
  r.actions = j.value("actions", std::vector<ActionResult>{});
  r.started_at = j.value("startedAt", std::string{});
  if (j.contains("fileSize")) r.file_size = j.at("fileSize").get<std::uintmax_t>();
  if (j.contains("destinationPath")) {
    r.destination_path = j.at("destinationPath").get<std::string>();
  }
  if (j.contains("completedAt")) {
    r.completed_at = j.at("completedAt").get<std::string>();
  }
  if (j.contains("error")) r.error = j.at("error").get<std::string>();
}

struct ScreenshotMetadata {
  std::string app_name;
  std::string window_title;
  std::chrono::system_clock::time_point timestamp;
  std::optional<std::string> domain;
  std::optional<std::string> url;
};

// The part of the screenshot metadata that destination templates consume.
struct MetadataVars {
  std::string app_name;
  std::string domain;
};

// Placeholder name ("downloads") to absolute path.
using PathVars = std::map<std::string, std::string>;

struct AgentSettings {
  std::string downloadsMode = "nested";
  std::string screenshotMode = "metadata";
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(AgentSettings, downloadsMode,
                                                screenshotMode);

struct AgentConfig {
  PathVars paths;
  AgentSettings settings;
  std::string version = "1.0.0";
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(AgentConfig, paths, settings,
                                                version);

enum class EventKind { CREATED, MODIFIED };
