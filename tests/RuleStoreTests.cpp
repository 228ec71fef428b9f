#include <gtest/gtest.h>

#include <fstream>

#include "../RuleStore.hpp"
#include "TestHelpers.hpp"

namespace {
constexpr const char* kRulesDocument = R"([
  {
    "id": "pdf-invoices",
    "name": "Invoices to Documents",
    "enabled": true,
    "priority": 200,
    "tags": ["finance"],
    "trigger": { "type": "file_created", "config": { "folder": "{downloads}" } },
    "conditions": [
      { "type": "extension", "operator": "in", "value": ["pdf", "PDF"] },
      { "type": "size", "operator": "greater_than", "value": 1024 }
    ],
    "actions": [
      { "type": "move",
        "config": { "destination": "{documents}/PDFs/{category}",
                    "pattern": "{filename}_{YYYY}-{MM}", "createDirs": true } },
      { "type": "compress",
        "config": { "destination": "{documents}/Compressed",
                    "compress": { "quality": "low", "archiveOriginal": true } } }
    ],
    "createdAt": "2026-02-01T10:00:00Z",
    "updatedAt": "2026-02-01T10:00:00Z"
  },
  {
    "id": "screens",
    "name": "Screenshots by app",
    "enabled": false,
    "priority": 50,
    "trigger": { "type": "screenshot", "config": { "folder": "{screenshots}" } },
    "actions": [ { "type": "move", "config": { "destination": "{pictures}/{app}" } } ]
  }
])";

RuleRun MakeRun(std::string id, std::string ruleId, RunStatus status) {
  RuleRun run;
  run.id = std::move(id);
  run.rule_id = std::move(ruleId);
  run.status = status;
  run.file_path = "/home/user/Downloads/a.pdf";
  run.started_at = "2026-02-01T10:00:00Z";
  return run;
}
}  // namespace

class RuleStoreTest : public TempDirTest {
 protected:
  void SetUp() override {
    TempDirTest::SetUp();
    data_dir = test_dir / ".autofiler";
  }

  fs::path data_dir;
};

TEST_F(RuleStoreTest, MissingFilesReadAsEmpty) {
  JsonRuleStore store(data_dir);
  EXPECT_TRUE(store.list_rules().empty());
  EXPECT_TRUE(store.list_runs().empty());
}

TEST_F(RuleStoreTest, ParsesRuleDocuments) {
  CreateDummyFile(".autofiler/rules.json", kRulesDocument);
  JsonRuleStore store(data_dir);

  auto rules = store.list_rules();
  ASSERT_EQ(rules.size(), 2);

  const Rule& rule = rules[0];
  EXPECT_EQ(rule.id, "pdf-invoices");
  EXPECT_EQ(rule.priority, 200);
  EXPECT_EQ(rule.trigger.type, TriggerType::FILE_CREATED);
  EXPECT_EQ(rule.trigger.folder_template(), "{downloads}");
  ASSERT_EQ(rule.conditions.size(), 2);
  EXPECT_EQ(rule.conditions[0].op, ConditionOperator::IN);
  EXPECT_EQ(std::get<std::vector<std::string>>(rule.conditions[0].value).size(),
            2);
  EXPECT_EQ(rule.conditions[1].type, ConditionType::SIZE);
  EXPECT_DOUBLE_EQ(std::get<double>(rule.conditions[1].value), 1024.0);

  ASSERT_EQ(rule.actions.size(), 2);
  EXPECT_EQ(rule.actions[0].type, ActionType::MOVE);
  EXPECT_EQ(rule.actions[0].config.pattern, "{filename}_{YYYY}-{MM}");
  EXPECT_EQ(rule.actions[0].config.create_dirs, true);
  EXPECT_EQ(rule.actions[1].type, ActionType::COMPRESS);
  ASSERT_TRUE(rule.actions[1].config.compress.has_value());
  EXPECT_EQ(rule.actions[1].config.compress->quality, CompressQuality::LOW);
  EXPECT_EQ(rule.actions[1].config.compress->archive_original, true);

  EXPECT_EQ(rules[1].trigger.type, TriggerType::SCREENSHOT);
  EXPECT_TRUE(rules[1].conditions.empty());
  EXPECT_TRUE(rules[1].tags.empty());
}

TEST_F(RuleStoreTest, ListEnabledRulesDropsDisabledOnes) {
  CreateDummyFile(".autofiler/rules.json", kRulesDocument);
  JsonRuleStore store(data_dir);

  auto rules = store.list_enabled_rules();
  ASSERT_EQ(rules.size(), 1);
  EXPECT_EQ(rules[0].id, "pdf-invoices");
}

TEST_F(RuleStoreTest, UnknownNamesBecomeInertValues) {
  CreateDummyFile(".autofiler/rules.json", R"([{
    "id": "x", "name": "x",
    "trigger": { "type": "calendar", "config": {} },
    "conditions": [ { "type": "mime", "operator": "equals", "value": "a" } ],
    "actions": [ { "type": "upload", "config": { "destination": "/x" } } ]
  }])");
  JsonRuleStore store(data_dir);

  auto rules = store.list_rules();
  ASSERT_EQ(rules.size(), 1);
  EXPECT_EQ(rules[0].trigger.type, TriggerType::UNKNOWN);
  EXPECT_EQ(rules[0].conditions[0].type, ConditionType::UNKNOWN);
  EXPECT_EQ(rules[0].actions[0].type, ActionType::UNKNOWN);
}

TEST_F(RuleStoreTest, MalformedEntriesAreSkipped) {
  CreateDummyFile(".autofiler/rules.json", R"([
    42,
    { "id": "ok", "name": "Fine" },
    { "id": "bad", "actions": [ { "type": "move" } ] }
  ])");
  JsonRuleStore store(data_dir);

  auto rules = store.list_rules();
  ASSERT_EQ(rules.size(), 1);
  EXPECT_EQ(rules[0].id, "ok");
}

TEST_F(RuleStoreTest, UnparsableFileReadsAsEmpty) {
  CreateDummyFile(".autofiler/rules.json", "[ { \"id\": ");
  JsonRuleStore store(data_dir);
  EXPECT_TRUE(store.list_rules().empty());
}

TEST_F(RuleStoreTest, SaveRuleInsertsThenReplaces) {
  JsonRuleStore store(data_dir);
  Rule rule;
  rule.id = "r1";
  rule.name = "First";
  rule.priority = 10;
  store.save_rule(rule);

  rule.name = "Renamed";
  store.save_rule(rule);

  Rule other;
  other.id = "r2";
  other.name = "Second";
  store.save_rule(other);

  auto rules = store.list_rules();
  ASSERT_EQ(rules.size(), 2);
  EXPECT_EQ(rules[0].name, "Renamed");
  EXPECT_EQ(rules[0].priority, 10);
  EXPECT_EQ(rules[1].id, "r2");
  EXPECT_FALSE(fs::exists(data_dir / "rules.json.tmp"));
}

TEST_F(RuleStoreTest, RecordRunUpdatesInPlace) {
  JsonRuleStore store(data_dir);
  RuleRun run = MakeRun("run-1", "rule-a", RunStatus::RUNNING);
  store.record_run(run);

  run.status = RunStatus::COMPLETED;
  run.completed_at = "2026-02-01T10:00:02Z";
  run.destination_path = "/home/user/Documents/a.pdf";
  ActionResult result;
  result.action.type = ActionType::MOVE;
  result.action.config.destination = "{documents}";
  result.status = ActionStatus::SUCCESS;
  result.source_path = run.file_path;
  result.destination_path = *run.destination_path;
  run.actions.push_back(result);
  store.record_run(run);

  auto runs = store.list_runs();
  ASSERT_EQ(runs.size(), 1);
  EXPECT_EQ(runs[0].status, RunStatus::COMPLETED);
  EXPECT_EQ(runs[0].completed_at, "2026-02-01T10:00:02Z");
  ASSERT_EQ(runs[0].actions.size(), 1);
  EXPECT_EQ(runs[0].actions[0].status, ActionStatus::SUCCESS);
  EXPECT_EQ(*runs[0].actions[0].destination_path,
            fs::path("/home/user/Documents/a.pdf"));
}

TEST_F(RuleStoreTest, RunsCanBeFilteredByRule) {
  JsonRuleStore store(data_dir);
  store.record_run(MakeRun("1", "rule-a", RunStatus::COMPLETED));
  store.record_run(MakeRun("2", "rule-b", RunStatus::FAILED));
  store.record_run(MakeRun("3", "rule-a", RunStatus::FAILED));

  EXPECT_EQ(store.list_runs().size(), 3);
  auto runs = store.list_runs("rule-a");
  ASSERT_EQ(runs.size(), 2);
  EXPECT_EQ(runs[0].id, "1");
  EXPECT_EQ(runs[1].id, "3");
}

TEST_F(RuleStoreTest, RunRecordsUseCamelCaseKeys) {
  JsonRuleStore store(data_dir);
  RuleRun run = MakeRun("run-1", "rule-a", RunStatus::RUNNING);
  run.dry_run = true;
  run.file_size = 2048;
  store.record_run(run);

  std::ifstream in(data_dir / "runs.json");
  json stored = json::parse(in);
  ASSERT_TRUE(stored.is_array());
  EXPECT_EQ(stored[0]["ruleId"], "rule-a");
  EXPECT_EQ(stored[0]["status"], "running");
  EXPECT_EQ(stored[0]["triggeredBy"], "file_event");
  EXPECT_EQ(stored[0]["dryRun"], true);
  EXPECT_EQ(stored[0]["fileSize"], 2048);
  EXPECT_FALSE(stored[0].contains("completedAt"));
}
