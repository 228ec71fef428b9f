#include <gtest/gtest.h>

#include <ctime>

#include "../DestinationResolver.hpp"
#include "TestHelpers.hpp"

namespace {
std::chrono::system_clock::time_point February1st2026() {
  std::tm tm{};
  tm.tm_year = 2026 - 1900;
  tm.tm_mon = 1;
  tm.tm_mday = 1;
  tm.tm_hour = 12;
  tm.tm_isdst = -1;
  return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

Action MakeAction(ActionType type, std::string destination,
                  std::optional<std::string> pattern = std::nullopt) {
  Action action;
  action.type = type;
  action.config.destination = std::move(destination);
  action.config.pattern = std::move(pattern);
  return action;
}
}  // namespace

class DestinationResolverTest : public TempDirTest {
 protected:
  void SetUp() override {
    TempDirTest::SetUp();
    config.paths["downloads"] = (test_dir / "Downloads").string();
    config.paths["documents"] = (test_dir / "Documents").string();
  }

  AgentConfig config;
  DestinationResolver resolver{[] { return February1st2026(); }};
};

TEST_F(DestinationResolverTest, CollisionFreePathIsReturnedUnchanged) {
  fs::path target = test_dir / "a.pdf";
  EXPECT_EQ(DestinationResolver::resolve_collision(target, false), target);
  // Probing does not claim the path.
  EXPECT_EQ(DestinationResolver::resolve_collision(target, false), target);
}

TEST_F(DestinationResolverTest, CollisionsAppendIncrementingSuffix) {
  CreateDummyFile("a.pdf");
  EXPECT_EQ(DestinationResolver::resolve_collision(test_dir / "a.pdf", false),
            test_dir / "a-1.pdf");

  CreateDummyFile("a-1.pdf");
  EXPECT_EQ(DestinationResolver::resolve_collision(test_dir / "a.pdf", false),
            test_dir / "a-2.pdf");
}

TEST_F(DestinationResolverTest, DryRunSkipsCollisionProbing) {
  CreateDummyFile("a.pdf");
  EXPECT_EQ(DestinationResolver::resolve_collision(test_dir / "a.pdf", true),
            test_dir / "a.pdf");
}

TEST_F(DestinationResolverTest, DirectoryDestinationGetsSourceFileName) {
  fs::path source = CreateDummyFile("Downloads/photo.jpg");
  auto action = MakeAction(ActionType::MOVE, "{downloads}/Images");

  fs::path dest = resolver.resolve(action, source, config, std::nullopt, false);

  EXPECT_EQ(dest, test_dir / "Downloads" / "Images" / "photo.jpg");
  EXPECT_TRUE(fs::is_directory(test_dir / "Downloads" / "Images"));
}

TEST_F(DestinationResolverTest, DestinationWithExtensionIsAnExactFile) {
  fs::path source = CreateDummyFile("Downloads/photo.jpg");
  auto action = MakeAction(ActionType::COPY, "{documents}/latest.jpg");

  fs::path dest = resolver.resolve(action, source, config, std::nullopt, false);

  EXPECT_EQ(dest, test_dir / "Documents" / "latest.jpg");
}

TEST_F(DestinationResolverTest, PatternRenamesAndAppendsExtension) {
  fs::path source = CreateDummyFile("Downloads/report.pdf");
  auto action = MakeAction(ActionType::MOVE, "{documents}/Invoices",
                           "{filename}_{YYYY}-{MM}-{DD}");

  fs::path dest = resolver.resolve(action, source, config, std::nullopt, false);

  EXPECT_EQ(dest, test_dir / "Documents" / "Invoices" / "report_2026-02-01.pdf");
}

TEST_F(DestinationResolverTest, PatternAlreadyEndingWithExtensionIsKept) {
  fs::path source = CreateDummyFile("Downloads/report.pdf");
  auto action =
      MakeAction(ActionType::MOVE, "{documents}", "{filename}-final{ext}");

  fs::path dest = resolver.resolve(action, source, config, std::nullopt, false);

  EXPECT_EQ(dest, test_dir / "Documents" / "report-final.pdf");
}

TEST_F(DestinationResolverTest, DomainDirectoryIsNotMistakenForAFile) {
  fs::path source = CreateDummyFile("Downloads/Screenshot.png");
  auto action = MakeAction(ActionType::MOVE, "{downloads}/Organized/{app}/{domain}",
                           "{filename}_{YYYY}-{MM}-{DD}");
  MetadataVars metadata{"Google Chrome", "site.example.com"};

  fs::path dest = resolver.resolve(action, source, config, metadata, false);

  EXPECT_EQ(dest, test_dir / "Downloads" / "Organized" / "Google Chrome" /
                      "site.example.com" / "Screenshot_2026-02-01.png");
}

TEST_F(DestinationResolverTest, SingleSegmentFileDestinationUsesItsDirectory) {
  EXPECT_EQ(resolver.apply_pattern("old.pdf", "{filename}_x", "/d/report.pdf"),
            fs::path("report_x.pdf"));
}

TEST_F(DestinationResolverTest, PatternMayCreateSubdirectories) {
  fs::path source = CreateDummyFile("Downloads/shot.png");
  auto action =
      MakeAction(ActionType::MOVE, "{downloads}/ByDate", "{YYYY}/{Month}/{filename}");

  fs::path dest = resolver.resolve(action, source, config, std::nullopt, false);

  EXPECT_EQ(dest,
            test_dir / "Downloads" / "ByDate" / "2026" / "February" / "shot.png");
  EXPECT_TRUE(fs::is_directory(dest.parent_path()));
}

TEST_F(DestinationResolverTest, CategoryPlaceholderRoutesByFileName) {
  fs::path source = CreateDummyFile("Downloads/bank_statement.pdf");
  auto action = MakeAction(ActionType::MOVE, "{downloads}/PDFs/{category}");

  fs::path dest = resolver.resolve(action, source, config, std::nullopt, false);

  EXPECT_EQ(dest, test_dir / "Downloads" / "PDFs" / "Finance" /
                      "bank_statement.pdf");
}

TEST_F(DestinationResolverTest, ExistingDestinationIsSuffixed) {
  fs::path source = CreateDummyFile("Downloads/a.pdf");
  CreateDummyFile("Documents/a.pdf");
  auto action = MakeAction(ActionType::COPY, "{documents}");

  fs::path dest = resolver.resolve(action, source, config, std::nullopt, false);

  EXPECT_EQ(dest, test_dir / "Documents" / "a-1.pdf");
}

TEST_F(DestinationResolverTest, CreateDirsFalseLeavesTreeAlone) {
  fs::path source = CreateDummyFile("Downloads/a.pdf");
  auto action = MakeAction(ActionType::MOVE, "{documents}/Nowhere");
  action.config.create_dirs = false;

  fs::path dest = resolver.resolve(action, source, config, std::nullopt, false);

  EXPECT_EQ(dest, test_dir / "Documents" / "Nowhere" / "a.pdf");
  EXPECT_FALSE(fs::exists(test_dir / "Documents" / "Nowhere"));
}

TEST_F(DestinationResolverTest, DryRunCreatesNothing) {
  fs::path source = CreateDummyFile("Downloads/a.pdf");
  auto action = MakeAction(ActionType::MOVE, "{documents}/Archive");

  fs::path dest = resolver.resolve(action, source, config, std::nullopt, true);

  EXPECT_EQ(dest, test_dir / "Documents" / "Archive" / "a.pdf");
  EXPECT_FALSE(fs::exists(test_dir / "Documents"));
}

TEST_F(DestinationResolverTest, DirectoryCreationFailureThrows) {
  fs::path source = CreateDummyFile("Downloads/a.pdf");
  // A regular file where a directory is needed.
  CreateDummyFile("Blocked");
  auto action = MakeAction(ActionType::MOVE, (test_dir / "Blocked" / "Sub").string());

  EXPECT_THROW(resolver.resolve(action, source, config, std::nullopt, false),
               fs::filesystem_error);
}
