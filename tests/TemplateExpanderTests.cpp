#include <gtest/gtest.h>

#include <ctime>

#include "../TemplateExpander.hpp"

namespace {
// Local wall-clock time, as the pattern placeholders see it.
std::chrono::system_clock::time_point LocalTime(int year, int month, int day,
                                                int hour = 12, int min = 0,
                                                int sec = 0) {
  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = min;
  tm.tm_sec = sec;
  tm.tm_isdst = -1;
  return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}
}  // namespace

TEST(TemplateExpanderTest, ReplacesEveryConfiguredPathKey) {
  PathVars paths = {{"downloads", "/home/u/Downloads"},
                    {"documents", "/home/u/Documents"},
                    {"projects", "/srv/projects"}};
  EXPECT_EQ(TemplateExpander::expand("{downloads}/PDFs", paths),
            "/home/u/Downloads/PDFs");
  EXPECT_EQ(TemplateExpander::expand("{projects}/{documents}", paths),
            "/srv/projects//home/u/Documents");
  EXPECT_EQ(TemplateExpander::expand("{unknown}/x", paths), "{unknown}/x");
}

TEST(TemplateExpanderTest, MetadataDefaultsWhenAbsentOrEmpty) {
  PathVars paths;
  EXPECT_EQ(TemplateExpander::expand("{app}/{domain}", paths),
            "Unknown/General");
  EXPECT_EQ(TemplateExpander::expand("{app}/{domain}", paths,
                                     MetadataVars{"", ""}),
            "Unknown/General");
}

TEST(TemplateExpanderTest, MetadataIsSanitized) {
  PathVars paths;
  MetadataVars metadata{"  Google   Chrome: Beta ", "github.com"};
  EXPECT_EQ(TemplateExpander::expand("{app}/{domain}", paths, metadata),
            "Google Chrome- Beta/github.com");
}

TEST(TemplateExpanderTest, SanitizeReplacesIllegalCharactersAndTruncates) {
  EXPECT_EQ(TemplateExpander::sanitize_for_path("a<b>c:d\"e/f\\g|h?i*j"),
            "a-b-c-d-e-f-g-h-i-j");
  EXPECT_EQ(TemplateExpander::sanitize_for_path("  spaced \t\n out  "),
            "spaced out");
  EXPECT_EQ(TemplateExpander::sanitize_for_path(std::string(80, 'x')).size(),
            50u);
}

TEST(TemplateExpanderTest, DetectsCategoriesByKeyword) {
  EXPECT_EQ(TemplateExpander::detect_category("invoice_march.pdf"), "Invoices");
  EXPECT_EQ(TemplateExpander::detect_category("bank_statement.pdf"), "Finance");
  EXPECT_EQ(TemplateExpander::detect_category("lecture_notes.pdf"), "Study");
  EXPECT_EQ(TemplateExpander::detect_category("randomfile.pdf"), "Unsorted");
}

TEST(TemplateExpanderTest, InvoiceKeywordsWinOverBankingKeywords) {
  // "tax" (Invoices) is checked before "statement" (Finance).
  EXPECT_EQ(TemplateExpander::detect_category("Tax_Statement.PDF"), "Invoices");
  EXPECT_EQ(TemplateExpander::detect_category("credit_course.pdf"), "Finance");
}

TEST(TemplateExpanderTest, ExpandsCategoryPlaceholder) {
  EXPECT_EQ(TemplateExpander::expand_category("/d/PDFs/{category}",
                                              "receipt-42.pdf"),
            "/d/PDFs/Invoices");
}

TEST(TemplateExpanderTest, ExpandsDatePatternForSourceFile) {
  auto now = LocalTime(2026, 2, 1);
  EXPECT_EQ(TemplateExpander::expand_pattern("{filename}_{YYYY}-{MM}-{DD}",
                                             "/d/report.pdf", now),
            "report_2026-02-01");
}

TEST(TemplateExpanderTest, ExpandsTimeMonthAndExtension) {
  auto now = LocalTime(2026, 9, 7, 8, 5, 3);
  EXPECT_EQ(TemplateExpander::expand_pattern(
                "{YYYY}/{Month}/{filename}_{HH}-{mm}-{ss}{ext}",
                "/d/shot.png", now),
            "2026/September/shot_08-05-03.png");
}
