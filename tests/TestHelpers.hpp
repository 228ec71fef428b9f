#pragma once

#include <gtest/gtest.h>
#include <unistd.h>

#include <filesystem>
#include <format>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

// Test fixture base that gives every test its own temporary directory.
// Tests may run in parallel processes, so the name includes the test name
// and the process id.
class TempDirTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    test_dir = fs::temp_directory_path() /
               std::format("autofiler_{}_{}_{}", info->test_suite_name(),
                           info->name(), ::getpid());
    fs::remove_all(test_dir);
    fs::create_directories(test_dir);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(test_dir, ec);
    // Ignore errors during cleanup as they are not part of the test result.
  }

  // Creates a file (and its parent directories) below test_dir.
  fs::path CreateDummyFile(const fs::path& relative_path,
                           const std::string& content = "dummy content") {
    fs::path full_path = test_dir / relative_path;
    if (full_path.has_parent_path()) {
      fs::create_directories(full_path.parent_path());
    }
    std::ofstream ofs(full_path, std::ios::binary);
    ofs << content;
    ofs.close();
    return full_path;
  }

  fs::path test_dir;
};
