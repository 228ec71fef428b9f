#include <gtest/gtest.h>
#include <signal.h>

#include <string>

#include "../PdfCompressor.hpp"
#include "TestHelpers.hpp"

// Scripts stand in for Ghostscript so the tests control stderr, the exit
// code and what the child process can observe.
class PdfCompressorTest : public TempDirTest {
 protected:
  fs::path CreateTool(const std::string& name, const std::string& body) {
    fs::path tool = CreateDummyFile(name, "#!/bin/sh\n" + body);
    fs::permissions(tool, fs::perms::owner_all, fs::perm_options::replace);
    return tool;
  }

  std::string CompressionMessage(const fs::path& tool) {
    fs::path source = CreateDummyFile("in.pdf", "%PDF-1.4");
    try {
      PdfCompressor(tool.string())
          .compress(source, test_dir / "out.pdf", CompressQuality::MEDIUM);
    } catch (const CompressionError& e) {
      return e.what();
    }
    return {};
  }
};

TEST_F(PdfCompressorTest, QualityMapsToGhostscriptPresets) {
  EXPECT_EQ(PdfCompressor::pdf_settings_for(CompressQuality::LOW), "/screen");
  EXPECT_EQ(PdfCompressor::pdf_settings_for(CompressQuality::MEDIUM), "/ebook");
  EXPECT_EQ(PdfCompressor::pdf_settings_for(CompressQuality::HIGH),
            "/printer");
}

TEST_F(PdfCompressorTest, MissingSourceIsReportedBeforeSpawning) {
  PdfCompressor compressor("autofiler-no-such-ghostscript");

  try {
    compressor.compress(test_dir / "absent.pdf", test_dir / "out.pdf",
                        CompressQuality::MEDIUM);
    FAIL() << "Expected CompressionError";
  } catch (const CompressionError& e) {
    EXPECT_EQ(e.kind(), CompressionError::Kind::SOURCE_NOT_FOUND);
    EXPECT_NE(std::string(e.what()).find("Source file not found"),
              std::string::npos);
  }
}

TEST_F(PdfCompressorTest, MissingToolAsksForInstallation) {
  fs::path source = CreateDummyFile("in.pdf", "%PDF-1.4");
  PdfCompressor compressor("autofiler-no-such-ghostscript");

  try {
    compressor.compress(source, test_dir / "out.pdf", CompressQuality::LOW);
    FAIL() << "Expected CompressionError";
  } catch (const CompressionError& e) {
    EXPECT_EQ(e.kind(), CompressionError::Kind::TOOL_NOT_FOUND);
    EXPECT_NE(std::string(e.what()).find("install Ghostscript"),
              std::string::npos);
  }
  EXPECT_TRUE(fs::exists(source));
}

TEST_F(PdfCompressorTest, NonZeroExitIsAToolFailure) {
  fs::path source = CreateDummyFile("in.pdf", "%PDF-1.4");
  PdfCompressor compressor("false");

  try {
    compressor.compress(source, test_dir / "out.pdf", CompressQuality::HIGH);
    FAIL() << "Expected CompressionError";
  } catch (const CompressionError& e) {
    EXPECT_EQ(e.kind(), CompressionError::Kind::TOOL_FAILED);
    EXPECT_NE(std::string(e.what()).find("Ghostscript failed with code 1"),
              std::string::npos);
  }
}

TEST_F(PdfCompressorTest, ZeroExitIsSuccess) {
  fs::path source = CreateDummyFile("in.pdf", "%PDF-1.4");
  // `true` ignores its arguments and exits 0.
  PdfCompressor compressor("true");

  EXPECT_NO_THROW(
      compressor.compress(source, test_dir / "out.pdf", CompressQuality::MEDIUM));
}

TEST_F(PdfCompressorTest, DefaultsToGhostscriptExecutable) {
  EXPECT_EQ(PdfCompressor().command(), "gs");
}

TEST_F(PdfCompressorTest, ToolFailureCarriesExitCodeAndStderr) {
  fs::path tool = CreateTool("failing-gs", "echo boom >&2\nexit 3\n");

  const std::string message = CompressionMessage(tool);

  EXPECT_NE(message.find("Ghostscript failed with code 3"), std::string::npos)
      << message;
  EXPECT_NE(message.find("boom"), std::string::npos) << message;
}

TEST_F(PdfCompressorTest, ToolStartsWithNoBlockedSignals) {
  // Only shell builtins, so the reported mask is the one exec gave the tool.
  fs::path tool = CreateTool(
      "mask-gs",
      "while read -r line; do\n"
      "  case \"$line\" in SigBlk:*) echo \"$line\" >&2 ;; esac\n"
      "done < /proc/$$/status\n"
      "exit 1\n");

  sigset_t stop_signals;
  sigset_t previous;
  sigemptyset(&stop_signals);
  sigaddset(&stop_signals, SIGINT);
  sigaddset(&stop_signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &stop_signals, &previous);
  const std::string message = CompressionMessage(tool);
  pthread_sigmask(SIG_SETMASK, &previous, nullptr);

  const auto pos = message.find("SigBlk:");
  ASSERT_NE(pos, std::string::npos) << message;
  const auto start = message.find_first_not_of(" \t", pos + 7);
  ASSERT_NE(start, std::string::npos) << message;
  const std::string mask = message.substr(start, 16);
  EXPECT_EQ(mask.size(), 16u) << message;
  EXPECT_EQ(mask.find_first_not_of('0'), std::string::npos) << message;
}
