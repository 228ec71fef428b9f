#pragma once

#include <stdexcept>
#include <string>

#include "types.hpp"

class CompressionError : public std::runtime_error {
 public:
  enum class Kind { SOURCE_NOT_FOUND, TOOL_NOT_FOUND, TOOL_FAILED };

  CompressionError(Kind kind, const std::string& message)
      : std::runtime_error(message), m_kind(kind) {}

  Kind kind() const noexcept { return m_kind; }

 private:
  Kind m_kind;
};

// Compresses PDFs by running Ghostscript as a child process. Blocks until
// the process exits; there is no timeout.
class PdfCompressor {
 public:
  explicit PdfCompressor(std::string command = "gs");

  // Throws CompressionError. TOOL_NOT_FOUND means the executable could not be
  // started at all, TOOL_FAILED means it ran and exited non-zero.
  void compress(const fs::path& source, const fs::path& destination,
                CompressQuality quality) const;

  // Ghostscript -dPDFSETTINGS preset for a quality tier.
  static std::string pdf_settings_for(CompressQuality quality);

  const std::string& command() const { return m_command; }

 private:
  std::string m_command;
};
