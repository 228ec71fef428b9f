#include "PdfCompressor.hpp"

#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <format>
#include <system_error>
#include <vector>

#include "IOManager.hpp"
#include "utils.hpp"

extern char** environ;

namespace {

// Closes a file descriptor when it goes out of scope.
class FdGuard {
 public:
  explicit FdGuard(int fd = -1) : m_fd(fd) {}
  ~FdGuard() { reset(); }
  FdGuard(const FdGuard&) = delete;
  FdGuard& operator=(const FdGuard&) = delete;

  int get() const { return m_fd; }
  void reset(int fd = -1) {
    if (m_fd >= 0) ::close(m_fd);
    m_fd = fd;
  }

 private:
  int m_fd;
};

std::string read_all(int fd) {
  std::string output;
  char buffer[4096];
  while (true) {
    ssize_t n = ::read(fd, buffer, sizeof(buffer));
    if (n > 0) {
      output.append(buffer, static_cast<size_t>(n));
    } else if (n < 0 && errno == EINTR) {
      continue;
    } else {
      break;
    }
  }
  return output;
}

}  // namespace

PdfCompressor::PdfCompressor(std::string command)
    : m_command(std::move(command)) {}

std::string PdfCompressor::pdf_settings_for(CompressQuality quality) {
  switch (quality) {
    case CompressQuality::LOW:
      return "/screen";
    case CompressQuality::HIGH:
      return "/printer";
    case CompressQuality::MEDIUM:
      break;
  }
  return "/ebook";
}

void PdfCompressor::compress(const fs::path& source,
                             const fs::path& destination,
                             CompressQuality quality) const {
  std::error_code ec;
  if (!fs::exists(source, ec)) {
    throw CompressionError(
        CompressionError::Kind::SOURCE_NOT_FOUND,
        std::format("Source file not found: {}", safe_path_to_string(source)));
  }

  std::vector<std::string> args = {
      m_command,
      "-sDEVICE=pdfwrite",
      "-dCompatibilityLevel=1.4",
      std::format("-dPDFSETTINGS={}", pdf_settings_for(quality)),
      "-dNOPAUSE",
      "-dQUIET",
      "-dBATCH",
      std::format("-sOutputFile={}", destination.string()),
      source.string()};
  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (auto& arg : args) argv.push_back(arg.data());
  argv.push_back(nullptr);

  int pipe_fds[2];
  if (::pipe2(pipe_fds, O_CLOEXEC) != 0) {
    throw CompressionError(
        CompressionError::Kind::TOOL_FAILED,
        std::format("Failed to spawn Ghostscript: {}", std::strerror(errno)));
  }
  FdGuard read_end(pipe_fds[0]);
  FdGuard write_end(pipe_fds[1]);

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null",
                                   O_RDONLY, 0);
  posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null",
                                   O_WRONLY, 0);
  posix_spawn_file_actions_adddup2(&actions, write_end.get(), STDERR_FILENO);

  // The agent blocks SIGINT/SIGTERM in its own threads; the child must not
  // inherit that, or a hung Ghostscript could not be stopped.
  posix_spawnattr_t attr;
  posix_spawnattr_init(&attr);
  sigset_t empty_mask;
  sigemptyset(&empty_mask);
  sigset_t default_signals;
  sigemptyset(&default_signals);
  sigaddset(&default_signals, SIGINT);
  sigaddset(&default_signals, SIGTERM);
  posix_spawnattr_setsigmask(&attr, &empty_mask);
  posix_spawnattr_setsigdefault(&attr, &default_signals);
  posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF);

  pid_t pid = 0;
  int spawn_result = posix_spawnp(&pid, m_command.c_str(), &actions, &attr,
                                  argv.data(), environ);
  posix_spawnattr_destroy(&attr);
  posix_spawn_file_actions_destroy(&actions);

  if (spawn_result != 0) {
    throw CompressionError(
        CompressionError::Kind::TOOL_NOT_FOUND,
        std::format("Failed to spawn Ghostscript ({}): {}. Please install "
                    "Ghostscript (e.g. apt install ghostscript or brew "
                    "install ghostscript)",
                    m_command, std::strerror(spawn_result)));
  }

  // Only the child holds the write end now, so EOF marks its exit.
  write_end.reset();
  const std::string error_output = read_all(read_end.get());

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw CompressionError(
          CompressionError::Kind::TOOL_FAILED,
          std::format("Failed to wait for Ghostscript: {}",
                      std::strerror(errno)));
    }
  }

  if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
    IOManager::log(std::format("Compressed '{}' -> '{}' ({})",
                               safe_path_to_string(source),
                               safe_path_to_string(destination),
                               pdf_settings_for(quality)));
    return;
  }

  const int code = WIFEXITED(status) ? WEXITSTATUS(status)
                                     : 128 + WTERMSIG(status);
  throw CompressionError(
      CompressionError::Kind::TOOL_FAILED,
      std::format("Ghostscript failed with code {}: {}", code, error_output));
}
