#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>
#include <unordered_map>
#include <vector>

#include "types.hpp"

// Recursive inotify watch over a set of folders. A file is reported once it
// has been quiet for the stability window, as CREATED if it appeared while
// being watched and MODIFIED otherwise. Dotfiles and the organizer's own
// subfolders (Images, PDFs, Organized, ...) are never reported.
class FolderWatcher {
 public:
  using Callback = std::function<void(const fs::path&, EventKind)>;

  FolderWatcher(std::vector<fs::path> folders, Callback callback,
                std::chrono::milliseconds stability =
                    std::chrono::milliseconds(500));
  ~FolderWatcher();

  FolderWatcher(const FolderWatcher&) = delete;
  FolderWatcher& operator=(const FolderWatcher&) = delete;

  // Throws std::system_error if inotify is unavailable.
  void start();
  void stop();

  // True when `relative` (a path below a watched folder) contains a dotfile
  // or organizational subfolder component.
  static bool is_ignored(const fs::path& relative);

 private:
  struct Pending {
    EventKind kind;
    std::chrono::steady_clock::time_point last_change;
  };

  void watch_loop(const std::stop_token& stoken);
  // With `reportFiles`, regular files already inside are queued as CREATED.
  void add_watch_recursive(const fs::path& dir, const fs::path& root,
                           bool reportFiles);
  void handle_event(int wd, uint32_t mask, const char* name);
  void flush_settled();

  std::vector<fs::path> m_folders;
  Callback m_callback;
  std::chrono::milliseconds m_stability;

  int m_inotify_fd = -1;
  std::unordered_map<int, std::pair<fs::path, fs::path>> m_wd_to_dir;
  std::unordered_map<std::string, Pending> m_pending;
  std::mutex m_mutex;
  std::jthread m_thread;
};
