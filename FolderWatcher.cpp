#include "FolderWatcher.hpp"

#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <system_error>
#include <tuple>

#include "IOManager.hpp"
#include "utils.hpp"

namespace {
constexpr std::array<std::string_view, 11> kIgnoredFolders = {
    "Images",     "Videos", "Music", "Archives",  "Documents", "Installers",
    "Code",       "PDFs",   "Organized", "ByApp", "ByDate"};

constexpr uint32_t kWatchMask = IN_CREATE | IN_MODIFY | IN_CLOSE_WRITE |
                                IN_MOVED_TO | IN_MOVED_FROM | IN_DELETE |
                                IN_DELETE_SELF;
}  // namespace

FolderWatcher::FolderWatcher(std::vector<fs::path> folders, Callback callback,
                             std::chrono::milliseconds stability)
    : m_folders(std::move(folders)),
      m_callback(std::move(callback)),
      m_stability(stability) {}

FolderWatcher::~FolderWatcher() { stop(); }

bool FolderWatcher::is_ignored(const fs::path& relative) {
  for (const auto& part : relative) {
    const std::string name = safe_path_to_string(part);
    if (name.empty() || name == "." || name == "..") continue;
    if (name.starts_with('.')) return true;
    for (const auto& ignored : kIgnoredFolders) {
      if (name == ignored) return true;
    }
  }
  return false;
}

void FolderWatcher::start() {
  if (m_thread.joinable()) return;

  m_inotify_fd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
  if (m_inotify_fd < 0) {
    throw std::system_error(errno, std::generic_category(), "inotify_init1");
  }

  for (const auto& folder : m_folders) {
    std::error_code ec;
    if (!fs::is_directory(folder, ec)) {
      IOManager::log(std::format("Warning: Watched folder '{}' does not exist.",
                                 safe_path_to_string(folder)));
      continue;
    }
    add_watch_recursive(folder, folder, false);
    IOManager::log(std::format("Watching '{}'", safe_path_to_string(folder)));
  }

  m_thread = std::jthread(
      [this](const std::stop_token& stoken) { watch_loop(stoken); });
}

void FolderWatcher::stop() {
  if (m_thread.joinable()) {
    m_thread.request_stop();
    m_thread.join();
  }
  if (m_inotify_fd >= 0) {
    ::close(m_inotify_fd);
    m_inotify_fd = -1;
  }
  std::scoped_lock lock(m_mutex);
  m_wd_to_dir.clear();
  m_pending.clear();
}

void FolderWatcher::add_watch_recursive(const fs::path& dir,
                                        const fs::path& root,
                                        bool reportFiles) {
  int wd = inotify_add_watch(m_inotify_fd, dir.c_str(), kWatchMask);
  if (wd < 0) {
    IOManager::log(std::format("Warning: Cannot watch '{}': {}",
                               safe_path_to_string(dir),
                               std::system_category().message(errno)));
    return;
  }
  {
    std::scoped_lock lock(m_mutex);
    m_wd_to_dir[wd] = {dir, root};
  }

  std::error_code ec;
  for (const auto& entry : fs::directory_iterator(
           dir, fs::directory_options::skip_permission_denied, ec)) {
    std::error_code type_ec;
    if (entry.is_symlink(type_ec)) continue;
    if (is_ignored(fs::relative(entry.path(), root, type_ec))) continue;
    if (entry.is_directory(type_ec)) {
      add_watch_recursive(entry.path(), root, reportFiles);
    } else if (reportFiles && entry.is_regular_file(type_ec)) {
      // Files that arrived with a moved-in or freshly created directory
      // produce no events of their own.
      std::scoped_lock lock(m_mutex);
      m_pending.try_emplace(entry.path().string(),
                            Pending{EventKind::CREATED,
                                    std::chrono::steady_clock::now()});
    }
  }
}

void FolderWatcher::watch_loop(const std::stop_token& stoken) {
  alignas(inotify_event) char buffer[16 * 1024];

  while (!stoken.stop_requested()) {
    pollfd pfd{m_inotify_fd, POLLIN, 0};
    int ready = ::poll(&pfd, 1, 100);
    if (ready < 0 && errno != EINTR) {
      IOManager::log(std::format("Watcher poll failed: {}",
                                 std::system_category().message(errno)));
      break;
    }

    if (ready > 0 && (pfd.revents & POLLIN)) {
      while (true) {
        ssize_t len = ::read(m_inotify_fd, buffer, sizeof(buffer));
        if (len <= 0) break;
        for (char* ptr = buffer; ptr < buffer + len;) {
          const auto* event = reinterpret_cast<const inotify_event*>(ptr);
          handle_event(event->wd, event->mask,
                       event->len > 0 ? event->name : nullptr);
          ptr += sizeof(inotify_event) + event->len;
        }
      }
    }

    flush_settled();
  }
}

void FolderWatcher::handle_event(int wd, uint32_t mask, const char* name) {
  fs::path dir, root;
  {
    std::scoped_lock lock(m_mutex);
    auto it = m_wd_to_dir.find(wd);
    if (it == m_wd_to_dir.end()) return;
    if (mask & (IN_IGNORED | IN_DELETE_SELF)) {
      m_wd_to_dir.erase(it);
      return;
    }
    std::tie(dir, root) = it->second;
  }
  if (!name) return;

  const fs::path path = dir / name;
  std::error_code ec;
  if (is_ignored(fs::relative(path, root, ec))) return;

  if (mask & IN_ISDIR) {
    if (mask & (IN_CREATE | IN_MOVED_TO)) {
      add_watch_recursive(path, root, true);
    }
    return;
  }

  const auto now = std::chrono::steady_clock::now();
  const std::string key = path.string();
  std::scoped_lock lock(m_mutex);

  if (mask & (IN_DELETE | IN_MOVED_FROM)) {
    m_pending.erase(key);
  } else if (mask & (IN_CREATE | IN_MOVED_TO)) {
    m_pending[key] = {EventKind::CREATED, now};
  } else if (mask & (IN_MODIFY | IN_CLOSE_WRITE)) {
    auto it = m_pending.find(key);
    if (it != m_pending.end()) {
      it->second.last_change = now;
    } else {
      m_pending[key] = {EventKind::MODIFIED, now};
    }
  }
}

void FolderWatcher::flush_settled() {
  std::vector<std::pair<fs::path, EventKind>> settled;
  {
    std::scoped_lock lock(m_mutex);
    const auto now = std::chrono::steady_clock::now();
    for (auto it = m_pending.begin(); it != m_pending.end();) {
      if (now - it->second.last_change >= m_stability) {
        settled.emplace_back(fs::path(it->first), it->second.kind);
        it = m_pending.erase(it);
      } else {
        ++it;
      }
    }
  }

  for (const auto& [path, kind] : settled) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) continue;
    try {
      m_callback(path, kind);
    } catch (const std::exception& e) {
      IOManager::log(std::format("Error handling change of '{}': {}",
                                 safe_path_to_string(path), e.what()));
    }
  }
}
