#pragma once

#include <deque>
#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "EventDispatcher.hpp"

// Live view of the running agent: watched folders, activity counters and
// the log. Returns from run() when the user quits.
class UI : public std::enable_shared_from_this<UI> {
 public:
  explicit UI(EventDispatcher& dispatcher);
  void run();

 private:
  void AddLogMessage(std::string_view message);
  std::mutex m_log_mutex;
  std::deque<std::string> m_log_messages;

  ftxui::ScreenInteractive m_screen;
  EventDispatcher& m_dispatcher;
  std::vector<std::pair<fs::path, size_t>> m_folders;
  std::string m_status_text;

  ftxui::Component m_folder_component;
  ftxui::Component m_log_component;
  ftxui::Component m_main_container;
  std::jthread m_refresh_thread;
};
