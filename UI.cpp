#include "UI.hpp"

#include <chrono>
#include <ftxui/component/component.hpp>
#include <ftxui/dom/elements.hpp>

#include "IOManager.hpp"
#include "utils.hpp"

using namespace ftxui;

UI::UI(EventDispatcher& dispatcher)
    : m_screen(ScreenInteractive::Fullscreen()),
      m_dispatcher(dispatcher),
      m_folders(dispatcher.watched_folders()),
      m_status_text("Watching. Press 'q' or Quit to stop.") {
  IOManager::log("Initializing UI components...");

  try {
    m_folder_component = Renderer([&] {
      if (m_folders.empty()) {
        return text("No folders are being watched.") | center;
      }
      Elements elements;
      for (const auto& [folder, rule_count] : m_folders) {
        elements.push_back(hbox({text(" " + safe_path_to_string(folder)),
                                 filler(),
                                 text(std::format("{} rule(s) ", rule_count)) |
                                     dim}));
      }
      return vbox(elements) | vscroll_indicator | frame;
    });

    m_log_component = Renderer([&] {
      Elements logs;
      {
        std::scoped_lock lock(m_log_mutex);
        for (const auto& msg : m_log_messages) {
          logs.push_back(text(msg));
        }
      }
      return vbox(logs) | focusPositionRelative(0, 1) | vscroll_indicator |
             frame | flex;
    });

  } catch (const std::exception& e) {
    IOManager::log(std::format(
        "CRITICAL: Failed to initialize UI components: {}", e.what()));
    throw;
  }
}

void UI::AddLogMessage(std::string_view message) {
  {
    std::scoped_lock lock(m_log_mutex);
    m_log_messages.push_back(std::string(message));
    if (m_log_messages.size() > 100) {
      m_log_messages.pop_front();
    }
  }
  m_screen.Post(Event::Custom);
}

void UI::run() {
  try {
    IOManager::set_log_handler(
        [this](std::string_view message) { this->AddLogMessage(message); });

    auto quit_button = Button("  Quit  ", [this] {
      IOManager::log("Quit requested. Finishing in-flight files...");
      m_status_text = "Stopping...";
      m_screen.Exit();
    });

    m_main_container = Container::Vertical({quit_button, m_log_component});

    auto final_renderer = Renderer(m_main_container, [&] {
      Element mode_badge = m_dispatcher.dry_run()
                               ? text(" DRY RUN ") | bold |
                                     color(Color::Black) |
                                     bgcolor(Color::Yellow)
                               : text(" LIVE ") | bold;

      auto counters = hbox(
          {text(std::format(" In flight: {}", m_dispatcher.in_flight_count())),
           text("   "),
           text(std::format("Handled: {}", m_dispatcher.handled_count())),
           filler(), quit_button->Render()});

      auto top_pane = vbox(
          {hbox({text(" autofiler ") | bold, filler(), mode_badge}) |
               color(Color::White) | bgcolor(Color::Blue),
           counters, separator(), text(" Watched folders") | bold,
           m_folder_component->Render() | flex, separator(),
           text(" " + m_status_text)});

      auto log_pane =
          vbox({text("Log Output") | bold, m_log_component->Render() | flex});

      return vbox({top_pane | flex_grow, separator(),
                   log_pane | size(HEIGHT, EQUAL, 12)}) |
             border;
    });

    final_renderer |= CatchEvent([&](Event event) {
      if (event == Event::Character('q')) {
        IOManager::log("Quit requested. Finishing in-flight files...");
        m_screen.Exit();
        return true;
      }
      return false;
    });

    // Counters change without user input; redraw once a second.
    m_refresh_thread = std::jthread([this](const std::stop_token& stoken) {
      while (!stoken.stop_requested()) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
        m_screen.Post(Event::Custom);
      }
    });

    IOManager::log("Starting UI event loop...");
    m_screen.Loop(final_renderer);
    IOManager::log("UI event loop exited.");

    m_refresh_thread.request_stop();
    m_refresh_thread.join();
    IOManager::set_log_handler(nullptr);

  } catch (const std::exception& e) {
    IOManager::log(
        std::format("CRITICAL: Exception in UI::run(): {}", e.what()));
    throw;
  } catch (...) {
    IOManager::log("CRITICAL: Unknown exception in UI::run()");
    throw;
  }
}
