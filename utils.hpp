#pragma once

#include <chrono>
#include <filesystem>
#include <format>
#include <random>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

// A central, thread-safe utility to convert a std::filesystem::path to a
// UTF-8 encoded std::string, suitable for logging and display.
inline std::string safe_path_to_string(const fs::path& p) {
  // path::u8string() is locale-independent and returns a UTF-8 encoded string.
  // On C++20/23, this returns a std::u8string, which needs to be converted.
  auto u8str = p.u8string();
  return std::string(reinterpret_cast<const char*>(u8str.c_str()),
                     u8str.length());
}

// The inverse of safe_path_to_string: builds a path from UTF-8 text.
inline fs::path path_from_utf8(std::string_view s) {
  return fs::path(std::u8string(reinterpret_cast<const char8_t*>(s.data()),
                                s.size()));
}

// A simple, locale-independent function to convert a string to lowercase.
// It only handles basic ASCII characters, which is safe and sufficient for
// things like file extensions and common keywords.
inline std::string string_to_lower_ascii(std::string_view sv) {
  std::string result;
  result.reserve(sv.length());
  for (char c : sv) {
    if (c >= 'A' && c <= 'Z') {
      result += static_cast<char>(c + ('a' - 'A'));
    } else {
      result += c;
    }
  }
  return result;
}

// Replaces every occurrence of `from` in `text`. Replacements are not
// re-scanned.
inline void replace_all(std::string& text, std::string_view from,
                        std::string_view to) {
  if (from.empty()) return;
  size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.length(), to);
    pos += to.length();
  }
}

// UTC timestamp in ISO 8601 form, used for rule and run records.
inline std::string iso_timestamp(std::chrono::system_clock::time_point tp =
                                     std::chrono::system_clock::now()) {
  return std::format(
      "{:%Y-%m-%dT%H:%M:%S}Z",
      std::chrono::floor<std::chrono::seconds>(tp));
}

// Random RFC 4122 version 4 identifier for run records.
inline std::string generate_uuid() {
  thread_local std::mt19937_64 rng{std::random_device{}()};
  std::uniform_int_distribution<unsigned long long> dist;
  unsigned long long hi = dist(rng);
  unsigned long long lo = dist(rng);
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;
  return std::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}", hi >> 32,
                     (hi >> 16) & 0xFFFF, hi & 0xFFFF, lo >> 48,
                     lo & 0xFFFFFFFFFFFFULL);
}
