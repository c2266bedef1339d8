/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Release builds only - debug builds log to the console from the header
#ifndef DEBUG

#include "core/Logger.hpp"

#include <SDL3/SDL.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <vector>

namespace HiveEngine {
namespace {

constexpr size_t kRetainedLogFiles = 5;
constexpr size_t kFlushEvery = 50;
constexpr const char *kLogPrefix = "hive_";

std::tm localTime(std::time_t t) {
  std::tm out{};
#ifdef _WIN32
  localtime_s(&out, &t);
#else
  localtime_r(&t, &out);
#endif
  return out;
}

// Lazily opened log file under the SDL preferences directory
class LogFileSink {
public:
  static LogFileSink &Instance() {
    static LogFileSink sink;
    return sink;
  }

  void write(const char *level, const char *system, const char *message) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_opened) {
      open();
    }
    if (!m_stream.is_open()) {
      return;
    }

    const auto now = std::chrono::system_clock::now();
    const std::tm tm = localTime(std::chrono::system_clock::to_time_t(now));
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count() %
                    1000;

    m_stream << std::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}.{:03} [{}] [{}] {}\n",
                            tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                            tm.tm_hour, tm.tm_min, tm.tm_sec, ms, level, system,
                            message);

    if (++m_pending >= kFlushEvery || std::strcmp(level, "CRITICAL") == 0) {
      m_stream.flush();
      m_pending = 0;
    }
  }

  LogFileSink(const LogFileSink &) = delete;
  LogFileSink &operator=(const LogFileSink &) = delete;

private:
  LogFileSink() = default;

  ~LogFileSink() {
    if (m_stream.is_open()) {
      m_stream.flush();
    }
  }

  void open() {
    m_opened = true;

    // HIVE_APP_NAME comes from CMake (${PROJECT_NAME})
    char *prefPath = SDL_GetPrefPath("HammerForged", HIVE_APP_NAME);
    if (prefPath == nullptr) {
      return;
    }

    namespace fs = std::filesystem;
    const fs::path logDir = fs::path(prefPath) / "logs";
    SDL_free(prefPath);

    std::error_code ec;
    fs::create_directories(logDir, ec);
    if (ec) {
      return;
    }

    pruneOldLogs(logDir);

    const std::tm tm = localTime(
        std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
    const std::string fileName =
        std::format("{}{:04}{:02}{:02}_{:02}{:02}{:02}.log", kLogPrefix,
                    tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                    tm.tm_min, tm.tm_sec);

    m_stream.open(logDir / fileName, std::ios::out | std::ios::app);
    if (m_stream.is_open()) {
      m_stream << "=== " << HIVE_APP_NAME << " Log ===\n";
      m_stream << "==========================================\n\n";
      m_stream.flush();
    }
  }

  // Keeps the newest kRetainedLogFiles - 1 so the new file makes kRetainedLogFiles
  void pruneOldLogs(const std::filesystem::path &logDir) {
    namespace fs = std::filesystem;

    std::vector<fs::directory_entry> logs;
    std::error_code ec;
    for (const auto &entry : fs::directory_iterator(logDir, ec)) {
      if (entry.path().extension() == ".log" &&
          entry.path().filename().string().starts_with(kLogPrefix)) {
        logs.push_back(entry);
      }
    }

    if (logs.size() < kRetainedLogFiles) {
      return;
    }

    std::sort(logs.begin(), logs.end(),
              [](const fs::directory_entry &a, const fs::directory_entry &b) {
                return a.last_write_time() < b.last_write_time();
              });

    const size_t excess = logs.size() - (kRetainedLogFiles - 1);
    for (size_t i = 0; i < excess; ++i) {
      fs::remove(logs[i].path(), ec);
    }
  }

  std::mutex m_mutex;
  std::ofstream m_stream;
  bool m_opened{false};
  size_t m_pending{0};
};

} // namespace

void Logger::Log(const char *level, const char *system,
                 const std::string &message) {
  Log(level, system, message.c_str());
}

void Logger::Log(const char *level, const char *system, const char *message) {
  if (s_benchmarkMode.load(std::memory_order_relaxed)) {
    return;
  }
  LogFileSink::Instance().write(level, system, message);
}

} // namespace HiveEngine

#endif // ifndef DEBUG
