#pragma once

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace vertree {

// Listener threads of one process log concurrently; one line at a time
inline void writeLogLine(std::ostream &out, const char *level,
                         const std::string &text) {
  static std::mutex log_mutex;

  auto now = std::chrono::system_clock::now();
  std::time_t seconds = std::chrono::system_clock::to_time_t(now);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                    now.time_since_epoch())
                    .count() %
                1000;
  std::tm local{};
  localtime_r(&seconds, &local);
  char stamp[16];
  std::snprintf(stamp, sizeof(stamp), "%02d:%02d:%02d.%03d", local.tm_hour,
                local.tm_min, local.tm_sec, static_cast<int>(millis));

  std::lock_guard<std::mutex> lock(log_mutex);
  out << stamp << " [" << level << "] " << text << std::endl;
}

} // namespace vertree

#define VERTREE_LOG_TO(stream, level, msg) do { \
  std::ostringstream vertree_log_text_; \
  vertree_log_text_ << msg; \
  vertree::writeLogLine(stream, level, vertree_log_text_.str()); \
} while(0)

// Always-on logging for important messages (works in release too)
#define LOG(msg) VERTREE_LOG_TO(std::cout, "LOG", msg)

// Always-on diagnostics for failures the operator must see
#define LOG_ERROR(msg) VERTREE_LOG_TO(std::cerr, "ERROR", msg)

// Debug logging levels
#ifdef DEBUG_BUILD
  #define DEBUG_INFO(msg) VERTREE_LOG_TO(std::cout, "INFO", msg)
  #define DEBUG_DEBUG(msg) VERTREE_LOG_TO(std::cout, "DEBUG", msg)
  #define DEBUG_WARN(msg) VERTREE_LOG_TO(std::cerr, "WARN", msg)
  #define DEBUG_ERROR(msg) VERTREE_LOG_TO(std::cerr, "ERROR", msg)
#else
  // All debug macros become no-ops in release
  #define DEBUG_INFO(msg) ((void)0)
  #define DEBUG_DEBUG(msg) ((void)0)
  #define DEBUG_WARN(msg) ((void)0)
  #define DEBUG_ERROR(msg) ((void)0)
#endif

// Always log errors and exit (even in release)
#define LOG_AND_EXIT(msg, code) do { \
  VERTREE_LOG_TO(std::cerr, "FATAL", msg); \
  std::exit(code); \
} while(0)
