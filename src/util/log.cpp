#include "log.h"

#include <stdarg.h>
#include <stddef.h>
#include <stdio.h>
#include <unistd.h>

#include <atomic>
#include <mutex>

#include <etl/error_handler.h>
#include <etl/exception.h>

namespace boilerlink {
namespace log {

namespace {

constexpr size_t kMaxLineLength = 512;

std::atomic<uint8_t> g_level(static_cast<uint8_t>(Level::INFO));
std::mutex g_write_mutex;

const char* level_label(Level level) {
  switch (level) {
    case Level::ERROR: return "[ERROR]";
    case Level::WARN:  return "[WARN] ";
    case Level::INFO:  return "[INFO] ";
    case Level::DEBUG: return "[DEBUG]";
  }
  return "[?]    ";
}

void write_all(const char* data, size_t len) {
  while (len > 0) {
    const ssize_t written = ::write(2, data, len);
    if (written <= 0) {
      return;
    }
    data += static_cast<size_t>(written);
    len -= static_cast<size_t>(written);
  }
}

void emit(Level level, const char* tag, const char* fmt, va_list args) {
  if (!enabled(level)) {
    return;
  }

  char line[kMaxLineLength];
  int prefix = snprintf(line, sizeof(line), "%s [%s] ", level_label(level), tag);
  if (prefix < 0) {
    return;
  }
  size_t len = static_cast<size_t>(prefix);
  if (len < sizeof(line)) {
    const int body = vsnprintf(line + len, sizeof(line) - len, fmt, args);
    if (body > 0) {
      len += static_cast<size_t>(body);
    }
  }
  // Truncated lines keep their newline.
  if (len >= sizeof(line) - 1) {
    len = sizeof(line) - 2;
  }
  line[len++] = '\n';

  std::lock_guard<std::mutex> lock(g_write_mutex);
  write_all(line, len);
}

void on_etl_error(const etl::exception& e) {
  error(TAG_ETL, "%s (%s:%d)", e.what(), e.file_name(), static_cast<int>(e.line_number()));
}

}  // namespace

void set_level(Level level) { g_level.store(static_cast<uint8_t>(level)); }

bool enabled(Level level) { return static_cast<uint8_t>(level) <= g_level.load(); }

#define BOILERLINK_LOG_EMIT(lvl)         \
  do {                                   \
    va_list args;                        \
    va_start(args, fmt);                 \
    emit((lvl), tag, fmt, args);         \
    va_end(args);                        \
  } while (0)

void error(const char* tag, const char* fmt, ...) { BOILERLINK_LOG_EMIT(Level::ERROR); }
void warn(const char* tag, const char* fmt, ...) { BOILERLINK_LOG_EMIT(Level::WARN); }
void info(const char* tag, const char* fmt, ...) { BOILERLINK_LOG_EMIT(Level::INFO); }
void debug(const char* tag, const char* fmt, ...) { BOILERLINK_LOG_EMIT(Level::DEBUG); }

#undef BOILERLINK_LOG_EMIT

void install_etl_error_handler() {
  etl::error_handler::set_callback<on_etl_error>();
}

}  // namespace log
}  // namespace boilerlink
