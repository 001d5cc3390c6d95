#ifndef BOILERLINK_LOG_H
#define BOILERLINK_LOG_H

#include <stdint.h>

// --- Log Tags ---
#define TAG_MAIN   "Main"
#define TAG_SERIAL "Serial"
#define TAG_CLIENT "Client"
#define TAG_PROXY  "Proxy"
#define TAG_CONN   "Conn"
#define TAG_ETL    "ETL"

namespace boilerlink {
namespace log {

enum class Level : uint8_t {
  ERROR = 0,
  WARN = 1,
  INFO = 2,
  DEBUG = 3
};

// Messages above this level are dropped. Default: INFO.
void set_level(Level level);
bool enabled(Level level);

// Each call emits one "[LEVEL] [tag] message" line on stderr. Lines from
// concurrent threads never interleave.
void error(const char* tag, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void warn(const char* tag, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void info(const char* tag, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void debug(const char* tag, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

// Routes ETL_ASSERT failures to error().
void install_etl_error_handler();

}  // namespace log
}  // namespace boilerlink

#endif  // BOILERLINK_LOG_H
