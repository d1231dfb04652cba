#include "mos/core/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace mos { namespace log {

static std::atomic<Level>& current_level() {
  static std::atomic<Level> lvl{level_from_env()};
  return lvl;
}

Level level_from_env() {
  const char* s = std::getenv("MOS_LOG_LEVEL");
  if (!s) return Level::Warning;
  if (!std::strcmp(s, "debug"))   return Level::Debug;
  if (!std::strcmp(s, "info"))    return Level::Info;
  if (!std::strcmp(s, "error"))   return Level::Error;
  return Level::Warning;
}

void write(Level lvl, const char* format, ...) {
  if (lvl < level()) return;

  switch (lvl) {
    case Level::Debug:   std::fprintf(stderr, "[mos][DEBUG] "); break;
    case Level::Info:    std::fprintf(stderr, "[mos][INFO] "); break;
    case Level::Warning: std::fprintf(stderr, "[mos][WARNING] "); break;
    case Level::Error:   std::fprintf(stderr, "[mos][ERROR] "); break;
  }

  va_list args;
  va_start(args, format);
  std::vfprintf(stderr, format, args);
  va_end(args);

  std::fprintf(stderr, "\n");
}

void set_level(Level lvl) {
  current_level().store(lvl, std::memory_order_relaxed);
}

Level level() {
  return current_level().load(std::memory_order_relaxed);
}

}} // namespace mos::log
