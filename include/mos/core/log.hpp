#pragma once

namespace mos { namespace log {

enum class Level {
  Debug,
  Info,
  Warning,
  Error
};

// printf-style; messages below the current level are dropped.
void write(Level level, const char* format, ...);

void set_level(Level level);
Level level();

// Initial level comes from MOS_LOG_LEVEL=debug|info|warning|error (default: warning).
Level level_from_env();

}} // namespace mos::log

#define MOS_LOG_DEBUG(...) \
  do { if (::mos::log::level() <= ::mos::log::Level::Debug) ::mos::log::write(::mos::log::Level::Debug, __VA_ARGS__); } while (0)
#define MOS_LOG_WARN(...)  ::mos::log::write(::mos::log::Level::Warning, __VA_ARGS__)
