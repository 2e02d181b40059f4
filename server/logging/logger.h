#pragma once

#include <string>

namespace pdserve {
namespace log {

enum class Level { DEBUG, INFO, WARN, ERROR };

// Enable JSON-structured output (one JSON object per line to stderr).
// Default mode is plain text: "[LEVEL] component: message".
// Call from main() based on PDSERVE_LOG_FORMAT=json before any logging.
void SetJsonMode(bool enabled);
bool IsJsonMode();

// Entries below `level` are discarded.  Default is INFO.
void SetMinLevel(Level level);
Level MinLevel();

// Parses "debug", "info", "warn"/"warning", "error" (case-insensitive).
// Returns false and leaves *out untouched for anything else.
bool ParseLevel(const std::string &text, Level *out);

// Emit a log entry at the given level.  `component` identifies the subsystem
// (e.g. "decode", "prefill", "queue").  `extra` is an optional
// "key=value key=value" string: appended verbatim to the text line, split
// into a "fields" object in JSON mode (kept as "extra" if it does not parse).
void Log(Level level, const std::string &component, const std::string &message,
         const std::string &extra = {});

// Convenience wrappers.
inline void Debug(const std::string &component, const std::string &message,
                  const std::string &extra = {}) {
  Log(Level::DEBUG, component, message, extra);
}
inline void Info(const std::string &component, const std::string &message,
                 const std::string &extra = {}) {
  Log(Level::INFO, component, message, extra);
}
inline void Warn(const std::string &component, const std::string &message,
                 const std::string &extra = {}) {
  Log(Level::WARN, component, message, extra);
}
inline void Error(const std::string &component, const std::string &message,
                  const std::string &extra = {}) {
  Log(Level::ERROR, component, message, extra);
}

} // namespace log
} // namespace pdserve
