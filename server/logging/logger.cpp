#include "server/logging/logger.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <iostream>
#include <mutex>
#include <utility>

#include <unistd.h>

using json = nlohmann::json;

namespace pdserve {
namespace log {

namespace {

std::atomic<bool> g_json_mode{false};
std::atomic<int> g_min_level{static_cast<int>(Level::INFO)};
std::mutex g_mutex;

const char *LevelString(Level level) {
  switch (level) {
  case Level::DEBUG:
    return "DEBUG";
  case Level::INFO:
    return "INFO";
  case Level::WARN:
    return "WARN";
  case Level::ERROR:
    return "ERROR";
  }
  return "UNKNOWN";
}

// "request_id=r1 error=connection refused" -> {"request_id":"r1",
// "error":"connection refused"}.  A word without '=' continues the previous
// value.  Returns false when `extra` does not start with a key.
bool ParseFields(const std::string &extra, json *fields) {
  std::string key;
  std::string value;
  std::size_t pos = 0;
  while (pos < extra.size()) {
    std::size_t end = extra.find(' ', pos);
    if (end == std::string::npos) {
      end = extra.size();
    }
    const std::string word = extra.substr(pos, end - pos);
    pos = end + 1;
    const auto eq = word.find('=');
    if (eq != std::string::npos && eq > 0) {
      if (!key.empty()) {
        (*fields)[key] = value;
      }
      key = word.substr(0, eq);
      value = word.substr(eq + 1);
    } else if (key.empty()) {
      return false;
    } else {
      value += " " + word;
    }
  }
  if (key.empty()) {
    return false;
  }
  (*fields)[key] = value;
  return true;
}

} // namespace

void SetJsonMode(bool enabled) { g_json_mode.store(enabled); }
bool IsJsonMode() { return g_json_mode.load(); }

void SetMinLevel(Level level) { g_min_level.store(static_cast<int>(level)); }
Level MinLevel() { return static_cast<Level>(g_min_level.load()); }

bool ParseLevel(const std::string &text, Level *out) {
  std::string lowered = text;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lowered == "debug") {
    *out = Level::DEBUG;
  } else if (lowered == "info") {
    *out = Level::INFO;
  } else if (lowered == "warn" || lowered == "warning") {
    *out = Level::WARN;
  } else if (lowered == "error") {
    *out = Level::ERROR;
  } else {
    return false;
  }
  return true;
}

void Log(Level level, const std::string &component, const std::string &message,
         const std::string &extra) {
  if (static_cast<int>(level) < g_min_level.load(std::memory_order_relaxed)) {
    return;
  }
  auto now = std::chrono::system_clock::now();
  auto ts = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch())
                .count();

  std::string line;
  if (g_json_mode.load()) {
    json j;
    j["ts"] = ts;
    j["level"] = LevelString(level);
    j["component"] = component;
    j["message"] = message;
    j["pid"] = static_cast<int>(::getpid());
    if (!extra.empty()) {
      json fields = json::object();
      if (ParseFields(extra, &fields)) {
        j["fields"] = std::move(fields);
      } else {
        j["extra"] = extra;
      }
    }
    line = j.dump();
  } else {
    line = std::string("[") + LevelString(level) + "] " + component + ": " +
           message;
    if (!extra.empty()) {
      line += " | " + extra;
    }
  }

  std::lock_guard<std::mutex> lock(g_mutex);
  std::cerr << line << "\n";
}

} // namespace log
} // namespace pdserve
