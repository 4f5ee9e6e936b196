#include "walkforage/util/log.h"

#include <iostream>
#include <mutex>
#include <utility>

#include "walkforage/util/strings.h"

namespace walkforage::log {
namespace {

std::mutex g_mu;
Level g_level = Level::Info;
Sink g_sink;

void emit(Level l, const std::string& msg) {
  Sink sink;
  {
    std::lock_guard<std::mutex> lock(g_mu);
    if (g_level == Level::Off || l < g_level) return;
    if (!g_sink) {
      std::cerr << "[" << level_label(l) << "] " << msg << "\n";
      return;
    }
    sink = g_sink;
  }
  // Called unlocked so a sink may log or swap the sink itself.
  sink(l, msg);
}

} // namespace

void set_level(Level lvl) {
  std::lock_guard<std::mutex> lock(g_mu);
  g_level = lvl;
}

Level level() {
  std::lock_guard<std::mutex> lock(g_mu);
  return g_level;
}

bool parse_level(const std::string& text, Level& out) {
  const std::string s = to_lower(trim(text));
  if (s == "debug") {
    out = Level::Debug;
  } else if (s == "info") {
    out = Level::Info;
  } else if (s == "warn" || s == "warning") {
    out = Level::Warn;
  } else if (s == "error") {
    out = Level::Error;
  } else if (s == "off" || s == "none") {
    out = Level::Off;
  } else {
    return false;
  }
  return true;
}

const char* level_label(Level l) {
  switch (l) {
    case Level::Debug: return "DEBUG";
    case Level::Info: return "INFO";
    case Level::Warn: return "WARN";
    case Level::Error: return "ERROR";
    case Level::Off: return "OFF";
  }
  return "";
}

void set_sink(Sink sink) {
  std::lock_guard<std::mutex> lock(g_mu);
  g_sink = std::move(sink);
}

void debug(const std::string& msg) { emit(Level::Debug, msg); }
void info(const std::string& msg) { emit(Level::Info, msg); }
void warn(const std::string& msg) { emit(Level::Warn, msg); }
void error(const std::string& msg) { emit(Level::Error, msg); }

} // namespace walkforage::log
