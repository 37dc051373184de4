#include "turngate/util/log.h"

#include <cctype>
#include <iostream>
#include <mutex>
#include <utility>

namespace turngate::log {
namespace {
std::mutex g_mu;
Level g_level = Level::Info;
Sink g_sink;

void emit(Level l, const std::string& msg) {
  if (g_level == Level::Off || l < g_level) return;
  std::lock_guard<std::mutex> lock(g_mu);
  if (g_sink) {
    g_sink(l, msg);
    return;
  }
  std::cerr << "[" << level_label(l) << "] " << msg << "\n";
}

} // namespace

void set_level(Level lvl) { g_level = lvl; }
Level level() { return g_level; }

const char* level_label(Level lvl) {
  switch (lvl) {
    case Level::Debug: return "DEBUG";
    case Level::Info: return "INFO";
    case Level::Warn: return "WARN";
    case Level::Error: return "ERROR";
    case Level::Off: return "OFF";
  }
  return "";
}

bool parse_level(const std::string& s, Level* out) {
  std::string v;
  v.reserve(s.size());
  for (char ch : s) v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));

  Level parsed;
  if (v == "debug") {
    parsed = Level::Debug;
  } else if (v == "info") {
    parsed = Level::Info;
  } else if (v == "warn" || v == "warning") {
    parsed = Level::Warn;
  } else if (v == "error") {
    parsed = Level::Error;
  } else if (v == "off") {
    parsed = Level::Off;
  } else {
    return false;
  }
  if (out) *out = parsed;
  return true;
}

void set_sink(Sink sink) {
  std::lock_guard<std::mutex> lock(g_mu);
  g_sink = std::move(sink);
}

void debug(const std::string& msg) { emit(Level::Debug, msg); }
void info(const std::string& msg) { emit(Level::Info, msg); }
void warn(const std::string& msg) { emit(Level::Warn, msg); }
void error(const std::string& msg) { emit(Level::Error, msg); }

} // namespace turngate::log
