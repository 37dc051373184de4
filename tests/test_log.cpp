#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "turngate/util/log.h"

#define TG_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_log() {
  using namespace turngate;

  std::vector<std::pair<log::Level, std::string>> seen;
  const log::Level saved = log::level();
  log::set_sink([&](log::Level lvl, const std::string& msg) { seen.emplace_back(lvl, msg); });
  log::set_level(log::Level::Warn);

  log::debug("d");
  log::info("i");
  log::warn("w");
  log::error("e");

  log::set_sink({});
  log::set_level(saved);

  TG_ASSERT(seen.size() == 2);
  TG_ASSERT(seen[0].first == log::Level::Warn && seen[0].second == "w");
  TG_ASSERT(seen[1].first == log::Level::Error && seen[1].second == "e");

  log::Level lvl = log::Level::Info;
  TG_ASSERT(log::parse_level("DEBUG", &lvl) && lvl == log::Level::Debug);
  TG_ASSERT(log::parse_level("warning", &lvl) && lvl == log::Level::Warn);
  TG_ASSERT(log::parse_level("off", &lvl) && lvl == log::Level::Off);
  TG_ASSERT(!log::parse_level("loud", &lvl));
  TG_ASSERT(lvl == log::Level::Off);
  TG_ASSERT(std::string(log::level_label(log::Level::Error)) == "ERROR");

  return 0;
}
