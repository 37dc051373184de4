#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "turngate/util/file_io.h"

#define TG_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_file_io() {
  namespace fs = std::filesystem;

  std::error_code ec;
  fs::path dir = fs::temp_directory_path(ec);
  if (ec || dir.empty()) dir = fs::path(".");

  const auto nonce = std::chrono::steady_clock::now().time_since_epoch().count();
  dir /= "turngate_test_file_io";
  dir /= std::to_string(static_cast<long long>(nonce));

  // write_text_file creates missing parents.
  const fs::path target = dir / "nested" / "atomic.txt";
  turngate::write_text_file(target.string(), "hello\n");
  TG_ASSERT(turngate::file_exists(target.string()));
  TG_ASSERT(turngate::read_text_file(target.string()) == "hello\n");

  // Overwrite goes through a temp file + rename; no temp siblings are left.
  turngate::write_text_file(target.string(), "world\n");
  TG_ASSERT(turngate::read_text_file(target.string()) == "world\n");
  int entries = 0;
  for (const auto& e : fs::directory_iterator(target.parent_path())) {
    (void)e;
    ++entries;
  }
  TG_ASSERT(entries == 1);

  bool threw = false;
  try {
    (void)turngate::read_text_file((dir / "missing.txt").string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  TG_ASSERT(threw);
  TG_ASSERT(!turngate::file_exists((dir / "missing.txt").string()));

  turngate::ensure_dir((dir / "a" / "b").string());
  TG_ASSERT(fs::is_directory(dir / "a" / "b"));

  fs::remove_all(dir, ec);
  return 0;
}
