#include "turngate/util/file_io.h"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace turngate {

namespace {

namespace fs = std::filesystem;

fs::path temp_sibling(const fs::path& target) {
  static std::atomic<unsigned> counter{0};
  const std::string name = target.filename().string() + ".tmp." + std::to_string(++counter);
  const fs::path dir = target.parent_path();
  return dir.empty() ? fs::path(name) : dir / name;
}

// Removes the temp file unless release() was called.
class TempFileGuard {
 public:
  explicit TempFileGuard(fs::path p) : path_(std::move(p)) {}
  ~TempFileGuard() {
    if (!armed_) return;
    std::error_code ec;
    fs::remove(path_, ec);
  }
  TempFileGuard(const TempFileGuard&) = delete;
  TempFileGuard& operator=(const TempFileGuard&) = delete;

  void release() { armed_ = false; }

 private:
  fs::path path_;
  bool armed_{true};
};

} // namespace

std::string read_text_file(const std::string& path) {
  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in) throw std::runtime_error("Failed to open file for reading: " + path);
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) throw std::runtime_error("Failed to read file: " + path);
  return ss.str();
}

void ensure_dir(const std::string& path) {
  if (path.empty()) return;
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) throw std::runtime_error("Failed to create directory: " + path + " (" + ec.message() + ")");
}

bool file_exists(const std::string& path) {
  std::error_code ec;
  return fs::exists(path, ec) && !ec;
}

void write_text_file(const std::string& path, const std::string& contents) {
  const fs::path target(path);
  if (target.has_parent_path()) ensure_dir(target.parent_path().string());

  const fs::path tmp = temp_sibling(target);
  TempFileGuard guard(tmp);
  {
    std::ofstream out(tmp, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open file for writing: " + tmp.string());
    out << contents;
    out.flush();
    if (!out) throw std::runtime_error("Failed to write file: " + tmp.string());
  }

  std::error_code ec;
  fs::rename(tmp, target, ec);
  if (ec) throw std::runtime_error("Failed to replace file: " + path + " (" + ec.message() + ")");
  guard.release();
}

} // namespace turngate
