#pragma once

#include <string>

namespace turngate {

// Reads entire file into a string. Throws std::runtime_error on failure.
std::string read_text_file(const std::string& path);

// Writes string to file, creating parent directories if needed.
//
// The contents go to a temporary sibling file that is renamed over the target,
// so readers never observe a truncated file. Throws std::runtime_error.
void write_text_file(const std::string& path, const std::string& contents);

// Creates directory (and parents) if needed; no-op if exists.
void ensure_dir(const std::string& path);

bool file_exists(const std::string& path);

} // namespace turngate
