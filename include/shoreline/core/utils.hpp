#pragma once

#include "types.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace shoreline::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::vector<fs::path> discover_files(const fs::path& dir, const std::string& pattern);
std::vector<uint8_t> read_bytes(const fs::path& path);
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);

// Hash utilities
std::string sha256_bytes(const std::vector<uint8_t>& data);
std::string sha256_file(const fs::path& path);

// String utilities
std::string to_lower(const std::string& s);
std::string trim(const std::string& s);
bool ends_with(const std::string& str, const std::string& suffix);
std::vector<std::string> split_whitespace(const std::string& str);

// Glob pattern matching
bool glob_match(const std::string& pattern, const std::string& str);

} // namespace shoreline::core
