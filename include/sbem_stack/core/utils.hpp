#pragma once

#include "types.hpp"
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace sbem_stack::core {

namespace fs = std::filesystem;

// Digits used in stack file and directory names
constexpr int kGridDigits = 4;
constexpr int kTileDigits = 4;
constexpr int kOverviewDigits = 3;
constexpr int kSliceDigits = 5;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();
std::string get_log_timestamp();          // 2024-05-01 13:45:10
std::string get_file_timestamp();         // 20240501_134510
std::string format_local_time(std::chrono::system_clock::time_point tp);

// File utilities
std::string read_text(const fs::path& path);
// Writes to <path>.tmp and renames it over path
void write_text_atomic(const fs::path& path, const std::string& text);

// Stack naming. Paths are relative to the stack base directory.
std::string zero_pad(int value, int digits);
std::string stack_name_from_base_dir(const fs::path& base_dir);
fs::path tile_save_path(const std::string& stack_name, int grid, int tile, int slice);
fs::path overview_save_path(const std::string& stack_name, int ov, int slice);
fs::path grid_directory(int grid);
fs::path tile_directory(int grid, int tile);
fs::path overview_directory(int ov);
std::string tile_id(int grid, int tile, int slice);

// String utilities
std::string format_fixed(double value, int precision);

} // namespace sbem_stack::core
