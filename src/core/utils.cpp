#include "sbem_stack/core/utils.hpp"
#include "sbem_stack/core/errors.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <system_error>

namespace sbem_stack::core {

std::string get_iso_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::string get_run_id() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S") << '_';

    const char* hex = "0123456789abcdef";
    for (int i = 0; i < 8; ++i) {
        oss << hex[dis(gen)];
    }

    return oss.str();
}

std::string format_local_time(std::chrono::system_clock::time_point tp) {
    auto time_t_tp = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf;
    localtime_r(&time_t_tp, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

std::string get_log_timestamp() {
    return format_local_time(std::chrono::system_clock::now());
}

std::string get_file_timestamp() {
    auto time_t_now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S");
    return oss.str();
}

std::string read_text(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

void write_text_atomic(const fs::path& path, const std::string& text) {
    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file) {
            throw IOError("Cannot create file: " + tmp.string());
        }
        file << text;
        file.flush();
        if (!file) {
            throw IOError("Cannot write file: " + tmp.string());
        }
    }
    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        throw IOError("Cannot replace " + path.string() + ": " + ec.message());
    }
}

std::string zero_pad(int value, int digits) {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(digits) << value;
    return oss.str();
}

std::string stack_name_from_base_dir(const fs::path& base_dir) {
    fs::path p = base_dir;
    if (!p.empty() && !p.has_filename()) {
        p = p.parent_path();
    }
    return p.filename().string();
}

fs::path grid_directory(int grid) {
    return fs::path("tiles") / ("g" + zero_pad(grid, kGridDigits));
}

fs::path tile_directory(int grid, int tile) {
    return grid_directory(grid) / ("t" + zero_pad(tile, kTileDigits));
}

fs::path overview_directory(int ov) {
    return fs::path("overviews") / ("ov" + zero_pad(ov, kOverviewDigits));
}

fs::path tile_save_path(const std::string& stack_name, int grid, int tile, int slice) {
    return tile_directory(grid, tile) /
           (stack_name + "_g" + zero_pad(grid, kGridDigits) +
            "_t" + zero_pad(tile, kTileDigits) +
            "_s" + zero_pad(slice, kSliceDigits) + ".tif");
}

fs::path overview_save_path(const std::string& stack_name, int ov, int slice) {
    return overview_directory(ov) /
           (stack_name + "_ov" + zero_pad(ov, kOverviewDigits) +
            "_s" + zero_pad(slice, kSliceDigits) + ".tif");
}

std::string tile_id(int grid, int tile, int slice) {
    return zero_pad(grid, kGridDigits) + "." + zero_pad(tile, kTileDigits) +
           "." + zero_pad(slice, kSliceDigits);
}

std::string format_fixed(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

} // namespace sbem_stack::core
