#include "sbem_stack/acquisition/acq_logs.hpp"
#include "sbem_stack/core/errors.hpp"
#include "sbem_stack/core/utils.hpp"
#include "sbem_stack/geometry/grid_manager.hpp"

#include <iostream>

namespace sbem_stack::acquisition {

TeeBuf::TeeBuf(std::streambuf* a, std::streambuf* b) : a_(a), b_(b) {}

int TeeBuf::overflow(int c) {
    if (c == EOF)
        return EOF;
    const int ra = a_ ? a_->sputc(static_cast<char>(c)) : c;
    const int rb = b_ ? b_->sputc(static_cast<char>(c)) : c;
    return (ra == EOF || rb == EOF) ? EOF : c;
}

int TeeBuf::sync() {
    int ra = a_ ? a_->pubsync() : 0;
    int rb = b_ ? b_->pubsync() : 0;
    return (ra == 0 && rb == 0) ? 0 : -1;
}

std::vector<fs::path> stack_subdirectories(const geometry::GridManager& grids,
                                           int number_overviews) {
    std::vector<fs::path> dirs = {
        "meta",
        "meta/logs",
        "meta/stats",
        "overviews",
        "overviews/stub",
        "overviews/debris",
        "tiles",
        "workspace",
        "workspace/viewport",
        "workspace/reslices",
    };
    for (int ov = 0; ov < number_overviews; ++ov) {
        dirs.push_back(core::overview_directory(ov));
    }
    for (int g = 0; g < grids.number_grids(); ++g) {
        dirs.push_back(core::grid_directory(g));
        for (int t : grids.active_tiles(g)) {
            dirs.push_back(core::tile_directory(g, t));
        }
    }
    return dirs;
}

bool create_subdirectories(const fs::path& root, const std::vector<fs::path>& dirs) {
    for (const auto& d : dirs) {
        std::error_code ec;
        fs::create_directories(root / d, ec);
        if (ec || !fs::is_directory(root / d)) {
            std::cerr << "[STACK] cannot create " << (root / d).string()
                      << ": " << ec.message() << std::endl;
            return false;
        }
    }
    return true;
}

MirrorDrive::MirrorDrive(fs::path base_dir, fs::path mirror_root, std::string stack_name)
    : base_dir_(std::move(base_dir)),
      mirror_root_(std::move(mirror_root)),
      stack_name_(std::move(stack_name)) {}

fs::path MirrorDrive::directory() const {
    return mirror_root_ / stack_name_;
}

bool MirrorDrive::create_subdirectories(const std::vector<fs::path>& dirs) const {
    if (!enabled()) return true;
    return acquisition::create_subdirectories(directory(), dirs);
}

bool MirrorDrive::mirror_files(const std::vector<fs::path>& files) const {
    if (!enabled()) return true;
    for (const auto& f : files) {
        const fs::path rel = f.is_absolute() ? f.lexically_relative(base_dir_) : f;
        if (rel.empty() || *rel.begin() == "..") {
            std::cerr << "[MIRROR] " << f.string() << " is outside the stack" << std::endl;
            return false;
        }
        const fs::path dst = directory() / rel;
        std::error_code ec;
        fs::create_directories(dst.parent_path(), ec);
        fs::copy_file(base_dir_ / rel, dst, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            std::cerr << "[MIRROR] copy " << rel.string() << " failed: " << ec.message()
                      << std::endl;
            return false;
        }
    }
    return true;
}

RunLogs::RunLogs(const fs::path& base_dir, const std::string& timestamp, bool echo_events)
    : logs_dir_(base_dir / "meta" / "logs"), timestamp_(timestamp) {
    std::error_code ec;
    fs::create_directories(logs_dir_, ec);

    auto open = [](std::ofstream& s, const fs::path& p) {
        s.open(p, std::ios::out | std::ios::app);
        if (!s) {
            throw IOError("Cannot create log file: " + p.string());
        }
    };
    open(main_, main_log_path());
    open(imagelist_, imagelist_path());
    open(debris_, debris_log_path());
    open(error_, error_log_path());
    open(metadata_, metadata_path());
    open(events_file_, events_path());

    if (echo_events) {
        tee_ = std::make_unique<TeeBuf>(std::cout.rdbuf(), events_file_.rdbuf());
        events_out_ = std::make_unique<std::ostream>(tee_.get());
    } else {
        events_out_ = std::make_unique<std::ostream>(events_file_.rdbuf());
    }
}

RunLogs::~RunLogs() {
    if (events_out_) events_out_->flush();
}

fs::path RunLogs::file(const std::string& prefix, const std::string& ext) const {
    return logs_dir_ / (prefix + "_" + timestamp_ + ext);
}

fs::path RunLogs::config_path() const { return file("config", ".yaml"); }
fs::path RunLogs::gridmap_path() const { return file("gridmap", ".txt"); }
fs::path RunLogs::main_log_path() const { return file("log", ".txt"); }
fs::path RunLogs::imagelist_path() const { return file("imagelist", ".txt"); }
fs::path RunLogs::debris_log_path() const { return file("debris_log", ".txt"); }
fs::path RunLogs::error_log_path() const { return file("error_log", ".txt"); }
fs::path RunLogs::metadata_path() const { return file("metadata", ".txt"); }
fs::path RunLogs::events_path() const { return file("events", ".jsonl"); }

void RunLogs::main(const std::string& message) {
    main_ << "[" << core::get_log_timestamp() << "] | " << message << "\n";
    main_.flush();
}

void RunLogs::imagelist(const std::string& line) {
    imagelist_ << line << "\n";
    imagelist_.flush();
}

void RunLogs::debris(const std::string& line) {
    debris_ << line << "\n";
    debris_.flush();
}

void RunLogs::error(const std::string& line) {
    error_ << line << "\n";
    error_.flush();
}

void RunLogs::metadata(const std::string& tag, const json& payload) {
    metadata_ << tag << ": " << payload.dump() << "\n";
    metadata_.flush();
}

std::vector<fs::path> RunLogs::live_files() const {
    return {main_log_path(), imagelist_path(), debris_log_path(), error_log_path(),
            metadata_path()};
}

std::vector<fs::path> RunLogs::all_files() const {
    std::vector<fs::path> files = {config_path(), gridmap_path()};
    for (auto& f : live_files()) files.push_back(f);
    return files;
}

} // namespace sbem_stack::acquisition
