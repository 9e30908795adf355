#pragma once

#include <filesystem>
#include <fstream>
#include <memory>
#include <nlohmann/json.hpp>
#include <ostream>
#include <streambuf>
#include <string>
#include <vector>

namespace sbem_stack::geometry {
class GridManager;
}

namespace sbem_stack::acquisition {

namespace fs = std::filesystem;
using json = nlohmann::json;

// Writes every character to two stream buffers
class TeeBuf : public std::streambuf {
public:
    TeeBuf(std::streambuf* a, std::streambuf* b);

protected:
    int overflow(int c) override;
    int sync() override;

private:
    std::streambuf* a_;
    std::streambuf* b_;
};

// Relative directories of a stack: the fixed layout plus one directory per
// overview, grid and active tile.
std::vector<fs::path> stack_subdirectories(const geometry::GridManager& grids,
                                           int number_overviews);

// Returns false if any directory could not be created
bool create_subdirectories(const fs::path& root, const std::vector<fs::path>& dirs);

// Copy of the stack on a second drive: <mirror_root>/<stack_name>/...
class MirrorDrive {
public:
    MirrorDrive() = default;
    MirrorDrive(fs::path base_dir, fs::path mirror_root, std::string stack_name);

    bool enabled() const { return !mirror_root_.empty(); }
    fs::path directory() const;

    bool create_subdirectories(const std::vector<fs::path>& dirs) const;
    // Copies files below base_dir to the same relative location on the
    // mirror. Returns false on the first failure.
    bool mirror_files(const std::vector<fs::path>& files) const;

private:
    fs::path base_dir_;
    fs::path mirror_root_;
    std::string stack_name_;
};

// Text logs of one acquisition run in <base_dir>/meta/logs, all carrying
// the same timestamp suffix.
class RunLogs {
public:
    // Throws IOError if a log file cannot be created
    RunLogs(const fs::path& base_dir, const std::string& timestamp, bool echo_events);
    ~RunLogs();

    RunLogs(const RunLogs&) = delete;
    RunLogs& operator=(const RunLogs&) = delete;

    const fs::path& logs_dir() const { return logs_dir_; }
    fs::path config_path() const;
    fs::path gridmap_path() const;
    fs::path main_log_path() const;
    fs::path imagelist_path() const;
    fs::path debris_log_path() const;
    fs::path error_log_path() const;
    fs::path metadata_path() const;
    fs::path events_path() const;

    // "[YYYY-MM-DD HH:MM:SS] | message"
    void main(const std::string& message);
    void imagelist(const std::string& line);
    void debris(const std::string& line);
    void error(const std::string& line);
    // "TAG: {json}"
    void metadata(const std::string& tag, const json& payload);

    // JSON-lines event stream
    std::ostream& events() { return *events_out_; }

    // Files that change during the run
    std::vector<fs::path> live_files() const;
    std::vector<fs::path> all_files() const;

private:
    fs::path file(const std::string& prefix, const std::string& ext) const;

    fs::path logs_dir_;
    std::string timestamp_;
    std::ofstream main_;
    std::ofstream imagelist_;
    std::ofstream debris_;
    std::ofstream error_;
    std::ofstream metadata_;
    std::ofstream events_file_;
    std::unique_ptr<TeeBuf> tee_;
    std::unique_ptr<std::ostream> events_out_;
};

} // namespace sbem_stack::acquisition
