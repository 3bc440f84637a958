/**
 * @file json_sink.hpp
 * @brief NDJSON log sinks: rotating file, stdout, in-memory, null.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace edge_twin {

/**
 * @brief Writes NDJSON to `<log_dir>/<prefix>.ndjson`, rotating by size.
 *
 * When the active file exceeds the size limit it is renamed to
 * `<prefix>.1.ndjson` (older generations shift up) and a fresh file is
 * opened. At most `max_files` rotated generations are kept.
 */
class JsonFileSink : public ILogSink {
public:
    JsonFileSink(const std::filesystem::path& log_dir,
                 const std::string& prefix,
                 uint32_t max_file_size_mb = 50,
                 uint32_t max_files = 5);
    ~JsonFileSink() override;

    void write(std::string_view json_line) override;
    void flush() override;

    [[nodiscard]] std::filesystem::path current_path() const;
    [[nodiscard]] bool is_open() const noexcept { return current_file_.is_open(); }

    /// Lower the rotation threshold below 1 MB.
    void set_max_file_size_bytes(uint64_t bytes) noexcept { max_file_size_bytes_ = bytes; }

private:
    void rotate_if_needed();
    [[nodiscard]] std::filesystem::path generation_path(uint32_t n) const;

    std::filesystem::path log_dir_;
    std::string prefix_;
    uint64_t max_file_size_bytes_;
    uint32_t max_files_;
    std::ofstream current_file_;
    uint64_t current_size_{0};
};

/**
 * @brief Writes to stdout.
 */
class StdoutSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

/**
 * @brief Keeps every line in memory.
 */
class MemorySink : public ILogSink {
public:
    void write(std::string_view json_line) override { lines_.emplace_back(json_line); }
    void flush() override {}

    [[nodiscard]] const std::vector<std::string>& lines() const noexcept { return lines_; }

private:
    std::vector<std::string> lines_;
};

/**
 * @brief Discards all output.
 */
class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

}  // namespace edge_twin
