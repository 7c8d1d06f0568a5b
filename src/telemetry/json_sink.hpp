/**
 * @file json_sink.hpp
 * @brief NDJSON file log sink with rotation support.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

namespace squad_rotation {

/**
 * @brief Writes NDJSON to rotating log files.
 *
 * The active file is <prefix>.ndjson. When it would exceed the size limit
 * it is renamed to <prefix>.1.ndjson, older generations shift up by one,
 * and anything past max_files is deleted.
 */
class JsonFileSink : public ILogSink {
public:
    JsonFileSink(const std::filesystem::path& log_dir,
                 const std::string& prefix,
                 uint64_t max_file_size_bytes = 50ull * 1024 * 1024,
                 uint32_t max_files = 5);
    ~JsonFileSink() override;

    void write(std::string_view json_line) override;
    void flush() override;

    [[nodiscard]] std::filesystem::path active_path() const;

private:
    void rotate_if_needed(size_t incoming);
    [[nodiscard]] std::filesystem::path generation_path(uint32_t generation) const;

    std::filesystem::path log_dir_;
    std::string prefix_;
    uint64_t max_file_size_bytes_;
    uint32_t max_files_;
    std::ofstream current_file_;
    uint64_t current_size_{0};
};

/**
 * @brief Writes to stdout, for development and debugging.
 */
class StdoutSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

/**
 * @brief Discards all output (benchmarks).
 */
class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

/**
 * @brief Logger writing <log_dir>/<prefix>.ndjson at the configured level.
 *
 * An unknown level name falls back to info.
 */
[[nodiscard]] std::unique_ptr<Logger> make_file_logger(const TelemetryConfig& config,
                                                       const std::string& prefix = "squad_rotation");

}  // namespace squad_rotation
