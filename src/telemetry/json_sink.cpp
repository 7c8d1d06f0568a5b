/**
 * @file json_sink.cpp
 * @brief Log sink implementations.
 */

#include "telemetry/json_sink.hpp"

#include <iostream>
#include <system_error>

namespace squad_rotation {

// ── JsonFileSink ─────────────────────────────

JsonFileSink::JsonFileSink(const std::filesystem::path& log_dir,
                           const std::string& prefix,
                           uint64_t max_file_size_bytes,
                           uint32_t max_files)
    : log_dir_(log_dir)
    , prefix_(prefix)
    , max_file_size_bytes_(max_file_size_bytes)
    , max_files_(max_files) {
    std::filesystem::create_directories(log_dir_);
    auto path = active_path();

    std::error_code ec;
    auto existing = std::filesystem::file_size(path, ec);
    current_size_ = ec ? 0 : existing;
    current_file_.open(path, std::ios::app);
}

JsonFileSink::~JsonFileSink() {
    if (current_file_.is_open()) {
        current_file_.flush();
        current_file_.close();
    }
}

std::filesystem::path JsonFileSink::active_path() const {
    return log_dir_ / (prefix_ + ".ndjson");
}

std::filesystem::path JsonFileSink::generation_path(uint32_t generation) const {
    return log_dir_ / (prefix_ + "." + std::to_string(generation) + ".ndjson");
}

void JsonFileSink::write(std::string_view json_line) {
    rotate_if_needed(json_line.size() + 1);
    if (current_file_.is_open()) {
        current_file_ << json_line << '\n';
        current_size_ += json_line.size() + 1;
    }
}

void JsonFileSink::flush() {
    if (current_file_.is_open()) {
        current_file_.flush();
    }
}

void JsonFileSink::rotate_if_needed(size_t incoming) {
    if (current_size_ == 0 || current_size_ + incoming <= max_file_size_bytes_) return;

    current_file_.close();

    // Best effort: a failed rename leaves the active file oversized
    std::error_code ec;
    if (max_files_ == 0) {
        std::filesystem::remove(active_path(), ec);
    } else {
        std::filesystem::remove(generation_path(max_files_), ec);
        for (uint32_t gen = max_files_; gen > 1; --gen) {
            if (std::filesystem::exists(generation_path(gen - 1), ec)) {
                std::filesystem::rename(generation_path(gen - 1), generation_path(gen), ec);
            }
        }
        std::filesystem::rename(active_path(), generation_path(1), ec);
    }

    current_file_.open(active_path(), std::ios::trunc);
    current_size_ = 0;
}

// ── StdoutSink ───────────────────────────────

void StdoutSink::write(std::string_view json_line) {
    std::cout << json_line << '\n';
}

void StdoutSink::flush() {
    std::cout.flush();
}

// ── Factory ──────────────────────────────────

std::unique_ptr<Logger> make_file_logger(const TelemetryConfig& config, const std::string& prefix) {
    auto sink = std::make_unique<JsonFileSink>(
        config.log_dir, prefix,
        static_cast<uint64_t>(config.max_file_size_mb) * 1024 * 1024,
        config.rotate_count);
    auto level = parse_log_level(config.log_level).value_or(LogLevel::Info);
    return std::make_unique<Logger>(std::move(sink), level);
}

}  // namespace squad_rotation
