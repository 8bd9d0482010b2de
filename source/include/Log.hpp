#pragma once

#include <cstdint>
#include <filesystem>
#include <format>
#include <string_view>
#include <utility>

namespace logging {

enum class Level { Debug, Info, Warn, Error };

// "10M", "1G", "512K" or a plain byte count
std::uint64_t parse_size(std::string_view size);

// throws std::runtime_error when the file cannot be opened
void init_file_sink(const std::filesystem::path& file, std::uint64_t max_size);
void close_file_sink();

void set_level(Level level);
bool enabled(Level level);

void write(Level level, std::string_view message);

template <typename... Args>
void write_line(Level level, std::format_string<Args...> fmt, Args&&... args) {
    if (!enabled(level)) return;
    write(level, std::format(fmt, std::forward<Args>(args)...));
}

}

#define MOVER_LOG_DEBUG(...) logging::write_line(logging::Level::Debug, __VA_ARGS__)
#define MOVER_LOG_INFO(...)  logging::write_line(logging::Level::Info, __VA_ARGS__)
#define MOVER_LOG_WARN(...)  logging::write_line(logging::Level::Warn, __VA_ARGS__)
#define MOVER_LOG_ERROR(...) logging::write_line(logging::Level::Error, __VA_ARGS__)
