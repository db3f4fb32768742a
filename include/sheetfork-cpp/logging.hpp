/// @file logging.hpp
/// @brief Engine logger: a named spdlog logger whose sinks can be replaced
/// at runtime to route events to an external collector.
///
/// @code
/// sheetfork_cpp::set_log_level("debug");
/// sheetfork_cpp::set_log_sink(std::make_shared<spdlog::sinks::stdout_sink_mt>());
/// SHEETFORK_LOG_DEBUG("cache hit workbook_id={}", id.str());
/// @endcode

#pragma once

#include <spdlog/sinks/sink.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>

namespace sheetfork_cpp {

/// Name under which the engine logger is registered with spdlog.
inline constexpr auto logger_name = std::string_view{"sheetfork"};

/// The engine logger. Created on first use, writing to stderr.
auto logger() -> spdlog::logger&;

/// Set the minimum level from a spdlog level name ("debug", "info", ...).
/// Unknown names select "off".
void set_log_level(std::string_view level);

/// Replace every sink with `sink`.
void set_log_sink(std::shared_ptr<spdlog::sinks::sink> sink);

/// Add `sink` alongside the existing ones.
void add_log_sink(std::shared_ptr<spdlog::sinks::sink> sink);

/// Restore the default stderr sink.
void reset_log_sinks();

}  // namespace sheetfork_cpp

#define SHEETFORK_LOG_TRACE(...) ::sheetfork_cpp::logger().trace(__VA_ARGS__)
#define SHEETFORK_LOG_DEBUG(...) ::sheetfork_cpp::logger().debug(__VA_ARGS__)
#define SHEETFORK_LOG_INFO(...)  ::sheetfork_cpp::logger().info(__VA_ARGS__)
#define SHEETFORK_LOG_WARN(...)  ::sheetfork_cpp::logger().warn(__VA_ARGS__)
#define SHEETFORK_LOG_ERROR(...) ::sheetfork_cpp::logger().error(__VA_ARGS__)
