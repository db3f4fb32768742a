#include <sheetfork-cpp/logging.hpp>

#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <string>
#include <utility>
#include <vector>

namespace sheetfork_cpp {

namespace {

// All sink changes go through this dist_sink, which is internally locked,
// so the logger itself is never rebuilt while other threads log through it.
auto dist_sink() -> const std::shared_ptr<spdlog::sinks::dist_sink_mt>& {
    static const auto sink = [] {
        auto dist = std::make_shared<spdlog::sinks::dist_sink_mt>();
        dist->add_sink(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        return dist;
    }();
    return sink;
}

}  // namespace

auto logger() -> spdlog::logger& {
    static const auto instance = [] {
        auto log = std::make_shared<spdlog::logger>(std::string{logger_name}, dist_sink());
        log->set_level(spdlog::level::info);
        log->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] [thread %t] %v");
        return log;
    }();
    return *instance;
}

void set_log_level(std::string_view level) {
    logger().set_level(spdlog::level::from_str(std::string{level}));
}

void set_log_sink(std::shared_ptr<spdlog::sinks::sink> sink) {
    auto sinks = std::vector<std::shared_ptr<spdlog::sinks::sink>>{};
    sinks.push_back(std::move(sink));
    dist_sink()->set_sinks(std::move(sinks));
}

void add_log_sink(std::shared_ptr<spdlog::sinks::sink> sink) {
    dist_sink()->add_sink(std::move(sink));
}

void reset_log_sinks() {
    set_log_sink(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
}

}  // namespace sheetfork_cpp
