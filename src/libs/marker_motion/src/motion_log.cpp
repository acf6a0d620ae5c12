#include <marker_motion/motion_log.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace marker_motion {

namespace {

constexpr const char* kLoggerName = "marker_motion";
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";

std::shared_ptr<spdlog::logger>& logger_slot() {
    static std::shared_ptr<spdlog::logger> logger;
    return logger;
}

} // namespace

std::shared_ptr<spdlog::logger> motion_logger() {
    auto& logger = logger_slot();
    if (logger) return logger;

    logger = spdlog::get(kLoggerName);
    if (logger) return logger;
    try {
        logger = spdlog::stderr_color_mt(kLoggerName);
        logger->set_level(spdlog::level::warn);
        logger->set_pattern(kPattern);
    } catch (const spdlog::spdlog_ex&) {
        logger = spdlog::default_logger();
    }
    return logger;
}

bool set_motion_log_file(const std::string& path) {
    auto current = motion_logger();
    spdlog::drop("marker_motion_file");
    try {
        auto file_logger = spdlog::basic_logger_mt("marker_motion_file", path, true);
        file_logger->set_level(current->level());
        file_logger->flush_on(spdlog::level::info);
        file_logger->set_pattern(kPattern);
        logger_slot() = file_logger;
        file_logger->info("Motion logger initialized. file={}", path);
        return true;
    } catch (const spdlog::spdlog_ex& e) {
        current->error("cannot open log file {}: {}", path, e.what());
        return false;
    }
}

} // namespace marker_motion
