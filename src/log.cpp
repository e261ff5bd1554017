#include "librtlife/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <utility>

namespace librtlife::log {

namespace {

std::mutex& logger_mutex() {
    static std::mutex m;
    return m;
}

std::shared_ptr<spdlog::logger>& logger_slot() {
    static std::shared_ptr<spdlog::logger> slot;
    return slot;
}

std::shared_ptr<spdlog::logger> make_default_logger() {
    // Reuse a logger the application registered under our name.
    if (auto existing = spdlog::get(logger_name)) {
        return existing;
    }
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(logger_name, std::move(sink));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
    logger->set_level(spdlog::level::warn);
    return logger;
}

} // namespace

std::shared_ptr<spdlog::logger> get() {
    std::lock_guard lock(logger_mutex());
    auto& slot = logger_slot();
    if (!slot) {
        slot = make_default_logger();
    }
    return slot;
}

void set(std::shared_ptr<spdlog::logger> logger) {
    std::lock_guard lock(logger_mutex());
    logger_slot() = std::move(logger);
}

} // namespace librtlife::log
