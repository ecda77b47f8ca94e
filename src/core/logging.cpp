#include "airlink/core/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace airlink::logging {

namespace {
    std::mutex g_logger_lock;
    std::shared_ptr<spdlog::logger> g_logger;
}

std::shared_ptr<spdlog::logger> Get() {
    std::lock_guard<std::mutex> guard(g_logger_lock);
    if (!g_logger) {
        g_logger = spdlog::get(kLoggerName);
        if (!g_logger) {
            g_logger = spdlog::stderr_color_mt(kLoggerName);
            g_logger->set_level(spdlog::level::info);
        }
    }
    return g_logger;
}

void Set(std::shared_ptr<spdlog::logger> logger) {
    std::lock_guard<std::mutex> guard(g_logger_lock);
    g_logger = std::move(logger);
}

void SetLevel(const spdlog::level::level_enum level) {
    Get()->set_level(level);
}

}  // namespace airlink::logging
