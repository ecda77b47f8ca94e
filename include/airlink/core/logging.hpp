#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace airlink::logging {

inline constexpr const char* kLoggerName = "airlink";

/// Shared library logger. Created on first use as a colour stderr sink.
std::shared_ptr<spdlog::logger> Get();

/// Replace the library logger, e.g. with an application-owned sink.
void Set(std::shared_ptr<spdlog::logger> logger);

void SetLevel(spdlog::level::level_enum level);

}  // namespace airlink::logging
