/// @file logging.hpp
/// @brief The library's spdlog logger.

#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace jsondiff_cpp {

/// The "jsondiff" logger, created on first use with a stderr sink at level
/// warn. SPDLOG_LEVEL in the environment overrides the level at creation.
auto logger() -> std::shared_ptr<spdlog::logger>;

/// Change the level of the library logger.
void set_log_level(spdlog::level::level_enum level);

}  // namespace jsondiff_cpp
