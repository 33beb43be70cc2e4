#include <jsondiff-cpp/logging.hpp>

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace jsondiff_cpp {

namespace {

constexpr auto logger_name = "jsondiff";

}  // anonymous namespace

auto logger() -> std::shared_ptr<spdlog::logger> {
    static const auto instance = [] {
        if (auto existing = spdlog::get(logger_name)) return existing;
        auto created = spdlog::stderr_color_mt(logger_name);
        created->set_level(spdlog::level::warn);
        // e.g. SPDLOG_LEVEL=jsondiff=debug
        spdlog::cfg::load_env_levels();
        return created;
    }();
    return instance;
}

void set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

}  // namespace jsondiff_cpp
