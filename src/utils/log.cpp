#include "log.hpp"
#include "file_utils.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace gitstack::log {

spdlog::level::level_enum parseLevel(const std::string& level, spdlog::level::level_enum fallback) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "off") return spdlog::level::off;
    return fallback;
}

void init(bool verbose) {
    spdlog::drop("git-stack");
    auto logger = spdlog::stderr_color_st("git-stack");
    spdlog::set_default_logger(logger);

    const auto fallback = verbose ? spdlog::level::debug : spdlog::level::warn;
    spdlog::set_level(parseLevel(utils::FileUtils::getEnvVar("GIT_STACK_LOG"), fallback));
    spdlog::set_pattern("[%l] %v");
}

}
