#pragma once

#include <spdlog/spdlog.h>
#include <string>

namespace gitstack::log {

using spdlog::trace;
using spdlog::debug;
using spdlog::info;
using spdlog::warn;
using spdlog::error;

// Diagnostics go to stderr. GIT_STACK_LOG overrides the level picked by `verbose`.
void init(bool verbose);

spdlog::level::level_enum parseLevel(const std::string& level, spdlog::level::level_enum fallback);

}
