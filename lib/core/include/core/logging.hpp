#pragma once

#include <memory>
#include <spdlog/spdlog.h>

namespace Forest::Core {

// Shared "forest" logger (stdout, colour). Created on first use and registered
// with spdlog, so callers may retune it via spdlog::get("forest").
std::shared_ptr<spdlog::logger> logger();

} // namespace Forest::Core
