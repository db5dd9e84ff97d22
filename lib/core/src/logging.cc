#include "core/logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace Forest::Core {

namespace {
    constexpr const char* kLoggerName = "forest";
}

std::shared_ptr<spdlog::logger> logger()
{
    static std::shared_ptr<spdlog::logger> instance = [] {
        if (auto existing = spdlog::get(kLoggerName)) {
            return existing;
        }
        return spdlog::stdout_color_mt(kLoggerName);
    }();
    return instance;
}

} // namespace Forest::Core
