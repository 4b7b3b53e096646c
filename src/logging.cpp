#include "logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace licenseguard {
namespace detail {

std::shared_ptr<spdlog::logger> logger() {
    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);

    // Hosts may register their own "licenseguard" logger before first use
    auto existing = spdlog::get(kLoggerName);
    if (existing) {
        return existing;
    }

    auto created = spdlog::stderr_color_mt(kLoggerName);
    created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    created->set_level(spdlog::level::info);
    return created;
}

void set_debug_logging(bool enabled) {
    logger()->set_level(enabled ? spdlog::level::debug : spdlog::level::info);
}

}  // namespace detail
}  // namespace licenseguard
