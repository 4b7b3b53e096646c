#pragma once

/**
 * @file logging.hpp
 * @brief Internal logger shared by all LicenseGuard components
 */

#include <spdlog/spdlog.h>

#include <memory>

namespace licenseguard {
namespace detail {

/// Name of the spdlog logger registered by the library
constexpr const char* kLoggerName = "licenseguard";

/// The library logger, created with a stderr sink on first use
std::shared_ptr<spdlog::logger> logger();

/// Switch between debug and info level
void set_debug_logging(bool enabled);

}  // namespace detail
}  // namespace licenseguard
