#pragma once

/**
 * @file file_io.hpp
 * @brief Crash-safe file helpers used by the file-backed store and registry
 */

#include "licenseguard/licenseguard.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace licenseguard {
namespace detail {

/// Create the directory (and parents) if missing
Result<void> ensure_directory(const std::filesystem::path& dir);

/**
 * @brief Replace path with content atomically
 *
 * Writes a ".tmp" sibling and syncs it to disk, renames it over path, then
 * syncs the directory (POSIX). A crash or power loss at any point leaves
 * either the old file or the complete new one.
 */
Result<void> write_file_atomic(const std::filesystem::path& path, const std::string& content);

/// Read the whole file; ok(nullopt) when it does not exist
Result<std::optional<std::string>> read_file(const std::filesystem::path& path);

/// Remove the file; a missing file is not an error
Result<void> remove_file(const std::filesystem::path& path);

}  // namespace detail
}  // namespace licenseguard
