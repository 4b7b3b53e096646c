#include "file_io.hpp"
#include "logging.hpp"

#include <cerrno>
#include <fstream>
#include <iterator>
#include <system_error>

#include <fcntl.h>

#if defined(_WIN32)
#include <io.h>
#include <share.h>
#include <sys/stat.h>
#else
#include <unistd.h>
#endif

namespace licenseguard {
namespace detail {

namespace {

std::string errno_message() { return std::error_code(errno, std::generic_category()).message(); }

#if defined(_WIN32)

int open_for_write(const std::filesystem::path& path) {
    int fd = -1;
    _wsopen_s(&fd, path.c_str(), _O_WRONLY | _O_CREAT | _O_TRUNC | _O_BINARY, _SH_DENYNO,
              _S_IREAD | _S_IWRITE);
    return fd;
}

long long write_some(int fd, const char* data, size_t size) {
    return _write(fd, data, static_cast<unsigned int>(size));
}

int sync_file(int fd) { return _commit(fd); }

int close_file(int fd) { return _close(fd); }

#else

int open_for_write(const std::filesystem::path& path) {
    return ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0666);
}

long long write_some(int fd, const char* data, size_t size) { return ::write(fd, data, size); }

int sync_file(int fd) { return ::fsync(fd); }

int close_file(int fd) { return ::close(fd); }

#endif

/// Write content to path and force it to stable storage before returning
Result<void> write_durably(const std::filesystem::path& path, const std::string& content) {
    int fd = open_for_write(path);
    if (fd < 0) {
        return Result<void>::error(ErrorCode::StorageError,
                                   "Cannot open " + path.string() + " for writing: " +
                                       errno_message());
    }

    size_t written = 0;
    while (written < content.size()) {
        long long n = write_some(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::string reason = errno_message();
            close_file(fd);
            return Result<void>::error(ErrorCode::StorageError,
                                       "Failed writing " + path.string() + ": " + reason);
        }
        written += static_cast<size_t>(n);
    }

    if (sync_file(fd) != 0) {
        std::string reason = errno_message();
        close_file(fd);
        return Result<void>::error(ErrorCode::StorageError,
                                   "Cannot sync " + path.string() + ": " + reason);
    }
    if (close_file(fd) != 0) {
        return Result<void>::error(ErrorCode::StorageError,
                                   "Failed closing " + path.string() + ": " + errno_message());
    }
    return Result<void>::ok();
}

/// Persist the directory entry created by a rename (POSIX only)
void sync_directory(const std::filesystem::path& dir) {
#if !defined(_WIN32)
    int fd = ::open(dir.empty() ? "." : dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        logger()->warn("cannot open {} to sync it: {}", dir.string(), errno_message());
        return;
    }
    if (::fsync(fd) != 0) {
        logger()->warn("cannot sync directory {}: {}", dir.string(), errno_message());
    }
    ::close(fd);
#else
    (void)dir;
#endif
}

}  // namespace

Result<void> ensure_directory(const std::filesystem::path& dir) {
    std::error_code ec;
    if (std::filesystem::is_directory(dir, ec)) {
        return Result<void>::ok();
    }
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return Result<void>::error(ErrorCode::StorageError,
                                   "Cannot create directory " + dir.string() + ": " + ec.message());
    }
    return Result<void>::ok();
}

Result<void> write_file_atomic(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::path tmp = path;
    tmp += ".tmp";

    auto written = write_durably(tmp, content);
    if (written.is_error()) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        return written;
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        return Result<void>::error(ErrorCode::StorageError,
                                   "Cannot replace " + path.string() + ": " + ec.message());
    }

    sync_directory(path.parent_path());

    logger()->debug("wrote {}", path.string());
    return Result<void>::ok();
}

Result<std::optional<std::string>> read_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec) {
            return Result<std::optional<std::string>>::error(
                ErrorCode::StorageError, "Cannot stat " + path.string() + ": " + ec.message());
        }
        return Result<std::optional<std::string>>::ok(std::nullopt);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return Result<std::optional<std::string>>::error(ErrorCode::StorageError,
                                                         "Cannot open " + path.string());
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return Result<std::optional<std::string>>::error(ErrorCode::StorageError,
                                                         "Failed reading " + path.string());
    }
    return Result<std::optional<std::string>>::ok(std::move(content));
}

Result<void> remove_file(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        return Result<void>::error(ErrorCode::StorageError,
                                   "Cannot remove " + path.string() + ": " + ec.message());
    }
    return Result<void>::ok();
}

}  // namespace detail
}  // namespace licenseguard
