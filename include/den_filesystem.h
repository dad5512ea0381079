#pragma once

#include <limits.h>
#include <unistd.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace den_filesystem {
namespace fs = std::filesystem;

struct Error {
    std::string message;
    explicit Error(const std::string& msg) : message(msg) {
    }
};

template <typename T>
class Result {
   public:
    explicit Result(T value) : value_(std::move(value)), has_value_(true) {
    }
    explicit Result(const Error& error) : error_(error.message), has_value_(false) {
    }

    static Result<T> ok(T value) {
        return Result<T>(std::move(value));
    }
    static Result<T> error(const std::string& message) {
        return Result<T>(Error(message));
    }

    bool is_ok() const {
        return has_value_;
    }
    bool is_error() const {
        return !has_value_;
    }

    const T& value() const {
        if (!has_value_)
            throw std::runtime_error("Attempted to access value of error Result");
        return value_;
    }

    T& value() {
        if (!has_value_)
            throw std::runtime_error("Attempted to access value of error Result");
        return value_;
    }

    const std::string& error() const {
        if (has_value_)
            throw std::runtime_error("Attempted to access error of ok Result");
        return error_;
    }

   private:
    T value_{};
    std::string error_;
    bool has_value_;
};

template <>
class Result<void> {
   public:
    Result() : has_value_(true) {
    }
    explicit Result(const Error& error) : error_(error.message), has_value_(false) {
    }

    static Result<void> ok() {
        return Result<void>();
    }
    static Result<void> error(const std::string& message) {
        return Result<void>(Error(message));
    }

    bool is_ok() const {
        return has_value_;
    }
    bool is_error() const {
        return !has_value_;
    }

    const std::string& error() const {
        if (has_value_)
            throw std::runtime_error("Attempted to access error of ok Result");
        return error_;
    }

   private:
    std::string error_;
    bool has_value_;
};

Result<int> safe_open(const std::string& path, int flags, mode_t mode = 0644);
Result<void> safe_dup2(int oldfd, int newfd);
void safe_close(int fd);
Result<void> redirect_fd(const std::string& file, int target_fd, int flags);
Result<void> create_pipe(int pipe_fds[2]);
void close_pipe(int pipe_fds[2]);

Result<void> write_all(int fd, std::string_view data);
Result<std::string> read_file_content(const std::string& path);
Result<std::string> read_file_content(const std::string& path, std::size_t max_bytes);

// Modification time in nanoseconds since the epoch.
Result<std::int64_t> file_mtime_ns(const std::string& path);

const fs::path g_user_home_path = []() {
    const char* home = std::getenv("HOME");
    if (!home || home[0] == '\0') {
        return fs::path("/tmp");
    }
    return fs::path(home);
}();

const fs::path g_cache_path = g_user_home_path / ".cache";

const fs::path g_den_cache_path = g_cache_path / "den";

bool initialize_den_directories();

}  // namespace den_filesystem
