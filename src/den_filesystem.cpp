#include "den_filesystem.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <system_error>

namespace den_filesystem {

namespace {
std::string describe_errno(int err) {
    return std::system_category().message(err);
}
}  // namespace

Result<int> safe_open(const std::string& path, int flags, mode_t mode) {
    int fd = ::open(path.c_str(), flags, mode);
    if (fd == -1) {
        return Result<int>::error("Failed to open file '" + path + "': " + describe_errno(errno));
    }
    return Result<int>::ok(fd);
}

Result<void> safe_dup2(int oldfd, int newfd) {
    if (::dup2(oldfd, newfd) == -1) {
        return Result<void>::error("Failed to duplicate file descriptor " + std::to_string(oldfd) +
                                   " to " + std::to_string(newfd) + ": " + describe_errno(errno));
    }
    return Result<void>::ok();
}

void safe_close(int fd) {
    if (fd >= 0) {
        ::close(fd);
    }
}

Result<void> redirect_fd(const std::string& file, int target_fd, int flags) {
    auto open_result = safe_open(file, flags, 0644);
    if (open_result.is_error()) {
        return Result<void>::error(open_result.error());
    }

    int file_fd = open_result.value();

    if (file_fd != target_fd) {
        auto dup_result = safe_dup2(file_fd, target_fd);
        safe_close(file_fd);
        if (dup_result.is_error()) {
            return dup_result;
        }
    }

    return Result<void>::ok();
}

Result<void> create_pipe(int pipe_fds[2]) {
    if (::pipe(pipe_fds) == -1) {
        return Result<void>::error("Failed to create pipe: " + describe_errno(errno));
    }
    return Result<void>::ok();
}

void close_pipe(int pipe_fds[2]) {
    safe_close(pipe_fds[0]);
    safe_close(pipe_fds[1]);
    pipe_fds[0] = -1;
    pipe_fds[1] = -1;
}

Result<void> write_all(int fd, std::string_view data) {
    size_t total_written = 0;
    while (total_written < data.size()) {
        size_t remaining = data.size() - total_written;
#ifdef SSIZE_MAX
        remaining = std::min(remaining, static_cast<size_t>(SSIZE_MAX));
#endif
        ssize_t written = ::write(fd, data.data() + total_written, remaining);
        if (written == -1) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            return Result<void>::error("Failed to write to file descriptor " + std::to_string(fd) +
                                       ": " + describe_errno(errno));
        }
        if (written == 0) {
            return Result<void>::error("Write to file descriptor " + std::to_string(fd) +
                                       " returned zero bytes");
        }
        total_written += static_cast<size_t>(written);
    }
    return Result<void>::ok();
}

Result<std::string> read_file_content(const std::string& path) {
    return read_file_content(path, 0);
}

Result<std::string> read_file_content(const std::string& path, std::size_t max_bytes) {
    auto open_result = safe_open(path, O_RDONLY);
    if (open_result.is_error()) {
        return Result<std::string>::error(open_result.error());
    }

    int fd = open_result.value();
    std::string content;
    char buffer[4096];
    ssize_t bytes_read = 0;

    while ((bytes_read = ::read(fd, buffer, sizeof(buffer))) > 0) {
        content.append(buffer, static_cast<size_t>(bytes_read));
        if (max_bytes != 0 && content.size() > max_bytes) {
            safe_close(fd);
            return Result<std::string>::error("File '" + path + "' exceeds the maximum size of " +
                                              std::to_string(max_bytes) + " bytes");
        }
    }

    int saved_errno = errno;
    safe_close(fd);

    if (bytes_read < 0) {
        return Result<std::string>::error("Failed to read from file '" + path +
                                          "': " + describe_errno(saved_errno));
    }

    return Result<std::string>::ok(content);
}

Result<std::int64_t> file_mtime_ns(const std::string& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        return Result<std::int64_t>::error("Failed to stat file '" + path +
                                           "': " + describe_errno(errno));
    }
    std::int64_t seconds = static_cast<std::int64_t>(st.st_mtim.tv_sec);
    std::int64_t nanos = static_cast<std::int64_t>(st.st_mtim.tv_nsec);
    return Result<std::int64_t>::ok(seconds * 1000000000LL + nanos);
}

bool initialize_den_directories() {
    try {
        fs::create_directories(g_cache_path);
        fs::create_directories(g_den_cache_path);

        return true;
    } catch (const fs::filesystem_error& e) {
        std::cerr << "Error creating den directories: " << e.what() << '\n';
        return false;
    }
}

}  // namespace den_filesystem
