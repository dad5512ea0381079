#include "exec.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string_view>

#include "den_filesystem.h"
#include "error_out.h"
#include "parser.h"
#include "script_error.h"
#include "shell.h"
#include "signal_handler.h"
#include "utils/debug.h"

int extract_exit_code(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return 1;
}

namespace {

void flush_standard_streams() {
    std::cout.flush();
    std::cerr.flush();
    (void)fflush(stdout);
    (void)fflush(stderr);
}

bool report_redirect_failure(const den_filesystem::Result<void>& result) {
    if (result.is_error()) {
        print_error({ErrorType::FILE_NOT_FOUND, "den", result.error(), {}});
        return false;
    }
    return true;
}

bool setup_here_document_stdin(const std::string& here_doc) {
    int here_pipe[2] = {-1, -1};
    auto pipe_result = den_filesystem::create_pipe(here_pipe);
    if (pipe_result.is_error()) {
        print_error({ErrorType::RUNTIME_ERROR, "heredoc", pipe_result.error(), {}});
        return false;
    }

    auto write_result = den_filesystem::write_all(here_pipe[1], std::string_view{here_doc});
    den_filesystem::safe_close(here_pipe[1]);
    if (write_result.is_error()) {
        print_error({ErrorType::RUNTIME_ERROR, "heredoc", write_result.error(), {}});
        den_filesystem::safe_close(here_pipe[0]);
        return false;
    }

    auto dup_result = den_filesystem::safe_dup2(here_pipe[0], STDIN_FILENO);
    den_filesystem::safe_close(here_pipe[0]);
    return report_redirect_failure(dup_result);
}

}  // namespace

Exec::Exec(Shell& shell) : shell(shell) {
}

bool Exec::apply_redirections(const Command& cmd) {
    if (cmd.here_doc) {
        if (!setup_here_document_stdin(*cmd.here_doc)) {
            return false;
        }
    }
    if (!cmd.input_file.empty() &&
        !report_redirect_failure(
            den_filesystem::redirect_fd(cmd.input_file, STDIN_FILENO, O_RDONLY))) {
        return false;
    }
    if (!cmd.output_file.empty() &&
        !report_redirect_failure(den_filesystem::redirect_fd(
            cmd.output_file, STDOUT_FILENO, O_WRONLY | O_CREAT | O_TRUNC))) {
        return false;
    }
    if (!cmd.append_file.empty() &&
        !report_redirect_failure(den_filesystem::redirect_fd(
            cmd.append_file, STDOUT_FILENO, O_WRONLY | O_CREAT | O_APPEND))) {
        return false;
    }
    if (!cmd.both_output_file.empty()) {
        if (!report_redirect_failure(den_filesystem::redirect_fd(
                cmd.both_output_file, STDOUT_FILENO, O_WRONLY | O_CREAT | O_TRUNC)) ||
            !report_redirect_failure(den_filesystem::safe_dup2(STDOUT_FILENO, STDERR_FILENO))) {
            return false;
        }
    }
    if (!cmd.stderr_file.empty()) {
        int flags = O_WRONLY | O_CREAT | (cmd.stderr_append ? O_APPEND : O_TRUNC);
        if (!report_redirect_failure(
                den_filesystem::redirect_fd(cmd.stderr_file, STDERR_FILENO, flags))) {
            return false;
        }
    }
    if (cmd.stderr_to_stdout &&
        !report_redirect_failure(den_filesystem::safe_dup2(STDOUT_FILENO, STDERR_FILENO))) {
        return false;
    }
    if (cmd.stdout_to_stderr &&
        !report_redirect_failure(den_filesystem::safe_dup2(STDERR_FILENO, STDOUT_FILENO))) {
        return false;
    }
    return true;
}

std::string Exec::find_executable_in_path(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        return name;
    }
    const char* path_env = std::getenv("PATH");
    std::string path = path_env != nullptr ? path_env : "/usr/local/bin:/usr/bin:/bin";

    std::size_t start = 0;
    while (start <= path.size()) {
        std::size_t end = path.find(':', start);
        std::string dir = path.substr(start, end == std::string::npos ? std::string::npos
                                                                      : end - start);
        if (dir.empty()) {
            dir = ".";
        }
        std::string candidate = dir + "/" + name;
        struct stat st{};
        if (::stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
            access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
    return "";
}

void Exec::exec_child(const std::vector<std::string>& args) {
    std::vector<char*> c_args;
    c_args.reserve(args.size() + 1);
    for (const auto& arg : args) {
        c_args.push_back(const_cast<char*>(arg.c_str()));
    }
    c_args.push_back(nullptr);

    execvp(args[0].c_str(), c_args.data());

    int saved_errno = errno;
    if (saved_errno == ENOENT) {
        print_error({ErrorType::COMMAND_NOT_FOUND, args[0], "command not found", {}});
        _exit(127);
    }
    if (saved_errno == EACCES) {
        print_error({ErrorType::PERMISSION_DENIED, args[0], "permission denied", {}});
        _exit(126);
    }
    print_error({ErrorType::RUNTIME_ERROR, args[0], std::strerror(saved_errno), {}});
    _exit(126);
}

int Exec::run_internal_in_child(const std::vector<std::string>& args) {
    int code = 0;
    try {
        code = shell.run_internal_command(args);
    } catch (const ScriptError& e) {
        print_error({e.error_type(), args[0], e.what(), {}});
        code = 1;
    }
    if (shell.exit_requested()) {
        code = shell.get_exit_code();
    }
    flush_standard_streams();
    return code;
}

int Exec::wait_for_child(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return 1;
        }
    }
    return extract_exit_code(status);
}

int Exec::execute_command_sync(const Command& cmd) {
    const auto& args = cmd.args;
    if (args.empty()) {
        return 0;
    }

    if (find_executable_in_path(args[0]).empty()) {
        print_error({ErrorType::COMMAND_NOT_FOUND, args[0], "command not found", {}});
        last_exit_code = 127;
        return last_exit_code;
    }

    flush_standard_streams();
    pid_t pid = fork();
    if (pid < 0) {
        print_error({ErrorType::RUNTIME_ERROR, args[0],
                     std::string("fork failed: ") + std::strerror(errno), {}});
        last_exit_code = 1;
        return last_exit_code;
    }

    if (pid == 0) {
        SignalHandler::reset_child_signals();
        if (!apply_redirections(cmd)) {
            _exit(1);
        }
        exec_child(args);
    }

    last_exit_code = wait_for_child(pid);
    den_debug_msg("%s exited with status %d", args[0].c_str(), last_exit_code);
    return last_exit_code;
}

int Exec::execute_pipeline(const std::vector<Command>& commands) {
    if (commands.empty()) {
        return 0;
    }
    if (commands.size() == 1 && !commands[0].args.empty() &&
        !shell.is_internal_command(commands[0].args[0])) {
        return execute_command_sync(commands[0]);
    }

    flush_standard_streams();
    std::vector<pid_t> pids;
    int prev_read = -1;
    bool failed = false;

    for (std::size_t i = 0; i < commands.size(); ++i) {
        const Command& cmd = commands[i];
        bool has_next = i + 1 < commands.size();
        int pipe_fds[2] = {-1, -1};
        if (has_next) {
            auto pipe_result = den_filesystem::create_pipe(pipe_fds);
            if (pipe_result.is_error()) {
                print_error({ErrorType::RUNTIME_ERROR, "pipeline", pipe_result.error(), {}});
                failed = true;
                break;
            }
        }

        pid_t pid = fork();
        if (pid < 0) {
            print_error({ErrorType::RUNTIME_ERROR, "pipeline",
                         std::string("fork failed: ") + std::strerror(errno), {}});
            den_filesystem::close_pipe(pipe_fds);
            failed = true;
            break;
        }

        if (pid == 0) {
            SignalHandler::reset_child_signals();
            if (prev_read != -1) {
                if (den_filesystem::safe_dup2(prev_read, STDIN_FILENO).is_error()) {
                    _exit(1);
                }
                den_filesystem::safe_close(prev_read);
            }
            if (has_next) {
                den_filesystem::safe_close(pipe_fds[0]);
                if (den_filesystem::safe_dup2(pipe_fds[1], STDOUT_FILENO).is_error()) {
                    _exit(1);
                }
                den_filesystem::safe_close(pipe_fds[1]);
            }
            if (!apply_redirections(cmd)) {
                _exit(1);
            }
            if (cmd.args.empty()) {
                _exit(0);
            }
            if (shell.is_internal_command(cmd.args[0])) {
                _exit(run_internal_in_child(cmd.args) & 0xFF);
            }
            exec_child(cmd.args);
        }

        pids.push_back(pid);
        den_filesystem::safe_close(prev_read);
        prev_read = -1;
        if (has_next) {
            den_filesystem::safe_close(pipe_fds[1]);
            prev_read = pipe_fds[0];
        }
    }
    den_filesystem::safe_close(prev_read);

    int status = 1;
    for (pid_t pid : pids) {
        status = wait_for_child(pid);
    }
    last_exit_code = failed ? 1 : status;
    den_debug_msg("pipeline of %zu command(s) exited with status %d", commands.size(),
                  last_exit_code);
    return last_exit_code;
}

RedirectionScope::RedirectionScope(Exec& exec, const Command& cmd) {
    if (!cmd.has_redirections()) {
        return;
    }
    flush_standard_streams();
    for (int fd = 0; fd < 3; ++fd) {
        saved_fds[fd] = fcntl(fd, F_DUPFD_CLOEXEC, 10);
    }
    active = true;
    applied = exec.apply_redirections(cmd);
}

RedirectionScope::~RedirectionScope() {
    if (!active) {
        return;
    }
    flush_standard_streams();
    for (int fd = 0; fd < 3; ++fd) {
        if (saved_fds[fd] >= 0) {
            (void)den_filesystem::safe_dup2(saved_fds[fd], fd);
            den_filesystem::safe_close(saved_fds[fd]);
        }
    }
    std::cin.clear();
}
