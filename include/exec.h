#pragma once

#include <string>
#include <vector>

#include <sys/types.h>

class Shell;
struct Command;

int extract_exit_code(int status);

// Process creation for external commands and pipelines, plus the file-descriptor plumbing for
// redirections and heredocs.
class Exec {
   public:
    explicit Exec(Shell& shell);

    Exec(const Exec&) = delete;
    Exec& operator=(const Exec&) = delete;

    // Runs an expanded external command in a child process and waits for it.
    int execute_command_sync(const Command& cmd);

    // Runs expanded commands connected by pipes. The status is that of the last command.
    int execute_pipeline(const std::vector<Command>& commands);

    // Applies the redirections of `cmd` to the current process.
    bool apply_redirections(const Command& cmd);

    static std::string find_executable_in_path(const std::string& name);

    int get_exit_code() const {
        return last_exit_code;
    }

   private:
    [[noreturn]] void exec_child(const std::vector<std::string>& args);
    int run_internal_in_child(const std::vector<std::string>& args);
    int wait_for_child(pid_t pid);

    Shell& shell;
    int last_exit_code = 0;
};

// Saves stdin, stdout and stderr, applies a command's redirections, and puts the original
// descriptors back when it goes out of scope. Used for builtins and functions that run inside
// the shell process.
class RedirectionScope {
   public:
    RedirectionScope(Exec& exec, const Command& cmd);
    ~RedirectionScope();

    RedirectionScope(const RedirectionScope&) = delete;
    RedirectionScope& operator=(const RedirectionScope&) = delete;

    bool ok() const {
        return applied;
    }

   private:
    int saved_fds[3] = {-1, -1, -1};
    bool active = false;
    bool applied = true;
};
