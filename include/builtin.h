#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

class Shell;

// Prints `help_lines` to stdout and returns true when args[1] is -h or --help.
bool builtin_handle_help(const std::vector<std::string>& args,
                         const std::vector<std::string>& help_lines);

class Built_ins {
   public:
    Built_ins();
    ~Built_ins() = default;

    void set_shell(Shell* shell_ptr) {
        shell = shell_ptr;
    }
    Shell* get_shell() {
        return shell;
    }

    int builtin_command(const std::vector<std::string>& args);
    bool is_builtin_command(const std::string& cmd) const;

    std::vector<std::string> get_builtin_commands() const;

   private:
    std::unordered_map<std::string, std::function<int(const std::vector<std::string>&)>> builtins;
    Shell* shell;
};
