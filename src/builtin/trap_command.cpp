#include "trap_command.h"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>
#include <vector>

#include "builtin.h"
#include "error_out.h"
#include "shell.h"

namespace {

std::string normalize_condition(std::string condition) {
    std::transform(condition.begin(), condition.end(), condition.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (condition.rfind("SIG", 0) == 0) {
        condition = condition.substr(3);
    }
    if (condition == "0") {
        return "EXIT";
    }
    return condition;
}

bool is_trappable(const std::string& condition) {
    return condition == "EXIT" || condition == "ERR";
}

std::string single_quote(const std::string& text) {
    std::string quoted = "'";
    for (char c : text) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

void print_traps(Shell* shell, const std::vector<std::string>& only) {
    for (const auto& trap : shell->list_traps()) {
        if (!only.empty() && std::find(only.begin(), only.end(), trap.first) == only.end()) {
            continue;
        }
        std::cout << "trap -- " << single_quote(trap.second) << " " << trap.first << '\n';
    }
    std::cout.flush();
}

}  // namespace

int trap_command(const std::vector<std::string>& args, Shell* shell) {
    if (builtin_handle_help(args, {"Usage: trap [-p] [COMMAND] [CONDITION ...]",
                                   "Run COMMAND when the shell exits (EXIT) or a command fails "
                                   "(ERR).",
                                   "Use '-' as COMMAND to remove a trap."})) {
        return 0;
    }
    if (shell == nullptr) {
        return 1;
    }

    if (args.size() == 1) {
        print_traps(shell, {});
        return 0;
    }

    if (args[1] == "-p") {
        std::vector<std::string> only;
        for (size_t i = 2; i < args.size(); ++i) {
            only.push_back(normalize_condition(args[i]));
        }
        print_traps(shell, only);
        return 0;
    }

    size_t first_condition = 2;
    std::string command = args[1];
    if (command == "--") {
        if (args.size() < 3) {
            print_traps(shell, {});
            return 0;
        }
        command = args[2];
        first_condition = 3;
    }

    if (first_condition >= args.size()) {
        // A lone condition name resets it.
        std::string condition = normalize_condition(command);
        if (!is_trappable(condition)) {
            print_error({ErrorType::INVALID_ARGUMENT, "trap",
                         command + ": invalid signal specification", {}});
            return 1;
        }
        shell->remove_trap(condition);
        return 0;
    }

    int status = 0;
    for (size_t i = first_condition; i < args.size(); ++i) {
        std::string condition = normalize_condition(args[i]);
        if (!is_trappable(condition)) {
            print_error({ErrorType::INVALID_ARGUMENT, "trap",
                         args[i] + ": invalid signal specification", {}});
            status = 1;
            continue;
        }
        if (command == "-") {
            shell->remove_trap(condition);
        } else {
            shell->set_trap(condition, command);
        }
    }
    return status;
}
