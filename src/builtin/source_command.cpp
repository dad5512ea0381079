#include "source_command.h"

#include <string>
#include <vector>

#include "builtin.h"
#include "error_out.h"
#include "script_manager.h"
#include "shell.h"

int source_command(const std::vector<std::string>& args, Shell* shell) {
    if (builtin_handle_help(args,
                            {"Usage: source FILE [ARG ...]",
                             "Execute commands from FILE in the current shell environment.",
                             "When ARGs are given they replace the positional parameters while "
                             "FILE runs."})) {
        return 0;
    }
    if (args.size() < 2) {
        print_error({ErrorType::INVALID_ARGUMENT, args[0], "filename argument required", {}});
        return 2;
    }
    if (shell == nullptr) {
        print_error({ErrorType::RUNTIME_ERROR, args[0], "shell not initialized", {}});
        return 1;
    }

    std::vector<std::string> script_args(args.begin() + 2, args.end());
    ScriptResult result = shell->get_script_manager().source_script(args[1], script_args);
    return result.exit_code;
}

int eval_command(const std::vector<std::string>& args, Shell* shell) {
    if (builtin_handle_help(
            args, {"Usage: eval STRING", "Evaluate STRING in the current shell context."})) {
        return 0;
    }
    if (args.size() < 2) {
        return 0;
    }
    if (shell == nullptr) {
        print_error({ErrorType::RUNTIME_ERROR, "eval", "shell not initialized", {}});
        return 1;
    }

    std::string command_to_eval;
    for (size_t i = 1; i < args.size(); ++i) {
        if (i > 1) {
            command_to_eval += " ";
        }
        command_to_eval += args[i];
    }
    return shell->execute(command_to_eval, "eval");
}
