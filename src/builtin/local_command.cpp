#include "local_command.h"

#include <string>
#include <vector>

#include "builtin.h"
#include "error_out.h"
#include "function_manager.h"
#include "interpreter_utils.h"
#include "shell.h"

int local_command(const std::vector<std::string>& args, Shell* shell) {
    if (builtin_handle_help(args, {"Usage: local NAME[=VALUE] ...",
                                   "Declare variables scoped to the current function."})) {
        return 0;
    }
    if (shell == nullptr) {
        return 1;
    }

    FunctionManager& functions = shell->get_function_manager();
    if (!functions.in_function()) {
        print_error({ErrorType::SYNTAX_ERROR, "local", "can only be used in a function", {}});
        return 1;
    }

    int status = 0;
    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];
        size_t eq_pos = arg.find('=');
        std::string name = eq_pos == std::string::npos ? arg : arg.substr(0, eq_pos);
        if (!interpreter_utils::is_identifier(name)) {
            print_error({ErrorType::INVALID_ARGUMENT, "local",
                         "'" + arg + "': not a valid identifier", {}});
            status = 1;
            continue;
        }
        if (eq_pos == std::string::npos) {
            if (!functions.has_local(name)) {
                functions.set_local(name, "");
            }
        } else {
            functions.set_local(name, arg.substr(eq_pos + 1));
        }
    }
    return status;
}
