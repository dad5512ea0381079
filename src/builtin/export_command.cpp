#include "export_command.h"

#include <iostream>
#include <string>
#include <vector>

#include "builtin.h"
#include "error_out.h"
#include "function_manager.h"
#include "interpreter_utils.h"
#include "shell.h"

namespace {

std::string quote_value(const std::string& value) {
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"' || c == '\\' || c == '$' || c == '`') {
            quoted += '\\';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

void print_exports(Shell* shell) {
    for (const auto& entry : shell->list_variables()) {
        if (shell->is_exported(entry.first)) {
            std::cout << "export " << entry.first << "=" << quote_value(entry.second) << '\n';
        }
    }
    std::cout.flush();
}

}  // namespace

int export_command(const std::vector<std::string>& args, Shell* shell) {
    if (builtin_handle_help(args, {"Usage: export [-p] [-f] NAME[=VALUE] ...",
                                   "Mark variables for export to child processes.",
                                   "With -f, NAME refers to a function."})) {
        return 0;
    }
    if (shell == nullptr) {
        return 1;
    }

    bool functions_mode = false;
    size_t i = 1;
    for (; i < args.size() && args[i].size() > 1 && args[i][0] == '-'; ++i) {
        if (args[i] == "--") {
            ++i;
            break;
        }
        if (args[i] == "-f") {
            functions_mode = true;
        } else if (args[i] != "-p") {
            print_error({ErrorType::INVALID_ARGUMENT, "export", args[i] + ": invalid option", {}});
            return 2;
        }
    }

    if (i >= args.size()) {
        print_exports(shell);
        return 0;
    }

    int status = 0;
    for (; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (functions_mode) {
            if (!shell->get_function_manager().mark_exported(arg)) {
                print_error({ErrorType::INVALID_ARGUMENT, "export", arg + ": not a function", {}});
                status = 1;
            }
            continue;
        }

        size_t eq_pos = arg.find('=');
        std::string name = eq_pos == std::string::npos ? arg : arg.substr(0, eq_pos);
        if (!interpreter_utils::is_identifier(name)) {
            print_error({ErrorType::INVALID_ARGUMENT, "export",
                         "'" + arg + "': not a valid identifier", {}});
            status = 1;
            continue;
        }
        if (eq_pos != std::string::npos) {
            shell->set_variable(name, arg.substr(eq_pos + 1));
        }
        shell->export_variable(name);
    }
    return status;
}

int unset_command(const std::vector<std::string>& args, Shell* shell) {
    if (builtin_handle_help(args, {"Usage: unset [-v] [-f] NAME ...",
                                   "Remove variables, array elements or functions."})) {
        return 0;
    }
    if (shell == nullptr) {
        return 1;
    }

    bool functions_mode = false;
    size_t i = 1;
    for (; i < args.size() && args[i].size() > 1 && args[i][0] == '-'; ++i) {
        if (args[i] == "--") {
            ++i;
            break;
        }
        if (args[i] == "-f") {
            functions_mode = true;
        } else if (args[i] == "-v") {
            functions_mode = false;
        } else {
            print_error({ErrorType::INVALID_ARGUMENT, "unset", args[i] + ": invalid option", {}});
            return 2;
        }
    }

    int status = 0;
    for (; i < args.size(); ++i) {
        const std::string& name = args[i];
        if (functions_mode) {
            shell->get_function_manager().remove_function(name);
            continue;
        }

        size_t bracket = name.find('[');
        if (bracket != std::string::npos && bracket > 0 && name.back() == ']') {
            std::string base = name.substr(0, bracket);
            std::string key = name.substr(bracket + 1, name.size() - bracket - 2);
            shell->unset_array_element(base, key);
            continue;
        }
        if (!interpreter_utils::is_identifier(name)) {
            print_error({ErrorType::INVALID_ARGUMENT, "unset",
                         "'" + name + "': not a valid identifier", {}});
            status = 1;
            continue;
        }
        shell->unset_variable(name);
    }
    return status;
}
