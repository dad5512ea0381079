#include "declare_command.h"

#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "builtin.h"
#include "error_out.h"
#include "function_manager.h"
#include "interpreter_utils.h"
#include "shell.h"

namespace {

struct DeclareFlags {
    bool indexed = false;
    bool associative = false;
    bool functions = false;
    bool function_names = false;
    bool exported = false;
    bool global = false;
    bool print = false;
};

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

void print_declaration(Shell* shell, const std::string& name) {
    if (const auto* values = shell->find_array(name)) {
        std::cout << "declare -a " << name << "=(";
        for (size_t i = 0; i < values->size(); ++i) {
            std::cout << (i > 0 ? " " : "") << "[" << i << "]=" << quote_value((*values)[i]);
        }
        std::cout << ")\n";
        return;
    }
    if (const auto* entries = shell->find_assoc_array(name)) {
        std::cout << "declare -A " << name << "=(";
        bool first = true;
        for (const auto& entry : *entries) {
            std::cout << (first ? "" : " ") << "[" << entry.first
                      << "]=" << quote_value(entry.second);
            first = false;
        }
        std::cout << ")\n";
        return;
    }
    if (auto value = shell->find_variable(name)) {
        std::cout << "declare " << (shell->is_exported(name) ? "-x " : "-- ") << name << "="
                  << quote_value(*value) << '\n';
    }
}

bool parse_flags(const std::string& arg, DeclareFlags& flags) {
    for (size_t i = 1; i < arg.size(); ++i) {
        switch (arg[i]) {
            case 'a':
                flags.indexed = true;
                break;
            case 'A':
                flags.associative = true;
                break;
            case 'f':
                flags.functions = true;
                break;
            case 'F':
                flags.function_names = true;
                break;
            case 'x':
                flags.exported = true;
                break;
            case 'g':
                flags.global = true;
                break;
            case 'p':
                flags.print = true;
                break;
            default:
                print_error({ErrorType::INVALID_ARGUMENT, "declare",
                             std::string("-") + arg[i] + ": invalid option", {}});
                return false;
        }
    }
    return true;
}

}  // namespace

int declare_command(const std::vector<std::string>& args, Shell* shell) {
    if (builtin_handle_help(args, {"Usage: declare [-aAfFgpx] [NAME[=VALUE] ...]",
                                   "Declare variables and give them attributes.",
                                   "  -a  indexed array      -A  associative array",
                                   "  -f  list functions     -F  list function names",
                                   "  -g  global scope       -x  export",
                                   "  -p  print declarations"})) {
        return 0;
    }
    if (shell == nullptr) {
        return 1;
    }

    DeclareFlags flags;
    size_t i = 1;
    for (; i < args.size() && args[i].size() > 1 && args[i][0] == '-'; ++i) {
        if (args[i] == "--") {
            ++i;
            break;
        }
        if (!parse_flags(args[i], flags)) {
            return 2;
        }
    }

    FunctionManager& functions = shell->get_function_manager();
    if (flags.functions || flags.function_names) {
        if (i >= args.size()) {
            for (const auto& name : functions.list_functions()) {
                std::cout << "declare -f " << name << '\n';
            }
            std::cout.flush();
            return 0;
        }
        int status = 0;
        for (; i < args.size(); ++i) {
            if (functions.has_function(args[i])) {
                std::cout << "declare -f " << args[i] << '\n';
            } else {
                status = 1;
            }
        }
        std::cout.flush();
        return status;
    }

    if (i >= args.size()) {
        for (const auto& entry : shell->list_variables()) {
            print_declaration(shell, entry.first);
        }
        std::cout.flush();
        return 0;
    }

    int status = 0;
    for (; i < args.size(); ++i) {
        const std::string& arg = args[i];
        size_t eq_pos = arg.find('=');
        std::string name = eq_pos == std::string::npos ? arg : arg.substr(0, eq_pos);
        if (!interpreter_utils::is_identifier(name)) {
            print_error({ErrorType::INVALID_ARGUMENT, "declare",
                         "'" + arg + "': not a valid identifier", {}});
            status = 1;
            continue;
        }

        if (flags.print) {
            if (!shell->find_variable(name) && !shell->find_array(name) &&
                !shell->find_assoc_array(name)) {
                print_error({ErrorType::INVALID_ARGUMENT, "declare", name + ": not found", {}});
                status = 1;
            } else {
                print_declaration(shell, name);
            }
            continue;
        }

        if (flags.associative) {
            if (shell->find_array(name) != nullptr) {
                print_error({ErrorType::INVALID_ARGUMENT, "declare",
                             name + ": cannot convert indexed to associative array", {}});
                status = 1;
                continue;
            }
            shell->declare_assoc_array(name);
        } else if (flags.indexed) {
            if (shell->find_array(name) == nullptr && shell->find_assoc_array(name) == nullptr) {
                std::vector<std::string> values;
                if (auto existing = shell->find_variable(name)) {
                    values.push_back(*existing);
                }
                shell->set_array(name, std::move(values));
            }
            if (eq_pos != std::string::npos) {
                shell->set_array_element(name, 0, arg.substr(eq_pos + 1));
            }
        } else if (functions.in_function() && !flags.global) {
            if (eq_pos != std::string::npos) {
                functions.set_local(name, arg.substr(eq_pos + 1));
            } else if (!functions.has_local(name)) {
                functions.set_local(name, "");
            }
        } else if (eq_pos != std::string::npos) {
            shell->set_variable(name, arg.substr(eq_pos + 1));
        } else if (!shell->find_variable(name) && shell->find_array(name) == nullptr &&
                   shell->find_assoc_array(name) == nullptr) {
            shell->set_variable(name, "");
        }

        if (flags.exported) {
            shell->export_variable(name);
        }
    }
    std::cout.flush();
    return status;
}
