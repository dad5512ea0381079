#include "read_command.h"

#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "builtin.h"
#include "error_out.h"
#include "interpreter_utils.h"
#include "shell.h"

namespace {

struct ReadOptions {
    bool raw_mode = false;
    int nchars = -1;
    char delim = '\n';
    std::string prompt;
    std::string array_name;
    std::vector<std::string> var_names;
};

// Reads one byte at a time so nothing past the delimiter is taken from a shared stdin.
bool read_input(const ReadOptions& options, std::string& input) {
    bool got_delim = false;
    int chars_read = 0;
    char c = 0;
    while (options.nchars < 0 || chars_read < options.nchars) {
        ssize_t n = ::read(STDIN_FILENO, &c, 1);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            break;
        }
        if (c == options.delim) {
            got_delim = true;
            break;
        }
        if (!options.raw_mode && c == '\\') {
            ssize_t m = ::read(STDIN_FILENO, &c, 1);
            if (m <= 0) {
                break;
            }
            if (c == '\n') {
                continue;
            }
        }
        input += c;
        ++chars_read;
    }
    return got_delim || !input.empty() || chars_read > 0;
}

bool is_ifs_whitespace(char c, const std::string& ifs) {
    return (c == ' ' || c == '\t' || c == '\n') && ifs.find(c) != std::string::npos;
}

std::vector<std::string> split_fields(const std::string& input, const std::string& ifs,
                                      size_t max_fields) {
    std::vector<std::string> fields;
    size_t i = 0;
    while (i < input.size() && is_ifs_whitespace(input[i], ifs)) {
        ++i;
    }
    while (i < input.size()) {
        if (max_fields != 0 && fields.size() + 1 == max_fields) {
            std::string rest = input.substr(i);
            while (!rest.empty() && is_ifs_whitespace(rest.back(), ifs)) {
                rest.pop_back();
            }
            fields.push_back(rest);
            return fields;
        }
        std::string field;
        while (i < input.size() && ifs.find(input[i]) == std::string::npos) {
            field += input[i++];
        }
        fields.push_back(field);
        while (i < input.size() && is_ifs_whitespace(input[i], ifs)) {
            ++i;
        }
        if (i < input.size() && ifs.find(input[i]) != std::string::npos) {
            ++i;
            while (i < input.size() && is_ifs_whitespace(input[i], ifs)) {
                ++i;
            }
        }
    }
    return fields;
}

bool parse_options(const std::vector<std::string>& args, ReadOptions& options) {
    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg.size() < 2 || arg[0] != '-' || !options.var_names.empty()) {
            options.var_names.push_back(arg);
            continue;
        }
        if (arg == "--") {
            options.var_names.insert(options.var_names.end(),
                                     args.begin() + static_cast<std::ptrdiff_t>(i + 1), args.end());
            break;
        }
        if (arg == "-r") {
            options.raw_mode = true;
            continue;
        }

        char flag = arg[1];
        std::string value;
        if (arg.size() > 2) {
            value = arg.substr(2);
        } else if (i + 1 < args.size()) {
            value = args[++i];
        } else {
            print_error({ErrorType::INVALID_ARGUMENT, "read",
                         arg + ": option requires an argument", {}});
            return false;
        }

        switch (flag) {
            case 'p':
                options.prompt = value;
                break;
            case 'd':
                options.delim = value.empty() ? '\0' : value[0];
                break;
            case 'a':
                options.array_name = value;
                break;
            case 'n': {
                char* endptr = nullptr;
                long n = std::strtol(value.c_str(), &endptr, 10);
                if (value.empty() || *endptr != '\0' || n < 0) {
                    print_error({ErrorType::INVALID_ARGUMENT, "read",
                                 value + ": invalid number of characters", {}});
                    return false;
                }
                options.nchars = static_cast<int>(n);
                break;
            }
            default:
                print_error({ErrorType::INVALID_ARGUMENT, "read", arg + ": invalid option", {}});
                return false;
        }
    }
    return true;
}

}  // namespace

int read_command(const std::vector<std::string>& args, Shell* shell) {
    if (builtin_handle_help(args, {"Usage: read [-r] [-p PROMPT] [-d DELIM] [-n N] [-a ARRAY] "
                                   "[NAME ...]",
                                   "Read a line from standard input and split it into fields.",
                                   "The last NAME receives the remainder of the line."})) {
        return 0;
    }
    if (shell == nullptr) {
        return 1;
    }

    ReadOptions options;
    if (!parse_options(args, options)) {
        return 2;
    }
    for (const auto& name : options.var_names) {
        if (!interpreter_utils::is_identifier(name)) {
            print_error({ErrorType::INVALID_ARGUMENT, "read",
                         "'" + name + "': not a valid identifier", {}});
            return 1;
        }
    }

    if (!options.prompt.empty() && isatty(STDIN_FILENO)) {
        std::cerr << options.prompt << std::flush;
    }

    std::string input;
    bool success = read_input(options, input);

    std::string ifs = " \t\n";
    if (auto custom = shell->find_variable("IFS")) {
        ifs = *custom;
    }

    if (!options.array_name.empty()) {
        shell->set_array(options.array_name, split_fields(input, ifs, 0));
        return success ? 0 : 1;
    }

    if (options.var_names.empty()) {
        shell->set_variable("REPLY", input);
        return success ? 0 : 1;
    }

    std::vector<std::string> fields = split_fields(input, ifs, options.var_names.size());
    for (size_t i = 0; i < options.var_names.size(); ++i) {
        shell->set_variable(options.var_names[i], i < fields.size() ? fields[i] : "");
    }
    return success ? 0 : 1;
}
