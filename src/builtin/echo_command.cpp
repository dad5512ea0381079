#include "echo_command.h"

#include <cctype>
#include <iostream>
#include <string>

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

// Expands backslash escapes. Returns false when `\c` asked for output to stop.
bool process_escape_sequences(const std::string& input, std::string& result) {
    for (size_t i = 0; i < input.length(); ++i) {
        if (input[i] != '\\' || i + 1 >= input.length()) {
            result += input[i];
            continue;
        }
        char next = input[++i];
        switch (next) {
            case 'a':
                result += '\a';
                break;
            case 'b':
                result += '\b';
                break;
            case 'c':
                return false;
            case 'e':
                result += '\x1b';
                break;
            case 'f':
                result += '\f';
                break;
            case 'n':
                result += '\n';
                break;
            case 'r':
                result += '\r';
                break;
            case 't':
                result += '\t';
                break;
            case 'v':
                result += '\v';
                break;
            case '\\':
                result += '\\';
                break;
            case '0': {
                int value = 0;
                size_t digits = 0;
                while (digits < 3 && i + 1 < input.length() && input[i + 1] >= '0' &&
                       input[i + 1] <= '7') {
                    value = value * 8 + (input[++i] - '0');
                    ++digits;
                }
                result += static_cast<char>(value);
                break;
            }
            case 'x': {
                int value = 0;
                size_t digits = 0;
                while (digits < 2 && i + 1 < input.length() && hex_value(input[i + 1]) >= 0) {
                    value = value * 16 + hex_value(input[++i]);
                    ++digits;
                }
                if (digits == 0) {
                    result += "\\x";
                } else {
                    result += static_cast<char>(value);
                }
                break;
            }
            default:
                result += '\\';
                result += next;
                break;
        }
    }
    return true;
}

bool is_option_cluster(const std::string& arg) {
    if (arg.size() < 2 || arg[0] != '-') {
        return false;
    }
    for (size_t i = 1; i < arg.size(); ++i) {
        if (arg[i] != 'n' && arg[i] != 'e' && arg[i] != 'E') {
            return false;
        }
    }
    return true;
}

}  // namespace

int echo_command(const std::vector<std::string>& args) {
    bool suppress_newline = false;
    bool interpret_escapes = false;

    size_t start_idx = 1;
    while (start_idx < args.size() && is_option_cluster(args[start_idx])) {
        for (size_t i = 1; i < args[start_idx].size(); ++i) {
            char flag = args[start_idx][i];
            if (flag == 'n') {
                suppress_newline = true;
            } else {
                interpret_escapes = flag == 'e';
            }
        }
        ++start_idx;
    }

    std::string output;
    bool keep_going = true;
    for (size_t i = start_idx; i < args.size() && keep_going; ++i) {
        if (i > start_idx) {
            output += ' ';
        }
        if (interpret_escapes) {
            keep_going = process_escape_sequences(args[i], output);
        } else {
            output += args[i];
        }
    }
    if (!suppress_newline && keep_going) {
        output += '\n';
    }

    std::cout << output;
    std::cout.flush();
    return std::cout.good() ? 0 : 1;
}
