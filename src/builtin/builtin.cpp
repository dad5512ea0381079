/*
  builtin.cpp

  This file is part of den, Den Shell

  MIT License

  Copyright (c) 2026 Caden Finley

  Permission is hereby granted, free of charge, to any person obtaining a copy
  of this software and associated documentation files (the "Software"), to deal
  in the Software without restriction, including without limitation the rights
  to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
  copies of the Software, and to permit persons to whom the Software is
  furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all
  copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
  IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
  FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
  AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
  LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
  OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
  SOFTWARE.
*/

#include "builtin.h"

#include <algorithm>
#include <iostream>

#include "cd_command.h"
#include "declare_command.h"
#include "echo_command.h"
#include "error_out.h"
#include "exit_command.h"
#include "export_command.h"
#include "local_command.h"
#include "loop_control_commands.h"
#include "read_command.h"
#include "set_command.h"
#include "source_command.h"
#include "test_command.h"
#include "trap_command.h"

bool builtin_handle_help(const std::vector<std::string>& args,
                         const std::vector<std::string>& help_lines) {
    if (args.size() < 2 || (args[1] != "--help" && args[1] != "-h")) {
        return false;
    }
    for (const auto& line : help_lines) {
        std::cout << line << '\n';
    }
    std::cout.flush();
    return true;
}

Built_ins::Built_ins() : shell(nullptr) {
    builtins.reserve(32);

    builtins = {
        {"echo", [](const std::vector<std::string>& args) { return ::echo_command(args); }},
        {"true", [](const std::vector<std::string>&) { return 0; }},
        {"false", [](const std::vector<std::string>&) { return 1; }},
        {":", [](const std::vector<std::string>&) { return 0; }},
        {"cd", [this](const std::vector<std::string>& args) { return ::cd_command(args, shell); }},
        {"exit",
         [this](const std::vector<std::string>& args) { return ::exit_command(args, shell); }},
        {"export",
         [this](const std::vector<std::string>& args) { return ::export_command(args, shell); }},
        {"unset",
         [this](const std::vector<std::string>& args) { return ::unset_command(args, shell); }},
        {"local",
         [this](const std::vector<std::string>& args) { return ::local_command(args, shell); }},
        {"return",
         [this](const std::vector<std::string>& args) { return ::return_command(args, shell); }},
        {"break",
         [this](const std::vector<std::string>& args) { return ::break_command(args, shell); }},
        {"continue",
         [this](const std::vector<std::string>& args) { return ::continue_command(args, shell); }},
        {"set",
         [this](const std::vector<std::string>& args) { return ::set_command(args, shell); }},
        {"shift",
         [this](const std::vector<std::string>& args) { return ::shift_command(args, shell); }},
        {"trap",
         [this](const std::vector<std::string>& args) { return ::trap_command(args, shell); }},
        {"source",
         [this](const std::vector<std::string>& args) { return ::source_command(args, shell); }},
        {".",
         [this](const std::vector<std::string>& args) { return ::source_command(args, shell); }},
        {"eval",
         [this](const std::vector<std::string>& args) { return ::eval_command(args, shell); }},
        {"declare",
         [this](const std::vector<std::string>& args) { return ::declare_command(args, shell); }},
        {"typeset",
         [this](const std::vector<std::string>& args) { return ::declare_command(args, shell); }},
        {"read",
         [this](const std::vector<std::string>& args) { return ::read_command(args, shell); }},
        {"test", [](const std::vector<std::string>& args) { return ::test_command(args); }},
        {"[", [](const std::vector<std::string>& args) { return ::test_command(args); }},
    };
}

int Built_ins::builtin_command(const std::vector<std::string>& args) {
    if (args.empty())
        return 1;

    auto it = builtins.find(args[0]);
    if (it != builtins.end()) {
        return it->second(args);
    }

    print_error({ErrorType::COMMAND_NOT_FOUND, args[0], "command not found", {}});
    return 127;
}

bool Built_ins::is_builtin_command(const std::string& cmd) const {
    if (cmd.empty()) {
        return false;
    }
    return builtins.find(cmd) != builtins.end();
}

std::vector<std::string> Built_ins::get_builtin_commands() const {
    std::vector<std::string> names;
    names.reserve(builtins.size());
    for (const auto& kv : builtins) {
        names.push_back(kv.first);
    }
    std::sort(names.begin(), names.end());
    return names;
}
