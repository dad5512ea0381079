#include "cd_command.h"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iostream>

#include "builtin.h"
#include "error_out.h"
#include "shell.h"

namespace {

std::string current_working_directory() {
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    return ec ? std::string() : cwd.string();
}

}  // namespace

int cd_command(const std::vector<std::string>& args, Shell* shell) {
    if (builtin_handle_help(args, {"Usage: cd [DIR]", "Change the current directory.",
                                   "With no DIR, changes to $HOME. 'cd -' returns to $OLDPWD."})) {
        return 0;
    }
    if (args.size() > 2) {
        print_error({ErrorType::INVALID_ARGUMENT, "cd", "too many arguments", {}});
        return 1;
    }

    std::string target_dir = args.size() > 1 ? args[1] : "";
    bool print_target = false;

    if (target_dir.empty()) {
        std::string home = shell != nullptr ? shell->get_variable("HOME") : "";
        if (home.empty()) {
            print_error({ErrorType::RUNTIME_ERROR, "cd", "HOME not set", {}});
            return 1;
        }
        target_dir = home;
    } else if (target_dir == "-") {
        std::string previous = shell != nullptr ? shell->get_variable("OLDPWD") : "";
        if (previous.empty()) {
            print_error({ErrorType::RUNTIME_ERROR, "cd", "OLDPWD not set", {}});
            return 1;
        }
        target_dir = previous;
        print_target = true;
    }

    std::error_code ec;
    std::filesystem::path dir_path(target_dir);
    if (!std::filesystem::exists(dir_path, ec)) {
        print_error(
            {ErrorType::FILE_NOT_FOUND, "cd", target_dir + ": no such file or directory", {}});
        return 1;
    }
    if (!std::filesystem::is_directory(dir_path, ec)) {
        print_error({ErrorType::INVALID_ARGUMENT, "cd", target_dir + ": not a directory", {}});
        return 1;
    }

    std::string old_directory = current_working_directory();
    if (chdir(target_dir.c_str()) != 0) {
        int saved_errno = errno;
        ErrorType type = saved_errno == EACCES ? ErrorType::PERMISSION_DENIED
                                               : ErrorType::RUNTIME_ERROR;
        print_error({type, "cd", target_dir + ": " + std::strerror(saved_errno), {}});
        return 1;
    }

    std::string new_directory = current_working_directory();
    if (shell != nullptr) {
        shell->set_variable("OLDPWD", old_directory);
        shell->set_variable("PWD", new_directory);
        shell->export_variable("OLDPWD");
        shell->export_variable("PWD");
    }
    if (print_target) {
        std::cout << new_directory << '\n';
        std::cout.flush();
    }
    return 0;
}
