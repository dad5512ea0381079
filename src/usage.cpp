#include "usage.h"

#include <iostream>

#include "den.h"

void print_version() {
    std::cout << "den version " << get_version() << '\n';
}

void print_usage() {
    std::cout << "Usage: den [options] [script_file [args...]]\n"
              << "       den -c command_string [name [args...]]\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help                 Display this help message and exit\n"
              << "  -v, --version              Print version information and exit\n"
              << "  -c, --command=COMMAND      Execute the specified command and exit\n"
              << "  -e, --errexit              Exit as soon as a command fails\n"
              << "  -n, --noexec               Read and validate commands without running them\n"
              << "\n"
              << "Interpreter Options:\n"
              << "  --no-script-cache          Always read scripts from disk\n"
              << "  --script-cache-size=N      Keep at most N parsed scripts cached\n"
              << "  --max-call-depth=N         Limit nested function calls to N (1-64)\n"
              << "\n"
              << "With no script and no -c, commands are read from standard input.\n"
              << "\n"
              << "Examples:\n"
              << "  den script.sh arg1 arg2    Run script with arguments\n"
              << "  den -c 'echo hello'        Execute command and exit\n"
              << "  den -n script.sh           Check a script without running it\n";
    std::cout.flush();
}
