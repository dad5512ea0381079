#include "den.h"

#include <cstdlib>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

#include "error_out.h"
#include "flags.h"
#include "function_manager.h"
#include "script_manager.h"
#include "shell.h"
#include "signal_handler.h"
#include "usage.h"
#include "utils/debug.h"

namespace {

void apply_config(Shell& shell) {
    shell.set_errexit(config::errexit);
    shell.set_noexec(config::noexec);
    shell.get_script_manager().set_cache_enabled(config::script_cache_enabled);
    shell.get_script_manager().set_cache_capacity(config::script_cache_capacity);
    shell.get_function_manager().set_max_call_depth(config::max_call_depth);
}

int run_stdin(Shell& shell) {
    std::string content((std::istreambuf_iterator<char>(std::cin)),
                        std::istreambuf_iterator<char>());
    if (std::cin.bad()) {
        print_error({ErrorType::RUNTIME_ERROR, "den", "failed to read standard input", {}});
        return 1;
    }
    return shell.execute(content, "den");
}

}  // namespace

int main(int argc, char* argv[]) {
    // parse passed flags
    auto parse_result = flags::parse_arguments(argc, argv);
    if (parse_result.should_exit) {
        return parse_result.exit_code;
    }

    // handle simple flags
    if (config::show_version) {
        print_version();
        return 0;
    }
    if (config::show_help) {
        print_usage();
        return 0;
    }

    SignalHandler signal_handler;
    signal_handler.setup_signal_handlers();

    InterpreterLimits limits;
    limits.max_call_depth = config::max_call_depth;
    limits.script_cache_capacity = config::script_cache_capacity;
    auto shell = std::make_unique<Shell>(limits);
    apply_config(*shell);

    int code = 0;
    if (config::execute_command) {
        // operands after -c become $0 and the positionals
        if (!parse_result.script_file.empty()) {
            shell->set_script_name(parse_result.script_file);
        }
        shell->set_positional_parameters(parse_result.script_args);
        code = shell->execute(config::cmd_to_execute, shell->get_script_name());
    } else if (!parse_result.script_file.empty()) {
        PerformanceTracker tracker("den script");
        code = shell->execute_script_file(parse_result.script_file, parse_result.script_args)
                   .exit_code;
    } else {
        code = run_stdin(*shell);
    }

    if (SignalHandler::interrupt_pending()) {
        if (!shell->exit_requested()) {
            code = 130;
        }
        SignalHandler::clear_interrupt();
    }

    shell->set_last_exit_code(code);
    shell->run_trap("EXIT");
    if (shell->exit_requested()) {
        code = shell->get_exit_code();
    }

    den_debug_msg("den exiting with status %d", code);
    std::cout.flush();
    shell.reset();
    signal_handler.restore_original_handlers();
    return code;
}
