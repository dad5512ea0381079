#pragma once

#include <signal.h>

// SIGINT only raises a flag; the interpreter checks it between lines and loop iterations and
// unwinds with status 130.
class SignalHandler {
   public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    void setup_signal_handlers();
    void restore_original_handlers();

    // Called in forked children before they exec or run shell code.
    static void reset_child_signals();

    static bool interrupt_pending() {
        return s_sigint_received != 0;
    }
    static void clear_interrupt() {
        s_sigint_received = 0;
    }

   private:
    static void signal_handler(int signum, siginfo_t* info, void* context);
    static void install_signal_handler(int signum, struct sigaction* old_action);

    static volatile sig_atomic_t s_sigint_received;

    struct sigaction m_old_sigint_handler;
    struct sigaction m_old_sigpipe_handler;
    bool m_installed = false;
};
