#include "signal_handler.h"

#include "utils/debug.h"

volatile sig_atomic_t SignalHandler::s_sigint_received = 0;

SignalHandler::SignalHandler() : m_old_sigint_handler(), m_old_sigpipe_handler() {
}

SignalHandler::~SignalHandler() {
    restore_original_handlers();
}

void SignalHandler::install_signal_handler(int signum, struct sigaction* old_action) {
    struct sigaction sa{};
    sa.sa_sigaction = signal_handler;
    sigfillset(&sa.sa_mask);
    sa.sa_flags = SA_SIGINFO;

    if (signum != SIGINT) {
        sa.sa_flags |= SA_RESTART;
    }

    sigaction(signum, &sa, old_action);
}

void SignalHandler::signal_handler(int signum, siginfo_t* info, void* context) {
    (void)context;
    (void)info;

    if (signum == SIGINT) {
        s_sigint_received = 1;
    }
}

void SignalHandler::setup_signal_handlers() {
    struct sigaction sa{};
    sigfillset(&sa.sa_mask);
    sa.sa_handler = SIG_IGN;
    sa.sa_flags = 0;
    sigaction(SIGPIPE, &sa, &m_old_sigpipe_handler);

    install_signal_handler(SIGINT, &m_old_sigint_handler);
    m_installed = true;
    den_debug_msg("signal handlers installed");
}

void SignalHandler::restore_original_handlers() {
    if (!m_installed) {
        return;
    }
    sigaction(SIGINT, &m_old_sigint_handler, nullptr);
    sigaction(SIGPIPE, &m_old_sigpipe_handler, nullptr);
    m_installed = false;
}

void SignalHandler::reset_child_signals() {
    struct sigaction sa{};
    sigemptyset(&sa.sa_mask);
    sa.sa_handler = SIG_DFL;
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGPIPE, &sa, nullptr);
}
