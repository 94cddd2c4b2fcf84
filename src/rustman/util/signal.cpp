#include "./signal.hpp"

#include <signal.h>

namespace {

std::atomic<rustman::cancellation_flag*> installed_flag{nullptr};

void handle_signal(int sig) {
    auto flag = installed_flag.load(std::memory_order_relaxed);
    if (flag) {
        flag->notify(sig);
    }
}

void set_handler(int sig) noexcept {
    struct sigaction action {};
    action.sa_handler = handle_signal;
    ::sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    ::sigaction(sig, &action, nullptr);
}

}  // namespace

void rustman::install_signal_handlers(cancellation_flag& flag) noexcept {
    installed_flag.store(&flag, std::memory_order_relaxed);
    set_handler(SIGINT);
    set_handler(SIGTERM);

#ifdef SIGQUIT
    // Some systems issue SIGQUIT :shrug:
    set_handler(SIGQUIT);
#endif
}
