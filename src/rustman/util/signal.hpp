#pragma once

#include <atomic>
#include <csignal>
#include <stdexcept>

namespace rustman {

class user_cancelled : public std::exception {};

/**
 * @brief A one-way flag recording that the user asked the program to stop.
 *
 * Created once by the entry point and handed by reference to the signal handlers and to
 * anything that blocks on user input. Once set it is never cleared.
 */
class cancellation_flag {
    std::atomic<int> _signal{0};

    static_assert(std::atomic<int>::is_always_lock_free);

public:
    /// Set the flag. Safe to call from a signal handler.
    void notify(int sig = SIGINT) noexcept { _signal.store(sig, std::memory_order_relaxed); }

    [[nodiscard]] bool is_cancelled() const noexcept {
        return _signal.load(std::memory_order_relaxed) != 0;
    }

    /// The signal number that triggered cancellation, or zero
    [[nodiscard]] int signal_number() const noexcept {
        return _signal.load(std::memory_order_relaxed);
    }

    /// Throw user_cancelled if the flag has been set
    void cancellation_point() const {
        if (is_cancelled()) {
            throw user_cancelled();
        }
    }
};

/**
 * @brief Route SIGINT, SIGTERM, and SIGQUIT into the given flag.
 *
 * The flag must outlive the process's use of the handlers. The handlers are installed without
 * SA_RESTART, so a blocking read or poll is interrupted when a signal arrives.
 */
void install_signal_handlers(cancellation_flag& flag) noexcept;

}  // namespace rustman
