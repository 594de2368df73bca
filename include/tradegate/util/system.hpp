#pragma once

/**
 * Process-level helpers: graceful shutdown on SIGINT/SIGTERM.
 *
 * The handler only flips an atomic flag and records the signal number; the
 * Runner checks the flag between cycles, so a stop never interrupts an order
 * placement or a store write.
 */

#include <atomic>
#include <csignal>

namespace tradegate {
namespace util {

namespace detail {
inline std::atomic<bool>* g_running_flag = nullptr;
inline void (*g_pre_shutdown_callback)() = nullptr;
inline volatile std::sig_atomic_t g_last_signal = 0;
} // namespace detail

inline void graceful_shutdown_handler(int sig) {
    detail::g_last_signal = sig;
    if (detail::g_pre_shutdown_callback) {
        detail::g_pre_shutdown_callback();
    }
    if (detail::g_running_flag) {
        detail::g_running_flag->store(false);
    }
}

/**
 * Install the shutdown handler for SIGINT and SIGTERM.
 *
 * @param running Flag set to false when a signal arrives
 * @param pre_shutdown Optional callback run first (must be signal-safe)
 */
inline void install_shutdown_handler(std::atomic<bool>& running, void (*pre_shutdown)() = nullptr) {
    detail::g_running_flag = &running;
    detail::g_pre_shutdown_callback = pre_shutdown;
    detail::g_last_signal = 0;
    std::signal(SIGINT, graceful_shutdown_handler);
    std::signal(SIGTERM, graceful_shutdown_handler);
}

// Signal that triggered shutdown, 0 if none
inline int last_shutdown_signal() {
    return static_cast<int>(detail::g_last_signal);
}

}  // namespace util
}  // namespace tradegate
