//
// Forwards a flag raised by a signal handler to ordinary code.
//

#ifndef PDFSHRINK_INTERRUPT_WATCHER_HPP
#define PDFSHRINK_INTERRUPT_WATCHER_HPP

#include <atomic>
#include <chrono>
#include <functional>
#include <stop_token>
#include <thread>
#include <utility>

/**
 * @brief Polls @p flag and runs @p on_interrupt once, on its own thread, when it is set.
 *
 * A signal handler may only store to a lock-free atomic; whatever needs
 * locks or streams happens in @p on_interrupt. Destroying or stopping the
 * returned thread ends the polling.
 */
inline std::jthread watch_interrupts(const std::atomic<bool>& flag, std::function<void()> on_interrupt,
                                     const std::chrono::milliseconds poll = std::chrono::milliseconds(50)) {
    return std::jthread([&flag, on_interrupt = std::move(on_interrupt), poll](const std::stop_token& st) {
        while (!st.stop_requested()) {
            if (flag.load()) {
                on_interrupt();
                return;
            }
            std::this_thread::sleep_for(poll);
        }
    });
}

#endif // PDFSHRINK_INTERRUPT_WATCHER_HPP
