#include "signal_watcher.hpp"
#include <ctime>
#include <pthread.h>
#include <utility>
#include "core/logging/logger.hpp"

namespace keel::app {

    SignalWatcher::SignalWatcher(Callback on_signal) {
        sigemptyset(&signals_);
        sigaddset(&signals_, SIGINT);
        sigaddset(&signals_, SIGTERM);
        const int rc = pthread_sigmask(SIG_BLOCK, &signals_, &previous_mask_);
        if (rc != 0) {
            KEEL_LOG_WARN("Signal watcher disabled: pthread_sigmask failed (" +
                          std::to_string(rc) + ")");
            return;
        }
        blocked_ = true;
        thread_ = std::thread([this, on_signal = std::move(on_signal)]() {
            const timespec interval{0, 200 * 1000 * 1000};
            while (!done_.load()) {
                const int sig = sigtimedwait(&signals_, nullptr, &interval);
                if ((sig == SIGINT || sig == SIGTERM) && on_signal) {
                    on_signal(sig == SIGINT ? "interrupted (SIGINT)" : "terminated (SIGTERM)");
                }
            }
        });
    }

    SignalWatcher::~SignalWatcher() {
        done_.store(true);
        if (thread_.joinable()) {
            thread_.join();
        }
        if (!blocked_) {
            return;
        }

        const timespec no_wait{0, 0};
        while (sigtimedwait(&signals_, nullptr, &no_wait) > 0) {
            KEEL_LOG_DEBUG("Signal watcher: dropped a signal that arrived after the run");
        }
        const int rc = pthread_sigmask(SIG_SETMASK, &previous_mask_, nullptr);
        if (rc != 0) {
            KEEL_LOG_WARN("Signal watcher: failed to restore signal mask (" +
                          std::to_string(rc) + ")");
        }
    }

} // namespace keel::app
