#pragma once
#include <atomic>
#include <csignal>
#include <functional>
#include <string>
#include <thread>

namespace keel::app {

    // Blocks SIGINT/SIGTERM for every thread started afterwards and turns each
    // delivery into `on_signal`. Joins and restores the previous mask on
    // destruction; signals still pending at that point are consumed.
    class SignalWatcher {
    public:
        using Callback = std::function<void(const std::string& reason)>;

        explicit SignalWatcher(Callback on_signal);
        ~SignalWatcher();

        SignalWatcher(const SignalWatcher&) = delete;
        SignalWatcher& operator=(const SignalWatcher&) = delete;

        bool active() const { return blocked_; }

    private:
        sigset_t signals_;
        sigset_t previous_mask_;
        bool blocked_ = false;
        std::atomic_bool done_{false};
        std::thread thread_;
    };

} // namespace keel::app
