#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace keel::runtime {

// Cooperative cancellation flag. A child token observes requests made on
// any of its ancestors; a request on the child never reaches the parent or
// its siblings. Copies share state.
class CancelToken {
public:
    CancelToken();

    CancelToken child() const;

    // Returns false when this token was already requested directly.
    bool request(const std::string& reason);

    bool is_requested() const;

    // Reason of the nearest requested token on the ancestor chain, or empty.
    std::string reason() const;

private:
    struct State {
        std::atomic_bool requested{false};
        mutable std::mutex mutex;
        std::string reason;
        std::shared_ptr<const State> parent;
    };

    explicit CancelToken(std::shared_ptr<State> state);

    std::shared_ptr<State> state_;
};

}  // namespace keel::runtime
