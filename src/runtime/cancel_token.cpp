#include "runtime/cancel_token.hpp"

#include <utility>

namespace keel::runtime {

CancelToken::CancelToken() : state_(std::make_shared<State>()) {}

CancelToken::CancelToken(std::shared_ptr<State> state) : state_(std::move(state)) {}

CancelToken CancelToken::child() const {
    auto child_state = std::make_shared<State>();
    child_state->parent = state_;
    return CancelToken(std::move(child_state));
}

bool CancelToken::request(const std::string& reason) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->requested.load()) {
        return false;
    }
    state_->reason = reason;
    state_->requested.store(true);
    return true;
}

bool CancelToken::is_requested() const {
    for (const State* state = state_.get(); state != nullptr;
         state = state->parent.get()) {
        if (state->requested.load()) {
            return true;
        }
    }
    return false;
}

std::string CancelToken::reason() const {
    for (const State* state = state_.get(); state != nullptr;
         state = state->parent.get()) {
        if (state->requested.load()) {
            std::lock_guard<std::mutex> lock(state->mutex);
            return state->reason;
        }
    }
    return "";
}

}  // namespace keel::runtime
