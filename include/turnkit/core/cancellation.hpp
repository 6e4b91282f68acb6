#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

namespace turnkit::core {

class CancellationSource;

// Read side of a cancellation flag; cheap to copy
class CancellationToken {
public:
    CancellationToken() = default;

    bool is_cancelled() const { return state_ && state_->cancelled.load(); }
    bool can_be_cancelled() const { return state_ != nullptr; }

    // A token that never fires
    static CancellationToken none() { return CancellationToken{}; }

private:
    friend class CancellationSource;

    struct State {
        std::atomic<bool> cancelled{false};
        std::mutex mutex;
        std::vector<std::weak_ptr<State>> children;
    };

    explicit CancellationToken(std::shared_ptr<State> state) : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

// Write side; cancelling propagates to linked child sources
class CancellationSource {
public:
    CancellationSource() : state_(std::make_shared<CancellationToken::State>()) {}

    // Child that fires when either this source or the parent token fires
    static CancellationSource linked_to(const CancellationToken& parent) {
        CancellationSource child;
        if (parent.state_) {
            std::lock_guard<std::mutex> lock(parent.state_->mutex);
            if (parent.state_->cancelled.load()) {
                child.state_->cancelled.store(true);
            } else {
                auto& children = parent.state_->children;
                std::erase_if(children, [](const auto& weak) { return weak.expired(); });
                children.push_back(child.state_);
            }
        }
        return child;
    }

    CancellationToken token() const { return CancellationToken{state_}; }

    void cancel() { cancel_state(state_); }

    bool is_cancelled() const { return state_->cancelled.load(); }

    // Links held for child sources; released ones are dropped on the next link
    size_t linked_children() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->children.size();
    }

private:
    static void cancel_state(const std::shared_ptr<CancellationToken::State>& state) {
        std::vector<std::weak_ptr<CancellationToken::State>> children;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->cancelled.exchange(true)) {
                return;
            }
            children.swap(state->children);
        }
        for (auto& weak : children) {
            if (auto child = weak.lock()) {
                cancel_state(child);
            }
        }
    }

    std::shared_ptr<CancellationToken::State> state_;
};

}  // namespace turnkit::core
