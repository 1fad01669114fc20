// One-shot resumable interaction: a dialog holds the handle and resumes the
// suspended caller exactly once, either with a value or with cancellation.
#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <utility>

namespace openzone {

template <typename T> class Interaction {
public:
    using Continuation = std::function<void(std::optional<T>)>;

    explicit Interaction(Continuation k)
        : state_(std::make_shared<State>()) {
        state_->k = std::move(k);
    }

    // Returns false if the interaction was already resumed.
    bool resume(T value) { return finish(std::optional<T>(std::move(value))); }
    bool cancel() { return finish(std::nullopt); }

    bool resumed() const { return state_->done; }

private:
    struct State {
        Continuation k;
        bool done = false;
    };
    // Shared so copies handed to dialogs all see the same resumption.
    std::shared_ptr<State> state_;

    bool finish(std::optional<T> outcome) {
        if (state_->done)
            return false;
        state_->done = true;
        // Drop the continuation before invoking so captured state is
        // released even if it triggers another interaction.
        Continuation k = std::move(state_->k);
        state_->k = nullptr;
        if (k)
            k(std::move(outcome));
        return true;
    }
};

} // namespace openzone
