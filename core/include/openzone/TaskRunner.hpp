// Suspension point used by the controller and dispatcher: a job does the
// blocking gateway round-trip away from the UI thread and returns the commit
// step that must run back on the UI thread.
#pragma once
#include "ZoneTypes.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <utility>

namespace openzone {

class TaskRunner {
public:
    using Commit = std::function<void()>;
    // stopping turns true once the runner is shutting down; jobs pass it on
    // to the gateway so blocking calls return early.
    using Job = std::function<Commit(const CancelCheck &stopping)>;

    virtual ~TaskRunner() = default;

    // The commit returned by job (if any) runs exactly once, on the thread
    // that owns the tree state, unless the runner stopped first.
    virtual void post(Job job) = 0;
};

// Cancel check that fires when either input fires.
inline CancelCheck anyOf(std::shared_ptr<std::atomic<bool>> flag,
                         CancelCheck other) {
    return [flag = std::move(flag), other = std::move(other)] {
        return (flag && flag->load()) || (other && other());
    };
}

} // namespace openzone
