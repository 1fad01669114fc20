// Exclusive slot for record mutations: one create/update/delete in flight at
// a time. A new submission supersedes the pending one; the superseded result
// is discarded when it arrives.
#pragma once
#include "NotificationSink.hpp"
#include "TaskRunner.hpp"
#include "TreeController.hpp"
#include "ZoneGateway.hpp"
#include <atomic>
#include <cstdint>
#include <memory>

namespace openzone {

class MutationDispatcher {
public:
    MutationDispatcher(ZoneGateway &gateway, TaskRunner &runner,
                       TreeController &controller, NotificationSink &sink);

    // Cancels whatever is pending and starts request. Returns its generation.
    std::uint64_t submit(MutationRequest request);

    bool busy() const { return inFlight_; }
    // Results dropped because a newer submission superseded them.
    int discardedCount() const { return discarded_; }

private:
    ZoneGateway &gateway_;
    TaskRunner &runner_;
    TreeController &controller_;
    NotificationSink &sink_;

    std::uint64_t generation_ = 0;
    bool inFlight_ = false;
    int discarded_ = 0;
    std::shared_ptr<std::atomic<bool>> cancelFlag_;

    static Result<Unit> execute(ZoneGateway &gateway,
                                const MutationRequest &request,
                                const CancelCheck &shouldCancel);
    void commit(std::uint64_t generation, const MutationRequest &request,
                const Result<Unit> &result);
};

} // namespace openzone
