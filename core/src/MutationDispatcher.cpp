#include "openzone/MutationDispatcher.hpp"
#include <utility>

namespace openzone {

namespace {

const char *verbFor(MutationKind kind) {
    switch (kind) {
    case MutationKind::Create:
        return "created";
    case MutationKind::Update:
        return "updated";
    case MutationKind::Delete:
        return "deleted";
    }
    return "changed";
}

const char *failureTitle(MutationKind kind) {
    switch (kind) {
    case MutationKind::Create:
        return "Create failed";
    case MutationKind::Update:
        return "Update failed";
    case MutationKind::Delete:
        return "Delete failed";
    }
    return "Operation failed";
}

template <typename T> Result<Unit> dropValue(const Result<T> &r) {
    if (!r)
        return Result<Unit>::failure(r.error());
    return Result<Unit>::success({});
}

} // namespace

MutationDispatcher::MutationDispatcher(ZoneGateway &gateway,
                                       TaskRunner &runner,
                                       TreeController &controller,
                                       NotificationSink &sink)
    : gateway_(gateway), runner_(runner), controller_(controller),
      sink_(sink) {}

std::uint64_t MutationDispatcher::submit(MutationRequest request) {
    if (cancelFlag_)
        cancelFlag_->store(true);
    auto cancelFlag = std::make_shared<std::atomic<bool>>(false);
    cancelFlag_ = cancelFlag;
    const std::uint64_t generation = ++generation_;
    inFlight_ = true;

    ZoneGateway &gateway = gateway_;
    auto req = std::make_shared<const MutationRequest>(std::move(request));
    runner_.post([this, &gateway, req, cancelFlag,
                  generation](const CancelCheck &stopping)
                     -> TaskRunner::Commit {
        const CancelCheck shouldCancel = anyOf(cancelFlag, stopping);
        // Superseded before we even started: skip the round-trip.
        auto result = std::make_shared<Result<Unit>>(
            shouldCancel() ? Result<Unit>::failure(GatewayError::canceled())
                           : execute(gateway, *req, shouldCancel));
        return [this, generation, req, result]() {
            commit(generation, *req, *result);
        };
    });
    return generation;
}

Result<Unit> MutationDispatcher::execute(ZoneGateway &gateway,
                                         const MutationRequest &request,
                                         const CancelCheck &shouldCancel) {
    switch (request.kind) {
    case MutationKind::Create:
        return dropValue(gateway.createChild(request.zone_id, request.payload,
                                             shouldCancel));
    case MutationKind::Update:
        return dropValue(gateway.updateChild(request.zone_id,
                                             request.record_id.value_or(""),
                                             request.payload, shouldCancel));
    case MutationKind::Delete:
        return gateway.deleteChild(request.zone_id,
                                   request.record_id.value_or(""),
                                   shouldCancel);
    }
    return Result<Unit>::failure(
        GatewayError::remote("Unknown mutation kind"));
}

void MutationDispatcher::commit(std::uint64_t generation,
                                const MutationRequest &request,
                                const Result<Unit> &result) {
    if (generation != generation_) {
        ++discarded_;
        return;
    }
    inFlight_ = false;
    cancelFlag_.reset();

    if (!result) {
        // The tree keeps showing the state from before the call.
        sink_.notify(failureTitle(request.kind), result.error().describe(),
                     Severity::Error);
        return;
    }

    sink_.notify("Record " + std::string(verbFor(request.kind)), request.label,
                 Severity::Info);
    controller_.reloadParent(request.zone_id);
}

} // namespace openzone
