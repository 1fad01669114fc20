#pragma once
#include "ZoneGateway.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace openzone {

// In-memory gateway used by tests and by --mock mode.
class MockZoneGateway : public ZoneGateway {
public:
    enum class Op { ListParents, ListChildren, Create, Update, Delete };

    // Starts with a small demo data set.
    MockZoneGateway();

    Result<Unit> verifyCredential() override;
    Result<std::vector<Zone>>
    listParents(const CancelCheck &shouldCancel = {}) override;
    Result<std::vector<Record>>
    listChildren(const std::string &zoneId,
                 const CancelCheck &shouldCancel = {}) override;
    Result<Record> createChild(const std::string &zoneId,
                               const MutationPayload &payload,
                               const CancelCheck &shouldCancel = {}) override;
    Result<Record> updateChild(const std::string &zoneId,
                               const std::string &recordId,
                               const MutationPayload &payload,
                               const CancelCheck &shouldCancel = {}) override;
    Result<Unit> deleteChild(const std::string &zoneId,
                             const std::string &recordId,
                             const CancelCheck &shouldCancel = {}) override;

    // Test helpers
    void clear();
    void addZone(const Zone &z);
    void addRecord(const Record &r);
    // Next call of the given operation fails with err (one shot).
    void failNext(Op op, GatewayError err);
    int callCount(Op op) const;
    // Calls that found their cancel check already raised.
    int canceledCount(Op op) const;
    // Payload of the last create/update that reached the data set.
    std::optional<MutationPayload> lastPayload() const;
    std::vector<Record> records(const std::string &zoneId) const;

private:
    mutable std::mutex mtx_;
    std::vector<Zone> zones_;
    // zone id -> records, in insertion order
    std::map<std::string, std::vector<Record>> records_;
    std::map<Op, GatewayError> failures_;
    std::map<Op, int> calls_;
    std::map<Op, int> canceled_;
    std::optional<MutationPayload> lastPayload_;
    unsigned long long nextId_ = 1;

    // Caller must hold mtx_.
    bool cancelRequested(Op op, const CancelCheck &shouldCancel);
    std::optional<GatewayError> takeFailure(Op op);
    const Zone *zoneById(const std::string &zoneId) const;
    Record apply(const Zone &zone, Record rec,
                 const MutationPayload &payload) const;
};

} // namespace openzone
