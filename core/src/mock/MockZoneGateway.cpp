#include "openzone/MockZoneGateway.hpp"
#include <algorithm>

namespace openzone {

namespace {

bool endsWith(const std::string &s, const std::string &suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

MockZoneGateway::MockZoneGateway() {
    addZone({"zone-1", "example.com", "active"});
    addZone({"zone-2", "example.org", "active"});
    addZone({"zone-3", "staging.test", "pending"});
    addRecord({"rec-a", "zone-1", "example.com", "A", "192.0.2.10", 1, true});
    addRecord({"rec-b", "zone-1", "www.example.com", "CNAME", "example.com",
               1, true});
    addRecord({"rec-c", "zone-1", "example.com", "MX", "mail.example.com",
               3600, false});
    addRecord({"rec-d", "zone-2", "example.org", "TXT",
               "v=spf1 -all", 300, false});
}

Result<Unit> MockZoneGateway::verifyCredential() {
    return Result<Unit>::success({});
}

Result<std::vector<Zone>>
MockZoneGateway::listParents(const CancelCheck &shouldCancel) {
    std::lock_guard<std::mutex> lk(mtx_);
    ++calls_[Op::ListParents];
    if (cancelRequested(Op::ListParents, shouldCancel))
        return Result<std::vector<Zone>>::failure(GatewayError::canceled());
    if (auto err = takeFailure(Op::ListParents))
        return Result<std::vector<Zone>>::failure(*err);
    std::vector<Zone> out = zones_;
    std::sort(out.begin(), out.end(),
              [](const Zone &a, const Zone &b) { return a.name < b.name; });
    return Result<std::vector<Zone>>::success(std::move(out));
}

Result<std::vector<Record>>
MockZoneGateway::listChildren(const std::string &zoneId,
                              const CancelCheck &shouldCancel) {
    std::lock_guard<std::mutex> lk(mtx_);
    ++calls_[Op::ListChildren];
    if (cancelRequested(Op::ListChildren, shouldCancel))
        return Result<std::vector<Record>>::failure(GatewayError::canceled());
    if (auto err = takeFailure(Op::ListChildren))
        return Result<std::vector<Record>>::failure(*err);
    if (!zoneById(zoneId)) {
        return Result<std::vector<Record>>::failure(
            GatewayError::remote("Zone not found: " + zoneId, 404));
    }
    auto it = records_.find(zoneId);
    if (it == records_.end())
        return Result<std::vector<Record>>::success({});
    return Result<std::vector<Record>>::success(it->second);
}

Result<Record> MockZoneGateway::createChild(const std::string &zoneId,
                                            const MutationPayload &payload,
                                            const CancelCheck &shouldCancel) {
    std::lock_guard<std::mutex> lk(mtx_);
    ++calls_[Op::Create];
    if (cancelRequested(Op::Create, shouldCancel))
        return Result<Record>::failure(GatewayError::canceled());
    if (auto err = takeFailure(Op::Create))
        return Result<Record>::failure(*err);
    const Zone *zone = zoneById(zoneId);
    if (!zone)
        return Result<Record>::failure(
            GatewayError::remote("Zone not found: " + zoneId, 404));

    Record rec;
    rec.id = "mock-" + std::to_string(nextId_++);
    rec.zone_id = zoneId;
    rec = apply(*zone, std::move(rec), payload);
    records_[zoneId].push_back(rec);
    lastPayload_ = payload;
    return Result<Record>::success(std::move(rec));
}

Result<Record> MockZoneGateway::updateChild(const std::string &zoneId,
                                            const std::string &recordId,
                                            const MutationPayload &payload,
                                            const CancelCheck &shouldCancel) {
    std::lock_guard<std::mutex> lk(mtx_);
    ++calls_[Op::Update];
    if (cancelRequested(Op::Update, shouldCancel))
        return Result<Record>::failure(GatewayError::canceled());
    if (auto err = takeFailure(Op::Update))
        return Result<Record>::failure(*err);
    const Zone *zone = zoneById(zoneId);
    if (!zone)
        return Result<Record>::failure(
            GatewayError::remote("Zone not found: " + zoneId, 404));

    auto list = records_.find(zoneId);
    if (list == records_.end())
        return Result<Record>::failure(
            GatewayError::remote("Record not found: " + recordId, 404));
    auto it = std::find_if(list->second.begin(), list->second.end(),
                           [&](const Record &r) { return r.id == recordId; });
    if (it == list->second.end())
        return Result<Record>::failure(
            GatewayError::remote("Record not found: " + recordId, 404));
    *it = apply(*zone, *it, payload);
    lastPayload_ = payload;
    return Result<Record>::success(*it);
}

Result<Unit> MockZoneGateway::deleteChild(const std::string &zoneId,
                                          const std::string &recordId,
                                          const CancelCheck &shouldCancel) {
    std::lock_guard<std::mutex> lk(mtx_);
    ++calls_[Op::Delete];
    if (cancelRequested(Op::Delete, shouldCancel))
        return Result<Unit>::failure(GatewayError::canceled());
    if (auto err = takeFailure(Op::Delete))
        return Result<Unit>::failure(*err);
    if (!zoneById(zoneId))
        return Result<Unit>::failure(
            GatewayError::remote("Zone not found: " + zoneId, 404));

    auto list = records_.find(zoneId);
    if (list == records_.end())
        return Result<Unit>::failure(
            GatewayError::remote("Record not found: " + recordId, 404));
    auto it = std::find_if(list->second.begin(), list->second.end(),
                           [&](const Record &r) { return r.id == recordId; });
    if (it == list->second.end())
        return Result<Unit>::failure(
            GatewayError::remote("Record not found: " + recordId, 404));
    list->second.erase(it);
    return Result<Unit>::success({});
}

void MockZoneGateway::clear() {
    std::lock_guard<std::mutex> lk(mtx_);
    zones_.clear();
    records_.clear();
    failures_.clear();
    calls_.clear();
    canceled_.clear();
    lastPayload_.reset();
}

void MockZoneGateway::addZone(const Zone &z) {
    std::lock_guard<std::mutex> lk(mtx_);
    zones_.push_back(z);
}

void MockZoneGateway::addRecord(const Record &r) {
    std::lock_guard<std::mutex> lk(mtx_);
    records_[r.zone_id].push_back(r);
}

void MockZoneGateway::failNext(Op op, GatewayError err) {
    std::lock_guard<std::mutex> lk(mtx_);
    failures_[op] = std::move(err);
}

int MockZoneGateway::callCount(Op op) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = calls_.find(op);
    return it == calls_.end() ? 0 : it->second;
}

int MockZoneGateway::canceledCount(Op op) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = canceled_.find(op);
    return it == canceled_.end() ? 0 : it->second;
}

std::optional<MutationPayload> MockZoneGateway::lastPayload() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return lastPayload_;
}

std::vector<Record> MockZoneGateway::records(const std::string &zoneId) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = records_.find(zoneId);
    if (it == records_.end())
        return {};
    return it->second;
}

bool MockZoneGateway::cancelRequested(Op op, const CancelCheck &shouldCancel) {
    if (!shouldCancel || !shouldCancel())
        return false;
    ++canceled_[op];
    return true;
}

std::optional<GatewayError> MockZoneGateway::takeFailure(Op op) {
    auto it = failures_.find(op);
    if (it == failures_.end())
        return std::nullopt;
    GatewayError err = std::move(it->second);
    failures_.erase(it);
    return err;
}

const Zone *MockZoneGateway::zoneById(const std::string &zoneId) const {
    for (const auto &z : zones_) {
        if (z.id == zoneId)
            return &z;
    }
    return nullptr;
}

// Mirrors the service: relative names are qualified with the zone name and
// the proxy flag only sticks on proxiable types.
Record MockZoneGateway::apply(const Zone &zone, Record rec,
                              const MutationPayload &payload) const {
    rec.type = payload.type;
    rec.name = payload.name;
    if (rec.name != zone.name && !endsWith(rec.name, "." + zone.name))
        rec.name += "." + zone.name;
    rec.content = payload.content;
    rec.ttl = payload.ttl;
    rec.proxied = isProxiableType(payload.type) && payload.proxied;
    return rec;
}

} // namespace openzone
