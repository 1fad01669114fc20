#pragma once
#include "ZoneGateway.hpp"
#include <string>
#include <vector>

namespace openzone {

struct GatewayOptions {
    std::string base_url = "https://api.cloudflare.com/client/v4";
    std::string token;           // API token, sent as a bearer credential
    int timeout_ms = 30000;      // per HTTP request
    int zones_per_page = 50;
    int records_per_page = 100;
};

// Cloudflare REST v4 backend. Each call opens its own network access manager
// and event loop, so calls can run concurrently on plain worker threads. A
// QCoreApplication must exist.
class CloudflareGateway : public ZoneGateway {
public:
    explicit CloudflareGateway(GatewayOptions opt);
    ~CloudflareGateway() override;

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

private:
    GatewayOptions opt_;
};

} // namespace openzone
