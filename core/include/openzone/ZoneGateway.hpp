// Abstract interface to the remote DNS service. Concrete backends (Cloudflare,
// in-memory mock) must honor this API so the tree logic stays decoupled from
// transport details.
//
// Calls are blocking and may run on any worker thread; implementations must
// be safe to call concurrently.
#pragma once
#include "ZoneTypes.hpp"
#include <string>
#include <vector>

namespace openzone {

class ZoneGateway {
public:
    virtual ~ZoneGateway() = default;

    // Checks that the configured credential is accepted.
    virtual Result<Unit> verifyCredential() = 0;

    // Zone listing (all pages)
    virtual Result<std::vector<Zone>>
    listParents(const CancelCheck &shouldCancel = {}) = 0;

    // Records of one zone (all pages)
    virtual Result<std::vector<Record>>
    listChildren(const std::string &zoneId,
                 const CancelCheck &shouldCancel = {}) = 0;

    virtual Result<Record> createChild(const std::string &zoneId,
                                       const MutationPayload &payload,
                                       const CancelCheck &shouldCancel = {}) = 0;

    virtual Result<Record> updateChild(const std::string &zoneId,
                                       const std::string &recordId,
                                       const MutationPayload &payload,
                                       const CancelCheck &shouldCancel = {}) = 0;

    virtual Result<Unit> deleteChild(const std::string &zoneId,
                                     const std::string &recordId,
                                     const CancelCheck &shouldCancel = {}) = 0;
};

} // namespace openzone
