// Wire format of the Cloudflare v4 API: response envelopes, error
// classification and request bodies. Used by CloudflareGateway.
#pragma once
#include "openzone/ZoneTypes.hpp"

#include <QByteArray>
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>

namespace openzone {
namespace detail {

struct HttpReply {
    int status = 0; // 0 when no HTTP response arrived
    QByteArray body;
    QString transportError;
    bool canceled = false;
};

// Decoded API envelope.
struct Envelope {
    bool success = false;
    QJsonValue result;
    QJsonObject resultInfo;
    QString errorText;
};

// "message [code]" entries joined with "; ".
QString joinErrors(const QJsonArray &errors);

// Canceled and no-response replies map to Canceled and Transport; 401/403
// map to Auth; any other non-2xx status or success=false maps to Remote.
Result<Envelope> decode(const HttpReply &reply);

Zone zoneFromJson(const QJsonObject &o);
// zoneId is used when the object carries no zone_id.
Record recordFromJson(const QJsonObject &o, const std::string &zoneId);
QByteArray payloadJson(const MutationPayload &p);

} // namespace detail
} // namespace openzone
