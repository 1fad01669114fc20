#include "openzone/detail/CloudflareCodec.hpp"

#include <QJsonDocument>
#include <QJsonParseError>
#include <QStringList>

#include <utility>

namespace openzone {
namespace detail {

QString joinErrors(const QJsonArray &errors) {
    QStringList parts;
    for (const QJsonValue &v : errors) {
        const QJsonObject e = v.toObject();
        const QString msg = e.value("message").toString();
        const int code = e.value("code").toInt();
        if (msg.isEmpty())
            continue;
        parts << (code ? QString("%1 [%2]").arg(msg).arg(code) : msg);
    }
    return parts.join("; ");
}

Result<Envelope> decode(const HttpReply &reply) {
    if (reply.canceled)
        return Result<Envelope>::failure(GatewayError::canceled());
    if (reply.status == 0) {
        const QString why = reply.transportError.isEmpty()
                                ? QStringLiteral("No response from server")
                                : reply.transportError;
        return Result<Envelope>::failure(
            GatewayError::transport(why.toStdString()));
    }

    Envelope env;
    QJsonParseError perr{};
    const QJsonDocument doc = QJsonDocument::fromJson(reply.body, &perr);
    if (perr.error == QJsonParseError::NoError && doc.isObject()) {
        const QJsonObject root = doc.object();
        env.success = root.value("success").toBool();
        env.result = root.value("result");
        env.resultInfo = root.value("result_info").toObject();
        env.errorText = joinErrors(root.value("errors").toArray());
    } else {
        env.errorText =
            QString("Invalid response body: %1").arg(perr.errorString());
    }

    const bool httpOk = reply.status >= 200 && reply.status < 300;
    if (httpOk && env.success)
        return Result<Envelope>::success(std::move(env));

    QString msg = env.errorText;
    if (msg.isEmpty())
        msg = QString("Request failed");
    if (reply.status == 401 || reply.status == 403)
        return Result<Envelope>::failure(
            GatewayError::auth(msg.toStdString(), reply.status));
    return Result<Envelope>::failure(
        GatewayError::remote(msg.toStdString(), reply.status));
}

Zone zoneFromJson(const QJsonObject &o) {
    Zone z;
    z.id = o.value("id").toString().toStdString();
    z.name = o.value("name").toString().toStdString();
    z.status = o.value("status").toString().toStdString();
    return z;
}

Record recordFromJson(const QJsonObject &o, const std::string &zoneId) {
    Record r;
    r.id = o.value("id").toString().toStdString();
    const QString zid = o.value("zone_id").toString();
    r.zone_id = zid.isEmpty() ? zoneId : zid.toStdString();
    r.name = o.value("name").toString().toStdString();
    r.type = o.value("type").toString().toStdString();
    r.content = o.value("content").toString().toStdString();
    r.ttl = o.value("ttl").toInt(1);
    r.proxied = o.value("proxied").toBool(false);
    return r;
}

QByteArray payloadJson(const MutationPayload &p) {
    QJsonObject o;
    o.insert("type", QString::fromStdString(p.type));
    o.insert("name", QString::fromStdString(p.name));
    o.insert("content", QString::fromStdString(p.content));
    o.insert("ttl", p.ttl);
    // The service rejects "proxied" on types that cannot be proxied.
    if (isProxiableType(p.type))
        o.insert("proxied", p.proxied);
    return QJsonDocument(o).toJson(QJsonDocument::Compact);
}

} // namespace detail
} // namespace openzone
