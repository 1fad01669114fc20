// Cloudflare backend: bearer-token HTTPS calls with paged listings. Errors
// are classified from the transport state, the HTTP status and the API's
// errors[] array.
#include "openzone/CloudflareGateway.hpp"
#include "openzone/RuntimeEnv.hpp"
#include "openzone/detail/CloudflareCodec.hpp"

#include <QByteArray>
#include <QEventLoop>
#include <QJsonArray>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QObject>
#include <QString>
#include <QTimer>
#include <QUrl>
#include <QUrlQuery>

#include <utility>

Q_LOGGING_CATEGORY(ozGateway, "openzone.gateway")

namespace openzone {

namespace {

using detail::decode;
using detail::HttpReply;
using detail::payloadJson;
using detail::recordFromJson;
using detail::zoneFromJson;

constexpr int kCancelPollMs = 100;

HttpReply perform(const GatewayOptions &opt, const QByteArray &verb,
                  const QString &path, const QUrlQuery &query,
                  const QByteArray &body, const CancelCheck &shouldCancel) {
    HttpReply out;
    if (shouldCancel && shouldCancel()) {
        out.canceled = true;
        return out;
    }

    QUrl url(QString::fromStdString(opt.base_url) + path);
    if (!query.isEmpty())
        url.setQuery(query);

    QNetworkRequest req(url);
    req.setRawHeader("Authorization",
                     "Bearer " + QByteArray::fromStdString(opt.token));
    req.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
    req.setRawHeader("Accept", "application/json");
    req.setTransferTimeout(opt.timeout_ms);

    if (sensitiveLoggingEnabled() && !body.isEmpty())
        qDebug(ozGateway) << verb << path << "body" << body;

    QNetworkAccessManager nam; // owns the reply
    QNetworkReply *reply = nam.sendCustomRequest(req, verb, body);

    QEventLoop loop;
    QObject::connect(reply, &QNetworkReply::finished, &loop,
                     &QEventLoop::quit);
    QTimer poll;
    poll.setInterval(kCancelPollMs);
    QObject::connect(&poll, &QTimer::timeout, &loop, [&] {
        if (shouldCancel && shouldCancel() && !out.canceled) {
            out.canceled = true;
            reply->abort();
        }
    });
    if (shouldCancel)
        poll.start();
    if (!reply->isFinished())
        loop.exec();
    poll.stop();

    const QVariant statusAttr =
        reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    out.status = statusAttr.isValid() ? statusAttr.toInt() : 0;
    out.body = reply->readAll();
    if (reply->error() != QNetworkReply::NoError && out.status == 0)
        out.transportError = reply->errorString();

    qInfo(ozGateway) << verb << path << "status" << out.status
                     << (out.canceled ? "canceled" : "");
    if (sensitiveLoggingEnabled())
        qDebug(ozGateway) << "response" << out.body;
    return out;
}

QString zonePath(const std::string &zoneId) {
    return "/zones/" + QString::fromStdString(zoneId);
}

QString recordPath(const std::string &zoneId, const std::string &recordId) {
    return zonePath(zoneId) + "/dns_records/" +
           QString::fromStdString(recordId);
}

// Walks every page of a listing, handing each result array to sink.
template <typename Sink>
Result<Unit> listAllPages(const GatewayOptions &opt, const QString &path,
                          int perPage, const CancelCheck &shouldCancel,
                          Sink &&sink) {
    int page = 1;
    int totalPages = 1;
    do {
        QUrlQuery q;
        q.addQueryItem("page", QString::number(page));
        q.addQueryItem("per_page", QString::number(perPage));
        auto env = decode(perform(opt, "GET", path, q, {}, shouldCancel));
        if (!env)
            return Result<Unit>::failure(env.error());
        sink(env.value().result.toArray());
        totalPages = env.value().resultInfo.value("total_pages").toInt(1);
        ++page;
    } while (page <= totalPages);
    return Result<Unit>::success({});
}

} // namespace

CloudflareGateway::CloudflareGateway(GatewayOptions opt)
    : opt_(std::move(opt)) {
    while (!opt_.base_url.empty() && opt_.base_url.back() == '/')
        opt_.base_url.pop_back();
}

CloudflareGateway::~CloudflareGateway() = default;

Result<Unit> CloudflareGateway::verifyCredential() {
    if (opt_.token.empty())
        return Result<Unit>::failure(GatewayError::auth("No API token"));
    auto env = decode(perform(opt_, "GET", "/user/tokens/verify", {}, {}, {}));
    if (!env)
        return Result<Unit>::failure(env.error());
    const QString status =
        env.value().result.toObject().value("status").toString();
    if (status != "active") {
        return Result<Unit>::failure(GatewayError::auth(
            "API token is not active (" + status.toStdString() + ")"));
    }
    return Result<Unit>::success({});
}

Result<std::vector<Zone>>
CloudflareGateway::listParents(const CancelCheck &shouldCancel) {
    std::vector<Zone> zones;
    auto r = listAllPages(opt_, "/zones", opt_.zones_per_page, shouldCancel,
                          [&zones](const QJsonArray &arr) {
                              for (const QJsonValue &v : arr)
                                  zones.push_back(zoneFromJson(v.toObject()));
                          });
    if (!r)
        return Result<std::vector<Zone>>::failure(r.error());
    return Result<std::vector<Zone>>::success(std::move(zones));
}

Result<std::vector<Record>>
CloudflareGateway::listChildren(const std::string &zoneId,
                                const CancelCheck &shouldCancel) {
    std::vector<Record> records;
    auto r = listAllPages(opt_, zonePath(zoneId) + "/dns_records",
                          opt_.records_per_page, shouldCancel,
                          [&records, &zoneId](const QJsonArray &arr) {
                              for (const QJsonValue &v : arr)
                                  records.push_back(
                                      recordFromJson(v.toObject(), zoneId));
                          });
    if (!r)
        return Result<std::vector<Record>>::failure(r.error());
    return Result<std::vector<Record>>::success(std::move(records));
}

Result<Record> CloudflareGateway::createChild(const std::string &zoneId,
                                              const MutationPayload &payload,
                                              const CancelCheck &shouldCancel) {
    auto env = decode(perform(opt_, "POST", zonePath(zoneId) + "/dns_records",
                              {}, payloadJson(payload), shouldCancel));
    if (!env)
        return Result<Record>::failure(env.error());
    return Result<Record>::success(
        recordFromJson(env.value().result.toObject(), zoneId));
}

Result<Record> CloudflareGateway::updateChild(const std::string &zoneId,
                                              const std::string &recordId,
                                              const MutationPayload &payload,
                                              const CancelCheck &shouldCancel) {
    auto env = decode(perform(opt_, "PUT", recordPath(zoneId, recordId), {},
                              payloadJson(payload), shouldCancel));
    if (!env)
        return Result<Record>::failure(env.error());
    return Result<Record>::success(
        recordFromJson(env.value().result.toObject(), zoneId));
}

Result<Unit> CloudflareGateway::deleteChild(const std::string &zoneId,
                                            const std::string &recordId,
                                            const CancelCheck &shouldCancel) {
    auto env = decode(perform(opt_, "DELETE", recordPath(zoneId, recordId), {},
                              {}, shouldCancel));
    if (!env)
        return Result<Unit>::failure(env.error());
    return Result<Unit>::success({});
}

} // namespace openzone
