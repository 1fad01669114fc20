// Basic types shared between UI and core for zones, records and gateway
// results. Kept as plain structures so the UI can copy them freely.
#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace openzone {

// Top-level collection (a DNS zone).
struct Zone {
    std::string id;
    std::string name;
    std::string status; // as reported by the service ("active", "pending"...)
};

// Member record of a zone.
struct Record {
    std::string id;
    std::string zone_id;
    std::string name;    // usually fully qualified ("www.example.com")
    std::string type;    // open discriminator: A, AAAA, CNAME, MX, TXT...
    std::string content;
    int ttl = 1;         // 1 = automatic
    bool proxied = false;
};

// Fields sent to the gateway on create/update.
struct MutationPayload {
    std::string type;
    std::string name;
    std::string content;
    int ttl = 1;
    bool proxied = true;
};

// Types for which the routing/proxy flag is meaningful.
inline bool isProxiableType(const std::string &type) {
    return type == "A" || type == "AAAA" || type == "CNAME";
}

struct Unit {};

// Classified gateway failure.
struct GatewayError {
    enum class Kind {
        Transport, // network, TLS, timeout
        Remote,    // the service answered with an error
        Auth,      // credential missing or rejected
        Canceled   // superseded before completion
    };

    Kind kind = Kind::Remote;
    std::string message;
    std::optional<int> status; // HTTP status when the service answered

    static GatewayError transport(std::string msg) {
        return {Kind::Transport, std::move(msg), std::nullopt};
    }
    static GatewayError remote(std::string msg,
                               std::optional<int> code = std::nullopt) {
        return {Kind::Remote, std::move(msg), code};
    }
    static GatewayError auth(std::string msg,
                             std::optional<int> code = std::nullopt) {
        return {Kind::Auth, std::move(msg), code};
    }
    static GatewayError canceled() {
        return {Kind::Canceled, "Operation canceled", std::nullopt};
    }

    // Message with the status code appended when known.
    std::string describe() const {
        if (!status)
            return message;
        return message + " (HTTP " + std::to_string(*status) + ")";
    }
};

// Either a value or a classified error. Callers must check ok() before
// touching value().
template <typename T> class [[nodiscard]] Result {
public:
    static Result success(T value) { return Result(std::move(value)); }
    static Result failure(GatewayError err) { return Result(std::move(err)); }

    bool ok() const { return std::holds_alternative<T>(v_); }
    explicit operator bool() const { return ok(); }

    const T &value() const { return std::get<T>(v_); }
    T &value() { return std::get<T>(v_); }
    const GatewayError &error() const { return std::get<GatewayError>(v_); }

private:
    explicit Result(T value) : v_(std::move(value)) {}
    explicit Result(GatewayError err) : v_(std::move(err)) {}

    std::variant<T, GatewayError> v_;
};

// Polled by long-running gateway calls; returns true once the caller lost
// interest in the result.
using CancelCheck = std::function<bool()>;

enum class MutationKind { Create, Update, Delete };

// A single create/update/delete against one zone.
struct MutationRequest {
    MutationKind kind = MutationKind::Create;
    std::string zone_id;
    std::optional<std::string> record_id; // absent => create
    MutationPayload payload;              // unused for Delete
    std::string label;                    // for notifications

    static MutationRequest create(std::string zoneId, MutationPayload p) {
        MutationRequest r;
        r.kind = MutationKind::Create;
        r.zone_id = std::move(zoneId);
        r.label = p.name;
        r.payload = std::move(p);
        return r;
    }
    static MutationRequest update(std::string zoneId, std::string recordId,
                                  MutationPayload p) {
        MutationRequest r;
        r.kind = MutationKind::Update;
        r.zone_id = std::move(zoneId);
        r.record_id = std::move(recordId);
        r.label = p.name;
        r.payload = std::move(p);
        return r;
    }
    static MutationRequest remove(std::string zoneId, std::string recordId,
                                  std::string label) {
        MutationRequest r;
        r.kind = MutationKind::Delete;
        r.zone_id = std::move(zoneId);
        r.record_id = std::move(recordId);
        r.label = std::move(label);
        return r;
    }
};

} // namespace openzone
