// Environment lookups: credential, endpoint override and the diagnostics
// policy for sensitive logging.
#pragma once

#include <cctype>
#include <cstdlib>
#include <optional>
#include <string>

namespace openzone {

inline constexpr const char *kTokenEnv = "CLOUDFLARE_API_TOKEN";
inline constexpr const char *kApiBaseEnv = "OPEN_ZONE_API_BASE";

// Value with surrounding whitespace removed; nullopt when unset or blank.
inline std::optional<std::string> trimmedEnv(const char *name) {
    if (!name)
        return std::nullopt;
    const char *raw = std::getenv(name);
    if (!raw || !*raw)
        return std::nullopt;
    std::string out(raw);
    std::size_t start = 0;
    while (start < out.size() &&
           std::isspace(static_cast<unsigned char>(out[start]))) {
        ++start;
    }
    std::size_t end = out.size();
    while (end > start &&
           std::isspace(static_cast<unsigned char>(out[end - 1]))) {
        --end;
    }
    if (start == end)
        return std::nullopt;
    return out.substr(start, end - start);
}

inline std::string normalizedEnv(const char *name) {
    std::string out = trimmedEnv(name).value_or(std::string());
    for (char &c : out)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

inline bool envFlagEnabled(const char *name) {
    const std::string v = normalizedEnv(name);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

inline bool isDevEnvironment() {
    const std::string env = normalizedEnv("OPEN_ZONE_ENV");
    return env == "dev" || env == "development" || env == "local" ||
           env == "debug";
}

// Request/response bodies may be logged only in dev environments that opt in.
inline bool sensitiveLoggingEnabled() {
    return isDevEnvironment() && envFlagEnabled("OPEN_ZONE_LOG_SENSITIVE");
}

} // namespace openzone
