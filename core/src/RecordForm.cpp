#include "openzone/RecordForm.hpp"
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>

namespace openzone {
namespace RecordForm {

std::string trimmed(const std::string &s) {
    std::size_t start = 0;
    while (start < s.size() &&
           std::isspace(static_cast<unsigned char>(s[start])))
        ++start;
    std::size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])))
        --end;
    return s.substr(start, end - start);
}

std::string relativeName(const std::string &zoneName,
                         const std::string &fullName) {
    if (fullName == zoneName)
        return "@";
    const std::string suffix = "." + zoneName;
    if (fullName.size() > suffix.size() &&
        fullName.compare(fullName.size() - suffix.size(), suffix.size(),
                         suffix) == 0) {
        return fullName.substr(0, fullName.size() - suffix.size());
    }
    return fullName;
}

std::string qualifiedName(const std::string &zoneName,
                          const std::string &fieldValue) {
    if (fieldValue == "@" || fieldValue == zoneName)
        return zoneName;
    const std::string suffix = "." + zoneName;
    if (fieldValue.size() > suffix.size() &&
        fieldValue.compare(fieldValue.size() - suffix.size(), suffix.size(),
                           suffix) == 0) {
        return fieldValue;
    }
    return fieldValue + suffix;
}

int parseTtl(const std::string &text) {
    const std::string t = trimmed(text);
    if (t.empty())
        return 1;
    errno = 0;
    char *end = nullptr;
    const long v = std::strtol(t.c_str(), &end, 10);
    if (errno != 0 || !end || *end != '\0' || v < INT_MIN || v > INT_MAX)
        return 1;
    return static_cast<int>(v);
}

RecordFields seed(const std::string &zoneName,
                  const std::optional<Record> &existing) {
    RecordFields f;
    if (!existing)
        return f;
    f.type = existing->type;
    f.name = relativeName(zoneName, existing->name);
    f.content = existing->content;
    f.ttl = std::to_string(existing->ttl);
    f.proxied = existing->proxied;
    return f;
}

PackagedRecord package(const std::string &zoneName,
                       const RecordFields &fields) {
    PackagedRecord out;

    std::string type = trimmed(fields.type);
    for (char &c : type)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    const std::string name = trimmed(fields.name);
    const std::string content = trimmed(fields.content);

    if (type.empty()) {
        out.error = ValidationError{ValidationError::Field::Type,
                                    "Type is required"};
        return out;
    }
    if (name.empty()) {
        out.error = ValidationError{ValidationError::Field::Name,
                                    "Name is required (use @ for the zone apex)"};
        return out;
    }
    if (content.empty()) {
        out.error = ValidationError{ValidationError::Field::Content,
                                    "Content is required"};
        return out;
    }

    MutationPayload p;
    p.type = type;
    p.name = qualifiedName(zoneName, name);
    p.content = content;
    p.ttl = parseTtl(fields.ttl);
    p.proxied = fields.proxied;
    out.payload = p;
    return out;
}

} // namespace RecordForm
} // namespace openzone
