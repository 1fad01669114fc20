// Field model behind the record edit dialog: seeding from an existing record
// and packaging the operator's input into a mutation payload.
#pragma once
#include "ZoneTypes.hpp"
#include <optional>
#include <string>

namespace openzone {

// Raw dialog fields, exactly as typed.
struct RecordFields {
    std::string type = "A";
    std::string name = "@";
    std::string content;
    std::string ttl = "1";
    bool proxied = true;
};

struct ValidationError {
    enum class Field { Type, Name, Content };
    Field field;
    std::string message;
};

struct PackagedRecord {
    std::optional<MutationPayload> payload;
    std::optional<ValidationError> error;

    bool ok() const { return payload.has_value(); }
};

namespace RecordForm {

// "@" for the zone apex, otherwise the name relative to the zone.
std::string relativeName(const std::string &zoneName,
                         const std::string &fullName);
// Inverse of relativeName().
std::string qualifiedName(const std::string &zoneName,
                          const std::string &fieldValue);

// Falls back to 1 (automatic) when the text is not an integer.
int parseTtl(const std::string &text);

RecordFields seed(const std::string &zoneName,
                  const std::optional<Record> &existing);

// Trims and normalizes the fields; rejects empty type, name or content.
PackagedRecord package(const std::string &zoneName,
                       const RecordFields &fields);

std::string trimmed(const std::string &s);

} // namespace RecordForm

} // namespace openzone
