#ifndef PROTOLAYOUT_REGISTRY_PID_H
#define PROTOLAYOUT_REGISTRY_PID_H

#include "protolayout/registry/proto_class.h"

#include <optional>
#include <string>
#include <string_view>

namespace protolayout {

// A PID is "<prefix>_<uuid4>", e.g. "ct_1b4e28ba-2fa1-4d3b-a3f5-ef19b5a7633b".
struct ParsedPid {
    ProtoClass cls;
    std::string prefix;
    std::string uuid;
};

// Random RFC 4122 version 4 UUID in canonical lowercase form.
std::string generateUuid4();

std::string issuePid(ProtoClass cls);
// Throws RegistryError if the prefix does not name a known class.
std::string issuePid(std::string_view prefix);

// Throws ParseError on a malformed PID and RegistryError on an unknown prefix.
ParsedPid parsePid(std::string_view pid);
bool isValidPid(std::string_view pid) noexcept;
std::optional<ProtoClass> pidClass(std::string_view pid) noexcept;

} // namespace protolayout

#endif // PROTOLAYOUT_REGISTRY_PID_H
