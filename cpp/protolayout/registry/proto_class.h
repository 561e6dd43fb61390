#ifndef PROTOLAYOUT_REGISTRY_PROTO_CLASS_H
#define PROTOLAYOUT_REGISTRY_PROTO_CLASS_H

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace protolayout {

// Closed set of registrable object types. Each owns exactly one PID prefix.
enum class ProtoClass : std::uint8_t {
    ComponentTemplate = 0,
    ComponentInstance = 1,
    TextElement = 2,
    ImageElement = 3,
    LayoutTemplate = 4,
    LayoutSlot = 5,
};

struct ProtoClassInfo {
    ProtoClass cls;
    std::string_view prefix;
    std::string_view name;
};

inline constexpr std::array<ProtoClassInfo, 6> kProtoClasses = {{
    {ProtoClass::ComponentTemplate, "ct", "ComponentTemplate"},
    {ProtoClass::ComponentInstance, "cc", "ComponentInstance"},
    {ProtoClass::TextElement, "te", "TextElement"},
    {ProtoClass::ImageElement, "ie", "ImageElement"},
    {ProtoClass::LayoutTemplate, "lt", "LayoutTemplate"},
    {ProtoClass::LayoutSlot, "ls", "LayoutSlot"},
}};

constexpr std::string_view protoClassPrefix(ProtoClass cls) {
    for (const auto& info : kProtoClasses) {
        if (info.cls == cls) return info.prefix;
    }
    return {};
}

constexpr std::string_view protoClassName(ProtoClass cls) {
    for (const auto& info : kProtoClasses) {
        if (info.cls == cls) return info.name;
    }
    return {};
}

constexpr std::optional<ProtoClass> protoClassFromPrefix(std::string_view prefix) {
    for (const auto& info : kProtoClasses) {
        if (info.prefix == prefix) return info.cls;
    }
    return std::nullopt;
}

static_assert(protoClassPrefix(ProtoClass::ComponentTemplate) == "ct", "prefix table out of order");
static_assert(protoClassFromPrefix("ls") == ProtoClass::LayoutSlot, "prefix table out of order");

} // namespace protolayout

#endif // PROTOLAYOUT_REGISTRY_PROTO_CLASS_H
