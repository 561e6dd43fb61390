#ifndef PROTOLAYOUT_SERIALIZATION_JSON_CODEC_H
#define PROTOLAYOUT_SERIALIZATION_JSON_CODEC_H

#include "protolayout/core/errors.h"
#include "protolayout/render/render_context.h"
#include "protolayout/units/unit_str.h"
#include "protolayout/units/unit_str_geometry.h"

#include <nlohmann/json.hpp>

#include <string>

namespace protolayout {

// nlohmann/json hooks, found by ADL from json::get<T>() and json(x).
// Every from_json throws ParseError on a document of the wrong shape.

// {"value": 2.5, "unit": "in"}, px adds "dpi". A literal string such as
// "2.5in" is accepted on input.
void to_json(nlohmann::json& j, const UnitStr& q);
void from_json(const nlohmann::json& j, UnitStr& q);

// {"dpi", "x", "y", "rect_x", "rect_y", "width", "height"}; each quantity is
// a UnitStr object in its own unit. "rect_x"/"rect_y" default to zero.
void to_json(nlohmann::json& j, const UnitStrGeometry& g);
void from_json(const nlohmann::json& j, UnitStrGeometry& g);

// {"mode", "tab", "route", "dpi", "unit"}.
void to_json(nlohmann::json& j, const RenderContext& ctx);
void from_json(const nlohmann::json& j, RenderContext& ctx);

namespace json_detail {

// Member lookup that reports missing keys and type mismatches as ParseError.
const nlohmann::json& member(const nlohmann::json& j, const char* key);

template <typename T>
T read(const nlohmann::json& j, const char* key) {
    const nlohmann::json& v = member(j, key);
    try {
        return v.get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ParseError(std::string("field '") + key + "': " + e.what());
    }
}

template <typename T>
T readOr(const nlohmann::json& j, const char* key, T fallback) {
    if (!j.contains(key)) return fallback;
    return read<T>(j, key);
}

void requireObject(const nlohmann::json& j, const char* what);

} // namespace json_detail

} // namespace protolayout

#endif // PROTOLAYOUT_SERIALIZATION_JSON_CODEC_H
