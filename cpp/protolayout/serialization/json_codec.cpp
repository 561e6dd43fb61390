#include "protolayout/serialization/json_codec.h"

#include "protolayout/core/errors.h"

namespace protolayout {

namespace json_detail {

void requireObject(const nlohmann::json& j, const char* what) {
    if (!j.is_object()) throw ParseError(std::string(what) + " must be a JSON object, got " + j.type_name());
}

const nlohmann::json& member(const nlohmann::json& j, const char* key) {
    requireObject(j, "document");
    auto it = j.find(key);
    if (it == j.end()) throw ParseError(std::string("missing field '") + key + "'");
    return *it;
}

} // namespace json_detail

using json_detail::read;
using json_detail::readOr;

// =============================================================================
// UnitStr
// =============================================================================

void to_json(nlohmann::json& j, const UnitStr& q) {
    j = nlohmann::json{{"value", q.value()}, {"unit", unitName(q.unit())}};
    if (q.unit() == Unit::Px) j["dpi"] = q.dpi();
}

void from_json(const nlohmann::json& j, UnitStr& q) {
    if (j.is_string()) {
        q = UnitStr::fromString(j.get<std::string>());
        return;
    }
    json_detail::requireObject(j, "quantity");
    const Unit unit = unitFromString(read<std::string>(j, "unit"));
    const double dpi = readOr<double>(j, "dpi", kDefaultDpi);
    q = UnitStr::fromNumber(read<double>(j, "value"), unit, dpi);
}

// =============================================================================
// UnitStrGeometry
// =============================================================================

void to_json(nlohmann::json& j, const UnitStrGeometry& g) {
    j = nlohmann::json{
        {"dpi", g.dpi()},
        {"x", g.x()},
        {"y", g.y()},
        {"rect_x", g.rectX()},
        {"rect_y", g.rectY()},
        {"width", g.width()},
        {"height", g.height()},
    };
}

void from_json(const nlohmann::json& j, UnitStrGeometry& g) {
    json_detail::requireObject(j, "geometry");
    const double dpi = readOr<double>(j, "dpi", kDefaultDpi);
    const UnitStr width = read<UnitStr>(j, "width");
    const UnitStr zero = UnitStr::zero(width.unit());
    g = UnitStrGeometry(read<UnitStr>(j, "x"), read<UnitStr>(j, "y"), readOr<UnitStr>(j, "rect_x", zero),
                        readOr<UnitStr>(j, "rect_y", zero), width, read<UnitStr>(j, "height"), dpi);
}

// =============================================================================
// RenderContext
// =============================================================================

void to_json(nlohmann::json& j, const RenderContext& ctx) {
    j = nlohmann::json{
        {"mode", renderModeName(ctx.mode())},
        {"tab", tabModeName(ctx.tabMode())},
        {"route", renderRouteName(ctx.route())},
        {"dpi", ctx.dpi()},
        {"unit", unitName(ctx.unit())},
    };
}

void from_json(const nlohmann::json& j, RenderContext& ctx) {
    json_detail::requireObject(j, "render context");
    ctx = RenderContext(renderModeFromString(read<std::string>(j, "mode")),
                        tabModeFromString(read<std::string>(j, "tab")),
                        renderRouteFromString(read<std::string>(j, "route")),
                        readOr<double>(j, "dpi", kDisplayDpi),
                        unitFromString(readOr<std::string>(j, "unit", "px")));
}

} // namespace protolayout
