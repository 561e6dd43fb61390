#include "protolayout/render/render_context.h"

#include "protolayout/core/errors.h"
#include "protolayout/core/string_utils.h"

#include <cmath>
#include <string>

namespace protolayout {

const char* renderModeName(RenderMode mode) noexcept {
    switch (mode) {
        case RenderMode::Gui: return "gui";
        case RenderMode::Export: return "export";
    }
    return "gui";
}

const char* tabModeName(TabMode mode) noexcept {
    switch (mode) {
        case TabMode::Component: return "component";
        case TabMode::Layout: return "layout";
    }
    return "component";
}

const char* renderRouteName(RenderRoute route) noexcept {
    switch (route) {
        case RenderRoute::Raster: return "raster";
        case RenderRoute::Composite: return "composite";
        case RenderRoute::VectorPriority: return "vector_priority";
    }
    return "composite";
}

RenderMode renderModeFromString(std::string_view name) {
    const std::string n = toLower(trimView(name));
    if (n == "gui") return RenderMode::Gui;
    if (n == "export") return RenderMode::Export;
    throw ParseError("unknown render mode '" + std::string(name) + "'");
}

TabMode tabModeFromString(std::string_view name) {
    const std::string n = toLower(trimView(name));
    if (n == "component") return TabMode::Component;
    if (n == "layout") return TabMode::Layout;
    throw ParseError("unknown tab mode '" + std::string(name) + "'");
}

RenderRoute renderRouteFromString(std::string_view name) {
    const std::string n = toLower(trimView(name));
    if (n == "raster") return RenderRoute::Raster;
    if (n == "composite") return RenderRoute::Composite;
    if (n == "vector_priority") return RenderRoute::VectorPriority;
    throw ParseError("unknown render route '" + std::string(name) + "'");
}

RenderContext::RenderContext(RenderMode mode, TabMode tabMode, RenderRoute route, double dpi, Unit unit)
    : mode_(mode), tabMode_(tabMode), route_(route), dpi_(dpi), unit_(unit) {
    if (!std::isfinite(dpi_) || dpi_ <= 0.0) throw ParseError("render context dpi must be positive");
}

RenderContext RenderContext::gui(TabMode tabMode, double dpi, Unit unit) {
    // The layout tab shows slots as cached rasters of their content.
    const RenderRoute route = tabMode == TabMode::Layout ? RenderRoute::Raster : RenderRoute::Composite;
    return RenderContext(RenderMode::Gui, tabMode, route, dpi, unit);
}

RenderContext RenderContext::exportContext(RenderRoute route, double dpi, Unit unit) {
    return RenderContext(RenderMode::Export, TabMode::Layout, route, dpi, unit);
}

RenderContext RenderContext::withMode(RenderMode mode) const {
    return RenderContext(mode, tabMode_, route_, dpi_, unit_);
}

RenderContext RenderContext::withTabMode(TabMode tabMode) const {
    return RenderContext(mode_, tabMode, route_, dpi_, unit_);
}

RenderContext RenderContext::withRoute(RenderRoute route) const {
    return RenderContext(mode_, tabMode_, route, dpi_, unit_);
}

RenderContext RenderContext::withDpi(double dpi) const {
    return RenderContext(mode_, tabMode_, route_, dpi, unit_);
}

RenderContext RenderContext::withUnit(Unit unit) const {
    return RenderContext(mode_, tabMode_, route_, dpi_, unit);
}

PaintOwner RenderContext::paintOwner() const noexcept {
    return route_ == RenderRoute::Raster ? PaintOwner::ParentRasterCache : PaintOwner::Child;
}

bool RenderContext::operator==(const RenderContext& other) const noexcept {
    return mode_ == other.mode_ && tabMode_ == other.tabMode_ && route_ == other.route_ && dpi_ == other.dpi_
        && unit_ == other.unit_;
}

} // namespace protolayout
