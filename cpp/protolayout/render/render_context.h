#ifndef PROTOLAYOUT_RENDER_RENDER_CONTEXT_H
#define PROTOLAYOUT_RENDER_RENDER_CONTEXT_H

#include "protolayout/core/types.h"
#include "protolayout/units/unit_str.h"

#include <cstdint>
#include <string_view>

namespace protolayout {

enum class RenderMode : std::uint8_t {
    Gui = 0,
    Export = 1,
};

enum class TabMode : std::uint8_t {
    Component = 0,
    Layout = 1,
};

enum class RenderRoute : std::uint8_t {
    Raster = 0,          // parent paints a cached raster of the child
    Composite = 1,       // child paints itself into the parent's surface
    VectorPriority = 2,  // child paints itself, vector primitives preferred
};

// Which side of a parent/child pair paints the child for a given route.
enum class PaintOwner : std::uint8_t {
    ParentRasterCache = 0,
    Child = 1,
};

const char* renderModeName(RenderMode mode) noexcept;
const char* tabModeName(TabMode mode) noexcept;
const char* renderRouteName(RenderRoute route) noexcept;
RenderMode renderModeFromString(std::string_view name);
TabMode tabModeFromString(std::string_view name);
RenderRoute renderRouteFromString(std::string_view name);

// Immutable rendering descriptor. All with*() calls return modified copies.
class RenderContext {
public:
    RenderContext() = default;
    RenderContext(RenderMode mode, TabMode tabMode, RenderRoute route, double dpi = kDisplayDpi,
                  Unit unit = Unit::Px);

    static RenderContext gui(TabMode tabMode, double dpi = kDisplayDpi, Unit unit = Unit::Px);
    static RenderContext exportContext(RenderRoute route, double dpi = kPrintDpi, Unit unit = Unit::Px);

    RenderMode mode() const noexcept { return mode_; }
    TabMode tabMode() const noexcept { return tabMode_; }
    RenderRoute route() const noexcept { return route_; }
    double dpi() const noexcept { return dpi_; }
    Unit unit() const noexcept { return unit_; }

    bool isGui() const noexcept { return mode_ == RenderMode::Gui; }
    bool isExport() const noexcept { return mode_ == RenderMode::Export; }
    bool isComponentTab() const noexcept { return tabMode_ == TabMode::Component; }
    bool isLayoutTab() const noexcept { return tabMode_ == TabMode::Layout; }
    bool isRaster() const noexcept { return route_ == RenderRoute::Raster; }
    bool isComposite() const noexcept { return route_ == RenderRoute::Composite; }
    bool isVectorPriority() const noexcept { return route_ == RenderRoute::VectorPriority; }

    RenderContext withMode(RenderMode mode) const;
    RenderContext withTabMode(TabMode tabMode) const;
    RenderContext withRoute(RenderRoute route) const;
    RenderContext withDpi(double dpi) const;
    RenderContext withUnit(Unit unit) const;

    // Exactly one of parentPaintsChild()/childPaintsSelf() holds.
    PaintOwner paintOwner() const noexcept;
    bool parentPaintsChild() const noexcept { return paintOwner() == PaintOwner::ParentRasterCache; }
    bool childPaintsSelf() const noexcept { return paintOwner() == PaintOwner::Child; }

    // Converts a quantity to the context's DPI in pixels.
    double toPixels(const UnitStr& q) const { return q.toPixels(dpi_); }

    bool operator==(const RenderContext& other) const noexcept;
    bool operator!=(const RenderContext& other) const noexcept { return !(*this == other); }

private:
    RenderMode mode_ = RenderMode::Gui;
    TabMode tabMode_ = TabMode::Component;
    RenderRoute route_ = RenderRoute::Composite;
    double dpi_ = kDisplayDpi;
    Unit unit_ = Unit::Px;
};

} // namespace protolayout

#endif // PROTOLAYOUT_RENDER_RENDER_CONTEXT_H
