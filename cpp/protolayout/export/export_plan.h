#ifndef PROTOLAYOUT_EXPORT_EXPORT_PLAN_H
#define PROTOLAYOUT_EXPORT_EXPORT_PLAN_H

#include "protolayout/model/component_element.h"
#include "protolayout/pagination/page.h"
#include "protolayout/render/render_context.h"
#include "protolayout/units/unit_str_geometry.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace protolayout {

class ComponentBase;
class LayoutTemplate;

// .png -> Raster, .pdf -> VectorPriority, .json -> Composite (case-insensitive).
// Throws ParseError for any other extension.
RenderRoute routeForPath(const std::string& path);

struct ExportOptions {
    // Component exports only: grow the component rectangle on every side.
    bool bleed = false;
    UnitStr bleedSize = UnitStr::fromNumber(kDefaultBleedInches, Unit::In);
};

struct ElementPlan {
    std::string pid;
    std::string name;
    ElementKind kind = ElementKind::Text;
    std::string content;
    PixelRect rect;
};

struct ComponentPlan {
    std::string pid;
    std::string templatePid;
    PixelRect rect;
    std::vector<ElementPlan> elements;  // paint order
};

struct PlacementPlan {
    std::string slotPid;
    std::size_t row = 0;
    std::size_t column = 0;
    PixelRect slotRect;
    PaintOwner paintOwner = PaintOwner::Child;
    std::optional<ComponentPlan> component;  // empty slot when unset
};

struct PagePlan {
    std::size_t index = 0;
    RenderContext context;
    PixelRect pageRect;
    std::vector<PlacementPlan> placements;
};

// Pixel layout of one generated page at the context's DPI. A placed component
// occupies its slot's rectangle exactly; its elements keep their own offsets
// from the slot origin. Slots are resolved by PID, so the page must come from
// the layout's current grid. Throws ConfigurationError unless `context` is an
// export context or when a placement names a slot the layout no longer has.
PagePlan planPage(const LayoutTemplate& layout, const Page& page, const RenderContext& context);

// Single component at the origin, optionally grown by the bleed.
ComponentPlan planComponent(const ComponentBase& component, const RenderContext& context,
                            const ExportOptions& options = {});

nlohmann::json toJson(const PixelRect& rect);
nlohmann::json toJson(const ComponentPlan& plan);
nlohmann::json toJson(const PagePlan& plan);

} // namespace protolayout

#endif // PROTOLAYOUT_EXPORT_EXPORT_PLAN_H
