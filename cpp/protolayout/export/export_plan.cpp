#include "protolayout/export/export_plan.h"

#include "protolayout/core/errors.h"
#include "protolayout/core/string_utils.h"
#include "protolayout/model/component.h"
#include "protolayout/model/layout_template.h"
#include "protolayout/serialization/json_codec.h"

#include <string>
#include <utility>

namespace protolayout {

namespace {

const char* paintOwnerName(PaintOwner owner) noexcept {
    return owner == PaintOwner::ParentRasterCache ? "parent_raster_cache" : "child";
}

void requireExport(const RenderContext& context) {
    if (!context.isExport()) {
        throw ConfigurationError(std::string("export plans need an export render context, got ")
            + renderModeName(context.mode()));
    }
}

// Elements of `component` placed relative to (originX, originY).
std::vector<ElementPlan> planElements(const ComponentBase& component, double dpi, double originX, double originY) {
    std::vector<ElementPlan> out;
    for (const ComponentElement* el : component.elements()) {
        const PixelRect r = el->geometry().toPixelRect(dpi);
        ElementPlan plan;
        plan.pid = el->pid();
        plan.name = el->name();
        plan.kind = el->kind();
        plan.content = el->content();
        plan.rect = PixelRect{originX + r.x, originY + r.y, r.width, r.height};
        out.push_back(std::move(plan));
    }
    return out;
}

} // namespace

RenderRoute routeForPath(const std::string& path) {
    const std::string lower = toLower(path);
    if (endsWith(lower, ".png")) return RenderRoute::Raster;
    if (endsWith(lower, ".pdf")) return RenderRoute::VectorPriority;
    if (endsWith(lower, ".json")) return RenderRoute::Composite;
    throw ParseError("unsupported export type for '" + path + "' (expected .png, .pdf or .json)");
}

PagePlan planPage(const LayoutTemplate& layout, const Page& page, const RenderContext& context) {
    requireExport(context);
    const double dpi = context.dpi();

    PagePlan plan;
    plan.index = page.index;
    plan.context = context;
    plan.pageRect = layout.pageGeometry().toPixelRect(dpi);
    plan.placements.reserve(page.placements.size());

    for (const Placement& placement : page.placements) {
        const LayoutSlot* slot = layout.findSlot(placement.slotPid);
        if (!slot) {
            throw ConfigurationError("page " + std::to_string(page.index) + " places slot '" + placement.slotPid
                + "', which layout '" + layout.pid() + "' no longer has");
        }
        PlacementPlan out;
        out.slotPid = placement.slotPid;
        out.row = placement.row;
        out.column = placement.column;
        out.slotRect = slot->geometry().toPixelRect(dpi);
        out.paintOwner = context.paintOwner();

        if (placement.instance) {
            const ComponentInstance& instance = *placement.instance;
            ComponentPlan component;
            component.pid = instance.pid();
            component.templatePid = instance.templatePid();
            component.rect = out.slotRect;
            component.elements = planElements(instance, dpi, component.rect.x, component.rect.y);
            out.component = std::move(component);
        }
        plan.placements.push_back(std::move(out));
    }
    return plan;
}

ComponentPlan planComponent(const ComponentBase& component, const RenderContext& context,
                            const ExportOptions& options) {
    requireExport(context);
    const double dpi = context.dpi();
    const double b = options.bleed ? options.bleedSize.toPixels(dpi) : 0.0;

    ComponentPlan plan;
    plan.pid = component.pid();
    if (component.protoClass() == ProtoClass::ComponentInstance) {
        plan.templatePid = static_cast<const ComponentInstance&>(component).templatePid();
    } else {
        plan.templatePid = component.pid();
    }
    plan.rect = PixelRect{-b, -b, component.geometry().width().toPixels(dpi) + 2.0 * b,
                          component.geometry().height().toPixels(dpi) + 2.0 * b};
    plan.elements = planElements(component, dpi, 0.0, 0.0);
    return plan;
}

// =============================================================================
// JSON
// =============================================================================

nlohmann::json toJson(const PixelRect& rect) {
    return {{"x", rect.x}, {"y", rect.y}, {"width", rect.width}, {"height", rect.height}};
}

nlohmann::json toJson(const ComponentPlan& plan) {
    nlohmann::json elements = nlohmann::json::array();
    for (const auto& el : plan.elements) {
        elements.push_back({
            {"pid", el.pid},
            {"name", el.name},
            {"kind", el.kind == ElementKind::Text ? "text" : "image"},
            {"content", el.content},
            {"rect", toJson(el.rect)},
        });
    }
    return {
        {"pid", plan.pid},
        {"template_pid", plan.templatePid},
        {"rect", toJson(plan.rect)},
        {"elements", std::move(elements)},
    };
}

nlohmann::json toJson(const PagePlan& plan) {
    nlohmann::json placements = nlohmann::json::array();
    for (const auto& p : plan.placements) {
        placements.push_back({
            {"slot_pid", p.slotPid},
            {"row", p.row},
            {"column", p.column},
            {"slot_rect", toJson(p.slotRect)},
            {"paint_owner", paintOwnerName(p.paintOwner)},
            {"component", p.component ? toJson(*p.component) : nlohmann::json()},
        });
    }
    return {
        {"index", plan.index},
        {"context", plan.context},
        {"page_rect", toJson(plan.pageRect)},
        {"placements", std::move(placements)},
    };
}

} // namespace protolayout
