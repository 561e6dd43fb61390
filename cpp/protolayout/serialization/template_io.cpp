#include "protolayout/serialization/template_io.h"

#include "protolayout/core/errors.h"
#include "protolayout/core/logging.h"
#include "protolayout/registry/pid.h"
#include "protolayout/registry/proto_registry.h"
#include "protolayout/serialization/json_codec.h"

#include <algorithm>
#include <fstream>
#include <utility>

namespace protolayout {

using json_detail::read;
using json_detail::readOr;
using json_detail::requireObject;
using nlohmann::json;

namespace {

// Reads the "pid" member and checks that it names an object of class `cls`.
std::string readPid(const json& j, ProtoClass cls) {
    std::string pid = read<std::string>(j, "pid");
    const ParsedPid parsed = parsePid(pid);
    if (parsed.cls != cls) {
        throw RegistryError("expected a " + std::string(protoClassName(cls)) + " PID, got '" + pid + "'");
    }
    return pid;
}

// =============================================================================
// Elements
// =============================================================================

json elementToJson(const ComponentElement& el) {
    json j{
        {"pid", el.pid()},
        {"name", el.name()},
        {"geometry", el.geometry()},
        {"content", el.content()},
        {"z_order", el.zOrder()},
        {"style",
         {
             {"color", el.style().color},
             {"background_color", el.style().backgroundColor},
             {"border_color", el.style().borderColor},
             {"border_width", el.style().borderWidth},
         }},
    };
    if (el.kind() == ElementKind::Text) {
        const auto& text = static_cast<const TextElement&>(el);
        j["font_family"] = text.fontFamily();
        j["font_size"] = text.fontSize();
        j["alignment"] = textAlignmentName(text.alignment());
        j["word_wrap"] = text.wordWrap();
    } else {
        j["keep_aspect_ratio"] = static_cast<const ImageElement&>(el).keepAspectRatio();
    }
    return j;
}

std::unique_ptr<ComponentElement> elementFromJson(const json& j) {
    requireObject(j, "element");
    const std::string pid = read<std::string>(j, "pid");
    std::unique_ptr<ComponentElement> el;
    switch (parsePid(pid).cls) {
        case ProtoClass::TextElement: {
            auto text = std::make_unique<TextElement>(pid);
            text->setFontFamily(readOr<std::string>(j, "font_family", text->fontFamily()));
            text->setFontSize(readOr<UnitStr>(j, "font_size", text->fontSize()));
            if (j.contains("alignment")) text->setAlignment(textAlignmentFromString(read<std::string>(j, "alignment")));
            text->setWordWrap(readOr<bool>(j, "word_wrap", text->wordWrap()));
            el = std::move(text);
            break;
        }
        case ProtoClass::ImageElement: {
            auto image = std::make_unique<ImageElement>(pid);
            image->setKeepAspectRatio(readOr<bool>(j, "keep_aspect_ratio", image->keepAspectRatio()));
            el = std::move(image);
            break;
        }
        default:
            throw ParseError("'" + pid + "' is not a text or image element");
    }

    el->setName(readOr<std::string>(j, "name", ""));
    if (j.contains("geometry")) el->setGeometry(read<UnitStrGeometry>(j, "geometry"));
    el->setContent(readOr<std::string>(j, "content", ""));
    el->setZOrder(readOr<int>(j, "z_order", 0));
    if (j.contains("style")) {
        const json& s = j.at("style");
        requireObject(s, "element style");
        ElementStyle style;
        style.color = readOr<std::uint32_t>(s, "color", style.color);
        style.backgroundColor = readOr<std::uint32_t>(s, "background_color", style.backgroundColor);
        style.borderColor = readOr<std::uint32_t>(s, "border_color", style.borderColor);
        style.borderWidth = readOr<UnitStr>(s, "border_width", style.borderWidth);
        el->setStyle(style);
    }
    return el;
}

// =============================================================================
// Component content shared by templates and instances
// =============================================================================

void readComponentContent(const json& j, ComponentBase& component) {
    component.setName(readOr<std::string>(j, "name", component.name()));
    if (j.contains("geometry")) component.setGeometry(read<UnitStrGeometry>(j, "geometry"));

    ComponentStyle style;
    style.backgroundColor = readOr<std::uint32_t>(j, "background_color", style.backgroundColor);
    style.borderColor = readOr<std::uint32_t>(j, "border_color", style.borderColor);
    style.borderWidth = readOr<UnitStr>(j, "border_width", style.borderWidth);
    style.cornerRadius = readOr<UnitStr>(j, "corner_radius", style.cornerRadius);
    style.roundedCorners = readOr<bool>(j, "rounded_corners", style.roundedCorners);
    style.backgroundImagePath = readOr<std::string>(j, "background_image_path", "");
    component.setStyle(style);

    if (!j.contains("elements")) return;
    const json& elements = j.at("elements");
    if (!elements.is_array()) throw ParseError("'elements' must be an array");
    for (const auto& e : elements) component.insertElement(elementFromJson(e));
}

} // namespace

// =============================================================================
// Components
// =============================================================================

json componentToJson(const ComponentBase& component) {
    const ComponentStyle& style = component.style();
    json j{
        {"pid", component.pid()},
        {"name", component.name()},
        {"geometry", component.geometry()},
        {"background_color", style.backgroundColor},
        {"border_color", style.borderColor},
        {"border_width", style.borderWidth},
        {"corner_radius", style.cornerRadius},
        {"rounded_corners", style.roundedCorners},
        {"background_image_path", style.backgroundImagePath},
    };
    json elements = json::array();
    for (const ComponentElement* el : component.elements()) elements.push_back(elementToJson(*el));
    j["elements"] = std::move(elements);

    if (component.protoClass() == ProtoClass::ComponentInstance) {
        const auto& instance = static_cast<const ComponentInstance&>(component);
        j["template_pid"] = instance.templatePid();
        j["data"] = instance.data();
        if (instance.dataRow()) {
            j["data_row"] = {{"dataset", instance.dataRow()->dataset}, {"line", instance.dataRow()->line}};
        }
    }
    return j;
}

std::unique_ptr<ComponentTemplate> componentTemplateFromJson(const json& j) {
    requireObject(j, "component template");
    auto component = std::make_unique<ComponentTemplate>(readPid(j, ProtoClass::ComponentTemplate));
    readComponentContent(j, *component);
    return component;
}

std::shared_ptr<ComponentInstance> componentInstanceFromJson(const json& j) {
    requireObject(j, "component instance");
    auto instance = std::make_shared<ComponentInstance>(readPid(j, ProtoClass::ComponentInstance));
    readComponentContent(j, *instance);
    instance->setTemplatePid(readOr<std::string>(j, "template_pid", ""));

    DataRecord data = readOr<DataRecord>(j, "data", DataRecord{});
    std::optional<DataRowRef> row;
    if (j.contains("data_row") && !j.at("data_row").is_null()) {
        const json& r = j.at("data_row");
        requireObject(r, "data_row");
        row = DataRowRef{read<std::string>(r, "dataset"), read<std::size_t>(r, "line")};
    }
    if (!data.empty() || row) instance->applyData(data, std::move(row));
    return instance;
}

// =============================================================================
// Layouts
// =============================================================================

json layoutToJson(const LayoutTemplate& layout, bool embedTemplates) {
    const Margins& m = layout.margins();
    json j{
        {"pid", layout.pid()},
        {"name", layout.name()},
        {"page_size", layout.pageSize()},
        {"landscape", layout.landscape()},
        {"page_geometry", layout.pageGeometry()},
        {"margin_top", m.top},
        {"margin_bottom", m.bottom},
        {"margin_left", m.left},
        {"margin_right", m.right},
        {"spacing_x", layout.spacing().x},
        {"spacing_y", layout.spacing().y},
        {"rows", layout.rows()},
        {"columns", layout.columns()},
        {"pagination_policy", layout.paginationPolicy()},
        {"pagination_params", layout.paginationParams()},
        {"lock_at", layout.lockAt()},
    };

    json slots = json::array();
    for (const LayoutSlot* slot : layout.slots()) {
        json s{
            {"pid", slot->pid()},
            {"row", slot->row()},
            {"column", slot->column()},
            {"geometry", slot->geometry()},
            {"template_pid", slot->templatePid()},
            {"mount", mountModeName(slot->mountMode())},
        };
        if (slot->hasContent()) {
            s["content"] = componentToJson(*slot->content());
        } else if (embedTemplates && slot->hasTemplate() && layout.registry()) {
            if (const auto* source = layout.registry()->get<ComponentTemplate>(slot->templatePid())) {
                s["content"] = componentToJson(*source);
            }
        }
        slots.push_back(std::move(s));
    }
    j["slots"] = std::move(slots);
    return j;
}

std::unique_ptr<LayoutTemplate> layoutFromJson(const json& j, TemplateLibrary* library) {
    requireObject(j, "layout template");
    auto layout = std::make_unique<LayoutTemplate>(readPid(j, ProtoClass::LayoutTemplate));
    layout->setName(readOr<std::string>(j, "name", layout->name()));
    layout->setLandscape(readOr<bool>(j, "landscape", false));
    layout->setPageSize(readOr<std::string>(j, "page_size", LayoutTemplate::kDefaultPageSize));
    if (j.contains("page_geometry")) layout->setPageGeometry(read<UnitStrGeometry>(j, "page_geometry"));

    Margins margins;
    margins.top = readOr<UnitStr>(j, "margin_top", margins.top);
    margins.bottom = readOr<UnitStr>(j, "margin_bottom", margins.bottom);
    margins.left = readOr<UnitStr>(j, "margin_left", margins.left);
    margins.right = readOr<UnitStr>(j, "margin_right", margins.right);
    layout->setMargins(margins);

    Spacing spacing;
    spacing.x = readOr<UnitStr>(j, "spacing_x", spacing.x);
    spacing.y = readOr<UnitStr>(j, "spacing_y", spacing.y);
    layout->setSpacing(spacing);

    const auto rows = readOr<std::size_t>(j, "rows", LayoutTemplate::kDefaultRows);
    const auto columns = readOr<std::size_t>(j, "columns", LayoutTemplate::kDefaultColumns);
    layout->setGrid(rows, columns);

    json params = readOr<json>(j, "pagination_params", json::object());
    if (!params.is_object()) throw ParseError("'pagination_params' must be an object");
    layout->setPaginationPolicy(readOr<std::string>(j, "pagination_policy", "InterleaveDatasets"), std::move(params));
    layout->setLockAt(readOr<std::size_t>(j, "lock_at", 0));

    if (!j.contains("slots")) return layout;
    const json& slots = j.at("slots");
    if (!slots.is_array()) throw ParseError("'slots' must be an array");
    for (const auto& s : slots) {
        requireObject(s, "slot");
        const auto row = read<std::size_t>(s, "row");
        const auto column = read<std::size_t>(s, "column");
        if (row >= rows || column >= columns) {
            throw ParseError("slot (" + std::to_string(row) + ", " + std::to_string(column) + ") outside the "
                + std::to_string(rows) + "x" + std::to_string(columns) + " grid");
        }
        auto slot = std::make_unique<LayoutSlot>(row, column, readPid(s, ProtoClass::LayoutSlot));
        slot->setTemplatePid(readOr<std::string>(s, "template_pid", ""));
        slot->setMountMode(mountModeFromString(readOr<std::string>(s, "mount", "snapshot")));

        if (s.contains("content") && !s.at("content").is_null()) {
            const json& content = s.at("content");
            const std::string contentPid = read<std::string>(content, "pid");
            switch (parsePid(contentPid).cls) {
                case ProtoClass::ComponentTemplate:
                    if (!library) throw ParseError("slot embeds template '" + contentPid + "' but no library was given");
                    if (!library->component(contentPid)) library->addComponent(componentTemplateFromJson(content));
                    if (!slot->hasTemplate()) slot->setTemplatePid(contentPid);
                    break;
                case ProtoClass::ComponentInstance:
                    slot->setContent(componentInstanceFromJson(content));
                    break;
                default:
                    throw ParseError("slot content '" + contentPid + "' is neither a template nor an instance");
            }
        }
        layout->adoptSlot(std::move(slot));
    }
    return layout;
}

// =============================================================================
// TemplateLibrary
// =============================================================================

TemplateLibrary::TemplateLibrary(ProtoRegistry& registry) : registry_(registry) {}

TemplateLibrary::~TemplateLibrary() = default;

ComponentTemplate& TemplateLibrary::addComponent(std::unique_ptr<ComponentTemplate> component) {
    registry_.registerObject(*component);
    components_.push_back(std::move(component));
    PROTOLAYOUT_LOG_DEBUG("library: component %s", components_.back()->pid().c_str());
    return *components_.back();
}

LayoutTemplate& TemplateLibrary::addLayout(std::unique_ptr<LayoutTemplate> layout) {
    registry_.registerObject(*layout);
    layouts_.push_back(std::move(layout));
    PROTOLAYOUT_LOG_DEBUG("library: layout %s", layouts_.back()->pid().c_str());
    return *layouts_.back();
}

ComponentTemplate& TemplateLibrary::loadComponent(const json& j) {
    return addComponent(componentTemplateFromJson(j));
}

LayoutTemplate& TemplateLibrary::loadLayout(const json& j) {
    return addLayout(layoutFromJson(j, this));
}

ProtoObject& TemplateLibrary::loadFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw Error("cannot open template file '" + path + "'");
    json doc;
    try {
        doc = json::parse(in);
    } catch (const json::parse_error& e) {
        throw ParseError(path + ": " + e.what());
    }
    requireObject(doc, path.c_str());
    const std::string pid = read<std::string>(doc, "pid");
    switch (parsePid(pid).cls) {
        case ProtoClass::ComponentTemplate:
            return loadComponent(doc);
        case ProtoClass::LayoutTemplate:
            return loadLayout(doc);
        default:
            throw ParseError(path + ": unsupported document type '" + pid + "'");
    }
}

ComponentTemplate* TemplateLibrary::component(std::string_view pid) const {
    auto it = std::find_if(components_.begin(), components_.end(),
                           [pid](const std::unique_ptr<ComponentTemplate>& c) { return c->pid() == pid; });
    return it == components_.end() ? nullptr : it->get();
}

LayoutTemplate* TemplateLibrary::layout(std::string_view pid) const {
    auto it = std::find_if(layouts_.begin(), layouts_.end(),
                           [pid](const std::unique_ptr<LayoutTemplate>& l) { return l->pid() == pid; });
    return it == layouts_.end() ? nullptr : it->get();
}

std::vector<ComponentTemplate*> TemplateLibrary::components() const {
    std::vector<ComponentTemplate*> out;
    out.reserve(components_.size());
    for (const auto& c : components_) out.push_back(c.get());
    return out;
}

std::vector<LayoutTemplate*> TemplateLibrary::layouts() const {
    std::vector<LayoutTemplate*> out;
    out.reserve(layouts_.size());
    for (const auto& l : layouts_) out.push_back(l.get());
    return out;
}

} // namespace protolayout
