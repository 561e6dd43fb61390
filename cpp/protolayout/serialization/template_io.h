#ifndef PROTOLAYOUT_SERIALIZATION_TEMPLATE_IO_H
#define PROTOLAYOUT_SERIALIZATION_TEMPLATE_IO_H

#include "protolayout/model/component.h"
#include "protolayout/model/layout_template.h"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace protolayout {

class ProtoRegistry;
class TemplateLibrary;

// Component templates and instances. Elements are tagged by their PID prefix
// (te text, ie image). Instances add template_pid, data and data_row.
nlohmann::json componentToJson(const ComponentBase& component);
// Throws ParseError on a malformed document and RegistryError on an unknown
// PID prefix or a PID of the wrong class.
std::unique_ptr<ComponentTemplate> componentTemplateFromJson(const nlohmann::json& j);
std::shared_ptr<ComponentInstance> componentInstanceFromJson(const nlohmann::json& j);

// With embedTemplates, a slot without content carries the component template it
// points at (resolved through the layout's registry) as its "content".
nlohmann::json layoutToJson(const LayoutTemplate& layout, bool embedTemplates = false);
// Embedded component templates are handed to `library`; a document that embeds
// templates without a library to receive them is rejected with ParseError.
std::unique_ptr<LayoutTemplate> layoutFromJson(const nlohmann::json& j, TemplateLibrary* library = nullptr);

// Owns loaded templates and keeps them registered in one registry, so slot
// template PIDs resolve for pagination and export.
class TemplateLibrary {
public:
    explicit TemplateLibrary(ProtoRegistry& registry);
    ~TemplateLibrary();

    TemplateLibrary(const TemplateLibrary&) = delete;
    TemplateLibrary& operator=(const TemplateLibrary&) = delete;

    ProtoRegistry& registry() noexcept { return registry_; }

    // Registers and takes ownership. Throws RegistryError on a duplicate PID.
    ComponentTemplate& addComponent(std::unique_ptr<ComponentTemplate> component);
    LayoutTemplate& addLayout(std::unique_ptr<LayoutTemplate> layout);

    ComponentTemplate& loadComponent(const nlohmann::json& j);
    LayoutTemplate& loadLayout(const nlohmann::json& j);
    // Reads a component (ct) or layout (lt) document. Throws Error when the file
    // cannot be read, ParseError on bad JSON or an unsupported document type.
    ProtoObject& loadFile(const std::string& path);

    ComponentTemplate* component(std::string_view pid) const;
    LayoutTemplate* layout(std::string_view pid) const;
    std::vector<ComponentTemplate*> components() const;
    std::vector<LayoutTemplate*> layouts() const;

private:
    ProtoRegistry& registry_;
    std::vector<std::unique_ptr<ComponentTemplate>> components_;
    std::vector<std::unique_ptr<LayoutTemplate>> layouts_;
};

} // namespace protolayout

#endif // PROTOLAYOUT_SERIALIZATION_TEMPLATE_IO_H
