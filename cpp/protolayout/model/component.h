#ifndef PROTOLAYOUT_MODEL_COMPONENT_H
#define PROTOLAYOUT_MODEL_COMPONENT_H

#include "protolayout/model/component_element.h"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace protolayout {

class LayoutSlot;
class ProtoRegistry;

struct ComponentStyle {
    std::uint32_t backgroundColor = kColorWhite;
    std::uint32_t borderColor = kColorBlack;
    UnitStr borderWidth = UnitStr::zero(Unit::In);
    UnitStr cornerRadius = UnitStr::zero(Unit::In);
    bool roundedCorners = false;
    std::string backgroundImagePath;

    bool operator==(const ComponentStyle& other) const noexcept {
        return backgroundColor == other.backgroundColor && borderColor == other.borderColor
            && borderWidth == other.borderWidth && cornerRadius == other.cornerRadius
            && roundedCorners == other.roundedCorners && backgroundImagePath == other.backgroundImagePath;
    }
    bool operator!=(const ComponentStyle& other) const noexcept { return !(*this == other); }
};

// Shared state of component templates and their instances: name, size,
// style and a z-ordered element list.
class ComponentBase : public ProtoObject {
public:
    const std::string& name() const noexcept { return name_; }
    void setName(std::string name) { name_ = std::move(name); }

    const UnitStrGeometry& geometry() const noexcept { return geometry_; }
    void setGeometry(const UnitStrGeometry& geometry) { geometry_ = geometry; }

    const ComponentStyle& style() const noexcept { return style_; }
    void setStyle(const ComponentStyle& style) { style_ = style; }

    // Elements in paint order (ascending z).
    std::vector<ComponentElement*> elements() const;
    std::size_t elementCount() const noexcept { return elements_.size(); }

    // Places the element on top and registers it alongside this component.
    ComponentElement& addElement(std::unique_ptr<ComponentElement> element);
    // Keeps the element's z order; used when loading documents.
    ComponentElement& insertElement(std::unique_ptr<ComponentElement> element);
    // Returns nullptr if the PID is not an element of this component.
    std::unique_ptr<ComponentElement> removeElement(std::string_view pid);

    ComponentElement* element(std::string_view pid) const;
    ComponentElement* elementByName(std::string_view name) const;

    void bringToFront(std::string_view pid);
    void sendToBack(std::string_view pid);
    // Moves the element to `index` in paint order (clamped).
    void reorder(std::string_view pid, std::size_t index);

    // Names of '@' elements, in paint order.
    std::vector<std::string> boundFields() const;

    void forEachChild(const std::function<void(ProtoObject&)>& fn) override;

protected:
    ComponentBase(ProtoClass cls, std::string pid);

    // Copies name, geometry, style and fresh-PID copies of all elements.
    void copyContentFrom(const ComponentBase& source);
    bool sameContent(const ComponentBase& other) const;
    void applyDataToElements(const DataRecord& record);

private:
    std::vector<std::unique_ptr<ComponentElement>>::iterator findElement(std::string_view pid);
    void sortByZ();
    void normalizeZOrder();

    std::string name_;
    UnitStrGeometry geometry_;
    ComponentStyle style_;
    std::vector<std::unique_ptr<ComponentElement>> elements_;
};

class ComponentTemplate final : public ComponentBase {
public:
    explicit ComponentTemplate(std::string pid = {});

    std::unique_ptr<ProtoObject> cloneFresh() const override;

    bool operator==(const ComponentTemplate& other) const { return sameContent(other); }
    bool operator!=(const ComponentTemplate& other) const { return !sameContent(other); }
};

// Identifies the data row an instance was merged from.
struct DataRowRef {
    std::string dataset;
    std::size_t line = 0;

    bool operator==(const DataRowRef& other) const noexcept {
        return dataset == other.dataset && line == other.line;
    }
};

// A copy of a template placed into one layout slot.
//
// Instances never share elements with their template. Unless their slot is in
// live-mount mode they are snapshots: later template edits do not reach them.
class ComponentInstance final : public ComponentBase {
public:
    explicit ComponentInstance(std::string pid = {});

    // Fresh-PID snapshot of `source`, unregistered.
    static std::shared_ptr<ComponentInstance> fromTemplate(const ComponentTemplate& source);

    const std::string& templatePid() const noexcept { return templatePid_; }
    void setTemplatePid(std::string pid) { templatePid_ = std::move(pid); }

    LayoutSlot* slot() const noexcept { return slot_; }

    // Re-copies the template's content, keeping PID and merged data.
    void resync(const ComponentTemplate& source);

    // Fills '@' elements from the record and remembers the source row.
    void applyData(const DataRecord& record, std::optional<DataRowRef> row = std::nullopt);
    const DataRecord& data() const noexcept { return data_; }
    const std::optional<DataRowRef>& dataRow() const noexcept { return dataRow_; }
    bool isMerged() const noexcept { return dataRow_.has_value(); }

    std::unique_ptr<ProtoObject> cloneFresh() const override;

    bool operator==(const ComponentInstance& other) const;
    bool operator!=(const ComponentInstance& other) const { return !(*this == other); }

protected:
    std::shared_ptr<ProtoObject> detachReferences() override;

private:
    friend class LayoutSlot;

    std::string templatePid_;
    LayoutSlot* slot_ = nullptr;
    DataRecord data_;
    std::optional<DataRowRef> dataRow_;
};

// Snapshot of `source`, registered into `registry` when one is given.
std::shared_ptr<ComponentInstance> instantiate(const ComponentTemplate& source, ProtoRegistry* registry);

} // namespace protolayout

#endif // PROTOLAYOUT_MODEL_COMPONENT_H
