#ifndef PROTOLAYOUT_MODEL_LAYOUT_SLOT_H
#define PROTOLAYOUT_MODEL_LAYOUT_SLOT_H

#include "protolayout/model/component.h"
#include "protolayout/registry/proto_object.h"
#include "protolayout/units/unit_str_geometry.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace protolayout {

enum class MountMode : std::uint8_t {
    Snapshot = 0,   // content is a frozen copy of the template
    LiveMount = 1,  // content follows template edits on refresh()
};

const char* mountModeName(MountMode mode) noexcept;
MountMode mountModeFromString(const std::string& name);

// One grid cell of a layout page.
//
// The slot knows which component template it shows (templatePid) and may hold
// one component instance as content. Content always takes the slot's geometry.
class LayoutSlot final : public ProtoObject {
public:
    explicit LayoutSlot(std::size_t row = 0, std::size_t column = 0, std::string pid = {});
    ~LayoutSlot() override;

    std::size_t row() const noexcept { return row_; }
    std::size_t column() const noexcept { return column_; }

    const UnitStrGeometry& geometry() const noexcept { return geometry_; }
    // Moves and resizes the content along with the slot.
    void setGeometry(const UnitStrGeometry& geometry);

    const std::string& templatePid() const noexcept { return templatePid_; }
    void setTemplatePid(std::string pid) { templatePid_ = std::move(pid); }
    bool hasTemplate() const noexcept { return !templatePid_.empty(); }

    MountMode mountMode() const noexcept { return mountMode_; }
    void setMountMode(MountMode mode) noexcept { mountMode_ = mode; }

    const std::shared_ptr<ComponentInstance>& content() const noexcept { return content_; }
    bool hasContent() const noexcept { return content_ != nullptr; }

    // Registers the instance alongside a registered slot and gives it the
    // slot's geometry. Throws ConfigurationError if the instance already sits
    // in another slot.
    void setContent(std::shared_ptr<ComponentInstance> instance);
    // Releases the content and deregisters it.
    void clearContent();

    // Live-mounted content is re-copied from `source`. Returns true if refreshed.
    bool refresh(const ComponentTemplate& source);

    void forEachChild(const std::function<void(ProtoObject&)>& fn) override;
    std::unique_ptr<ProtoObject> cloneFresh() const override;

    // Same cell, geometry, template and mount mode (content compared by value).
    bool sameSlot(const LayoutSlot& other) const;

private:
    friend class ComponentInstance;
    friend class LayoutTemplate;

    std::shared_ptr<ComponentInstance> releaseContent(ComponentInstance& instance);

    std::size_t row_;
    std::size_t column_;
    UnitStrGeometry geometry_;
    std::string templatePid_;
    MountMode mountMode_ = MountMode::Snapshot;
    std::shared_ptr<ComponentInstance> content_;
};

} // namespace protolayout

#endif // PROTOLAYOUT_MODEL_LAYOUT_SLOT_H
