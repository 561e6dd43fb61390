#ifndef PROTOLAYOUT_MODEL_LAYOUT_TEMPLATE_H
#define PROTOLAYOUT_MODEL_LAYOUT_TEMPLATE_H

#include "protolayout/model/layout_slot.h"
#include "protolayout/model/page_sizes.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace protolayout {

class ComponentTemplate;

struct Margins {
    UnitStr top = UnitStr::fromNumber(0.5, Unit::In);
    UnitStr bottom = UnitStr::fromNumber(0.5, Unit::In);
    UnitStr left = UnitStr::fromNumber(0.25, Unit::In);
    UnitStr right = UnitStr::fromNumber(0.25, Unit::In);

    bool operator==(const Margins& o) const noexcept {
        return top == o.top && bottom == o.bottom && left == o.left && right == o.right;
    }
    bool operator!=(const Margins& o) const noexcept { return !(*this == o); }
};

struct Spacing {
    UnitStr x = UnitStr::zero(Unit::In);
    UnitStr y = UnitStr::zero(Unit::In);

    bool operator==(const Spacing& o) const noexcept { return x == o.x && y == o.y; }
    bool operator!=(const Spacing& o) const noexcept { return !(*this == o); }
};

// A printable page divided into a rows x columns grid of slots.
//
// Slot geometry is derived from page size, margins, spacing and grid shape;
// every setter that touches one of those re-derives it. Slots are stored
// row-major. Template PIDs referenced by slots are resolved through the
// registry this layout is registered in.
class LayoutTemplate final : public ProtoObject {
public:
    static constexpr std::size_t kDefaultRows = 3;
    static constexpr std::size_t kDefaultColumns = 3;
    static constexpr const char* kDefaultPageSize = "Letter";

    explicit LayoutTemplate(std::string pid = {});
    ~LayoutTemplate() override;

    const std::string& name() const noexcept { return name_; }
    void setName(std::string name) { name_ = std::move(name); }

    const UnitStrGeometry& pageGeometry() const noexcept { return pageGeometry_; }
    void setPageGeometry(const UnitStrGeometry& geometry);
    const std::string& pageSize() const noexcept { return pageSize_; }
    // Named size from the page table, honoring the current orientation.
    void setPageSize(const std::string& name);
    bool landscape() const noexcept { return landscape_; }
    void setLandscape(bool landscape);

    const Margins& margins() const noexcept { return margins_; }
    void setMargins(const Margins& margins);
    const Spacing& spacing() const noexcept { return spacing_; }
    void setSpacing(const Spacing& spacing);

    std::size_t rows() const noexcept { return rows_; }
    std::size_t columns() const noexcept { return columns_; }
    // Keeps slots whose cell survives, creates missing ones, drops the rest.
    void setGrid(std::size_t rows, std::size_t columns);
    // Duplex presets select DuplexInterleave; leaving one restores the default
    // policy. Policy params are kept when the policy does not change.
    void applyPreset(const PrintPreset& preset);

    std::size_t slotCount() const noexcept { return slots_.size(); }
    // Bumped whenever slots are created or dropped; slot pointers taken under
    // an older generation may dangle.
    std::uint64_t slotGeneration() const noexcept { return slotGeneration_; }
    std::vector<LayoutSlot*> slots() const;
    // Throws std::out_of_range outside the grid.
    LayoutSlot& slot(std::size_t index) const;
    LayoutSlot& slotAt(std::size_t row, std::size_t column) const;
    LayoutSlot* slotAtPosition(const PixelPoint& point, double dpi) const;
    LayoutSlot* findSlot(std::string_view pid) const;

    UnitStr slotWidth() const;
    UnitStr slotHeight() const;
    bool slotsMeetMinimum(const UnitStr& minWidth, const UnitStr& minHeight) const;

    // Points every slot at `source`.
    void assignTemplate(const ComponentTemplate& source);
    void assignTemplate(const std::string& templatePid);
    void clearContent();
    // Re-copies live-mounted slot content from registered templates.
    std::size_t refreshLiveSlots();

    const std::string& paginationPolicy() const noexcept { return paginationPolicy_; }
    const nlohmann::json& paginationParams() const noexcept { return paginationParams_; }
    void setPaginationPolicy(std::string name, nlohmann::json params = nlohmann::json::object());

    // Number of distinct component templates the slots may show; 0 = any.
    // Enforced when pagination is prepared.
    std::size_t lockAt() const noexcept { return lockAt_; }
    void setLockAt(std::size_t lockAt) noexcept { lockAt_ = lockAt; }

    void forEachChild(const std::function<void(ProtoObject&)>& fn) override;
    std::unique_ptr<ProtoObject> cloneFresh() const override;

    bool operator==(const LayoutTemplate& other) const;
    bool operator!=(const LayoutTemplate& other) const { return !(*this == other); }

    // Loader support: adopt a slot parsed from a document at its own cell.
    void adoptSlot(std::unique_ptr<LayoutSlot> slot);

private:
    void rebuildSlotGeometry();
    void discardSlot(std::unique_ptr<LayoutSlot> slot);

    std::string name_ = "New Layout";
    UnitStrGeometry pageGeometry_;
    std::string pageSize_ = kDefaultPageSize;
    bool landscape_ = false;
    Margins margins_;
    Spacing spacing_;
    std::size_t rows_ = 0;
    std::size_t columns_ = 0;
    std::string paginationPolicy_ = "InterleaveDatasets";
    nlohmann::json paginationParams_ = nlohmann::json::object();
    std::size_t lockAt_ = 0;
    std::uint64_t slotGeneration_ = 0;
    std::vector<std::unique_ptr<LayoutSlot>> slots_;
};

} // namespace protolayout

#endif // PROTOLAYOUT_MODEL_LAYOUT_TEMPLATE_H
