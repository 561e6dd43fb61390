#include "protolayout/model/layout_template.h"

#include "protolayout/core/errors.h"
#include "protolayout/core/logging.h"
#include "protolayout/model/component.h"
#include "protolayout/registry/proto_registry.h"

#include <stdexcept>
#include <utility>

namespace protolayout {

namespace {

constexpr const char* kDefaultPolicy = "InterleaveDatasets";
constexpr const char* kDuplexPolicy = "DuplexInterleave";

} // namespace

LayoutTemplate::LayoutTemplate(std::string pid)
    : ProtoObject(ProtoClass::LayoutTemplate, std::move(pid)), pageGeometry_(protolayout::pageGeometry(kDefaultPageSize)) {
    setGrid(kDefaultRows, kDefaultColumns);
}

LayoutTemplate::~LayoutTemplate() = default;

// =============================================================================
// Page
// =============================================================================

void LayoutTemplate::setPageGeometry(const UnitStrGeometry& geometry) {
    pageGeometry_ = geometry;
    rebuildSlotGeometry();
}

void LayoutTemplate::setPageSize(const std::string& name) {
    pageGeometry_ = protolayout::pageGeometry(name, landscape_, pageGeometry_.dpi());
    pageSize_ = name;
    rebuildSlotGeometry();
}

void LayoutTemplate::setLandscape(bool landscape) {
    if (landscape_ == landscape) return;
    landscape_ = landscape;
    pageGeometry_ = pageGeometry_.withSize(pageGeometry_.height(), pageGeometry_.width());
    rebuildSlotGeometry();
}

void LayoutTemplate::setMargins(const Margins& margins) {
    margins_ = margins;
    rebuildSlotGeometry();
}

void LayoutTemplate::setSpacing(const Spacing& spacing) {
    spacing_ = spacing;
    rebuildSlotGeometry();
}

void LayoutTemplate::applyPreset(const PrintPreset& preset) {
    landscape_ = preset.landscape;
    pageSize_ = std::string(preset.pageSize);
    pageGeometry_ = protolayout::pageGeometry(preset.pageSize, preset.landscape, pageGeometry_.dpi());
    margins_.top = UnitStr::fromNumber(preset.marginTop, Unit::In);
    margins_.bottom = UnitStr::fromNumber(preset.marginBottom, Unit::In);
    margins_.left = UnitStr::fromNumber(preset.marginLeft, Unit::In);
    margins_.right = UnitStr::fromNumber(preset.marginRight, Unit::In);
    spacing_.x = UnitStr::fromNumber(preset.spacingX, Unit::In);
    spacing_.y = UnitStr::fromNumber(preset.spacingY, Unit::In);
    lockAt_ = preset.lockAt;
    if (preset.duplex && paginationPolicy_ != kDuplexPolicy) {
        setPaginationPolicy(kDuplexPolicy);
    } else if (!preset.duplex && paginationPolicy_ == kDuplexPolicy) {
        setPaginationPolicy(kDefaultPolicy);
    }
    setGrid(preset.rows, preset.columns);
}

// =============================================================================
// Grid
// =============================================================================

void LayoutTemplate::setGrid(std::size_t rows, std::size_t columns) {
    std::vector<std::unique_ptr<LayoutSlot>> next;
    next.reserve(rows * columns);
    for (std::size_t r = 0; r < rows; ++r) {
        for (std::size_t c = 0; c < columns; ++c) {
            std::unique_ptr<LayoutSlot> kept;
            for (auto& existing : slots_) {
                if (existing && existing->row() == r && existing->column() == c) {
                    kept = std::move(existing);
                    break;
                }
            }
            if (!kept) {
                kept = std::make_unique<LayoutSlot>(r, c);
                if (registry()) registry()->registerObject(*kept);
            }
            next.push_back(std::move(kept));
        }
    }
    for (auto& leftover : slots_) {
        if (leftover) discardSlot(std::move(leftover));
    }
    slots_ = std::move(next);
    ++slotGeneration_;
    rows_ = rows;
    columns_ = columns;
    rebuildSlotGeometry();
    PROTOLAYOUT_LOG_DEBUG("layout %s grid %zux%zu", pid().c_str(), rows, columns);
}

std::vector<LayoutSlot*> LayoutTemplate::slots() const {
    std::vector<LayoutSlot*> out;
    out.reserve(slots_.size());
    for (const auto& s : slots_) out.push_back(s.get());
    return out;
}

LayoutSlot& LayoutTemplate::slot(std::size_t index) const {
    if (index >= slots_.size()) {
        throw std::out_of_range("slot index " + std::to_string(index) + " outside "
            + std::to_string(slots_.size()) + " slots");
    }
    return *slots_[index];
}

LayoutSlot& LayoutTemplate::slotAt(std::size_t row, std::size_t column) const {
    if (row >= rows_ || column >= columns_) {
        throw std::out_of_range("slot (" + std::to_string(row) + ", " + std::to_string(column)
            + ") outside " + std::to_string(rows_) + "x" + std::to_string(columns_) + " grid");
    }
    return *slots_[row * columns_ + column];
}

LayoutSlot* LayoutTemplate::slotAtPosition(const PixelPoint& point, double dpi) const {
    for (const auto& s : slots_) {
        if (s->geometry().contains(point, dpi)) return s.get();
    }
    return nullptr;
}

LayoutSlot* LayoutTemplate::findSlot(std::string_view pid) const {
    for (const auto& s : slots_) {
        if (s->pid() == pid) return s.get();
    }
    return nullptr;
}

UnitStr LayoutTemplate::slotWidth() const {
    if (columns_ == 0) return UnitStr::zero();
    const UnitStr gaps = spacing_.x * static_cast<double>(columns_ - 1);
    const UnitStr avail = pageGeometry_.width() - margins_.left - margins_.right - gaps;
    const UnitStr width = avail / static_cast<double>(columns_);
    return width.nanoInches() < 0 ? UnitStr::zero() : width.as(Unit::In);
}

UnitStr LayoutTemplate::slotHeight() const {
    if (rows_ == 0) return UnitStr::zero();
    const UnitStr gaps = spacing_.y * static_cast<double>(rows_ - 1);
    const UnitStr avail = pageGeometry_.height() - margins_.top - margins_.bottom - gaps;
    const UnitStr height = avail / static_cast<double>(rows_);
    return height.nanoInches() < 0 ? UnitStr::zero() : height.as(Unit::In);
}

bool LayoutTemplate::slotsMeetMinimum(const UnitStr& minWidth, const UnitStr& minHeight) const {
    return slotWidth() >= minWidth && slotHeight() >= minHeight;
}

// =============================================================================
// Content
// =============================================================================

void LayoutTemplate::assignTemplate(const ComponentTemplate& source) {
    assignTemplate(source.pid());
}

void LayoutTemplate::assignTemplate(const std::string& templatePid) {
    for (auto& s : slots_) s->setTemplatePid(templatePid);
}

void LayoutTemplate::clearContent() {
    for (auto& s : slots_) s->clearContent();
}

std::size_t LayoutTemplate::refreshLiveSlots() {
    if (!registry()) return 0;
    std::size_t refreshed = 0;
    for (auto& s : slots_) {
        if (s->mountMode() != MountMode::LiveMount || !s->hasContent()) continue;
        const auto* source = registry()->get<ComponentTemplate>(s->content()->templatePid());
        if (source && s->refresh(*source)) ++refreshed;
    }
    return refreshed;
}

void LayoutTemplate::setPaginationPolicy(std::string name, nlohmann::json params) {
    paginationPolicy_ = std::move(name);
    paginationParams_ = params.is_null() ? nlohmann::json::object() : std::move(params);
}

void LayoutTemplate::forEachChild(const std::function<void(ProtoObject&)>& fn) {
    for (auto& s : slots_) fn(*s);
}

std::unique_ptr<ProtoObject> LayoutTemplate::cloneFresh() const {
    auto copy = std::make_unique<LayoutTemplate>();
    copy->name_ = name_;
    copy->pageGeometry_ = pageGeometry_;
    copy->pageSize_ = pageSize_;
    copy->landscape_ = landscape_;
    copy->margins_ = margins_;
    copy->spacing_ = spacing_;
    copy->rows_ = rows_;
    copy->columns_ = columns_;
    copy->paginationPolicy_ = paginationPolicy_;
    copy->paginationParams_ = paginationParams_;
    copy->lockAt_ = lockAt_;
    copy->slots_.clear();
    copy->slots_.reserve(slots_.size());
    for (const auto& s : slots_) {
        std::unique_ptr<ProtoObject> cloned = s->cloneFresh();
        copy->slots_.emplace_back(static_cast<LayoutSlot*>(cloned.release()));
    }
    return copy;
}

bool LayoutTemplate::operator==(const LayoutTemplate& other) const {
    if (pid() != other.pid() || name_ != other.name_ || pageGeometry_ != other.pageGeometry_
        || pageSize_ != other.pageSize_ || landscape_ != other.landscape_ || margins_ != other.margins_
        || spacing_ != other.spacing_ || rows_ != other.rows_ || columns_ != other.columns_
        || paginationPolicy_ != other.paginationPolicy_ || paginationParams_ != other.paginationParams_
        || lockAt_ != other.lockAt_ || slots_.size() != other.slots_.size()) {
        return false;
    }
    for (std::size_t i = 0; i < slots_.size(); ++i) {
        if (!slots_[i]->sameSlot(*other.slots_[i])) return false;
    }
    return true;
}

void LayoutTemplate::adoptSlot(std::unique_ptr<LayoutSlot> slot) {
    if (slot->row() >= rows_ || slot->column() >= columns_) {
        throw std::out_of_range("slot (" + std::to_string(slot->row()) + ", " + std::to_string(slot->column())
            + ") outside " + std::to_string(rows_) + "x" + std::to_string(columns_) + " grid");
    }
    if (registry()) registry()->registerObject(*slot);
    const std::size_t index = slot->row() * columns_ + slot->column();
    std::unique_ptr<LayoutSlot> replaced = std::move(slots_[index]);
    slots_[index] = std::move(slot);
    discardSlot(std::move(replaced));
    ++slotGeneration_;
    rebuildSlotGeometry();
}

// =============================================================================
// Internals
// =============================================================================

void LayoutTemplate::rebuildSlotGeometry() {
    if (slots_.empty()) return;
    const UnitStr w = slotWidth();
    const UnitStr h = slotHeight();
    const double dpi = pageGeometry_.dpi();
    for (auto& s : slots_) {
        const UnitStr x = margins_.left + (spacing_.x + w) * static_cast<double>(s->column());
        const UnitStr y = margins_.top + (spacing_.y + h) * static_cast<double>(s->row());
        s->setGeometry(UnitStrGeometry::fromSize(w, h, dpi).withPosition(x.as(Unit::In), y.as(Unit::In)));
    }
}

void LayoutTemplate::discardSlot(std::unique_ptr<LayoutSlot> slot) {
    if (!slot) return;
    slot->clearContent();
    if (slot->registry()) slot->registry()->deregister(slot->pid());
}

} // namespace protolayout
