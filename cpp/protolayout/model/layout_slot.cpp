#include "protolayout/model/layout_slot.h"

#include "protolayout/core/errors.h"
#include "protolayout/core/logging.h"
#include "protolayout/registry/proto_registry.h"

#include <utility>

namespace protolayout {

const char* mountModeName(MountMode mode) noexcept {
    switch (mode) {
        case MountMode::Snapshot: return "snapshot";
        case MountMode::LiveMount: return "live";
    }
    return "snapshot";
}

MountMode mountModeFromString(const std::string& name) {
    if (name == "snapshot") return MountMode::Snapshot;
    if (name == "live") return MountMode::LiveMount;
    throw ParseError("unknown mount mode '" + name + "'");
}

LayoutSlot::LayoutSlot(std::size_t row, std::size_t column, std::string pid)
    : ProtoObject(ProtoClass::LayoutSlot, std::move(pid)), row_(row), column_(column) {}

LayoutSlot::~LayoutSlot() {
    if (content_) content_->slot_ = nullptr;
}

void LayoutSlot::setGeometry(const UnitStrGeometry& geometry) {
    geometry_ = geometry;
    if (content_) content_->setGeometry(geometry_);
}

void LayoutSlot::setContent(std::shared_ptr<ComponentInstance> instance) {
    if (instance == content_) return;
    if (instance && instance->slot_ && instance->slot_ != this) {
        throw ConfigurationError("instance '" + instance->pid() + "' already occupies slot '"
            + instance->slot_->pid() + "'");
    }
    if (instance && registry() && instance->registry() != registry()) registry()->registerObject(*instance);
    clearContent();
    if (!instance) return;
    content_ = std::move(instance);
    content_->slot_ = this;
    content_->setGeometry(geometry_);
    if (templatePid_.empty()) templatePid_ = content_->templatePid();
}

void LayoutSlot::clearContent() {
    if (!content_) return;
    std::shared_ptr<ComponentInstance> old = std::move(content_);
    content_.reset();
    old->slot_ = nullptr;
    if (old->registry()) old->registry()->deregister(old->pid());
}

bool LayoutSlot::refresh(const ComponentTemplate& source) {
    if (mountMode_ != MountMode::LiveMount || !content_) return false;
    if (content_->templatePid() != source.pid()) return false;
    content_->resync(source);
    content_->setGeometry(geometry_);
    PROTOLAYOUT_LOG_DEBUG("slot %s refreshed from %s", pid().c_str(), source.pid().c_str());
    return true;
}

void LayoutSlot::forEachChild(const std::function<void(ProtoObject&)>& fn) {
    if (content_) fn(*content_);
}

std::unique_ptr<ProtoObject> LayoutSlot::cloneFresh() const {
    auto copy = std::make_unique<LayoutSlot>(row_, column_);
    copy->geometry_ = geometry_;
    copy->templatePid_ = templatePid_;
    copy->mountMode_ = mountMode_;
    if (content_) {
        std::unique_ptr<ProtoObject> cloned = content_->cloneFresh();
        std::shared_ptr<ComponentInstance> instance(static_cast<ComponentInstance*>(cloned.release()));
        instance->slot_ = copy.get();
        copy->content_ = std::move(instance);
    }
    return copy;
}

bool LayoutSlot::sameSlot(const LayoutSlot& other) const {
    if (pid() != other.pid() || row_ != other.row_ || column_ != other.column_ || geometry_ != other.geometry_
        || templatePid_ != other.templatePid_ || mountMode_ != other.mountMode_) {
        return false;
    }
    if (!content_ || !other.content_) return content_ == other.content_;
    return *content_ == *other.content_;
}

std::shared_ptr<ComponentInstance> LayoutSlot::releaseContent(ComponentInstance& instance) {
    if (content_.get() != &instance) return nullptr;
    instance.slot_ = nullptr;
    std::shared_ptr<ComponentInstance> out = std::move(content_);
    content_.reset();
    return out;
}

} // namespace protolayout
