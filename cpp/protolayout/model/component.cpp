#include "protolayout/model/component.h"

#include "protolayout/model/layout_slot.h"
#include "protolayout/registry/proto_registry.h"

#include <algorithm>
#include <utility>

namespace protolayout {

namespace {

UnitStrGeometry defaultComponentGeometry() {
    return UnitStrGeometry::fromSize(UnitStr::fromNumber(2.5, Unit::In), UnitStr::fromNumber(3.5, Unit::In));
}

} // namespace

// =============================================================================
// ComponentBase
// =============================================================================

ComponentBase::ComponentBase(ProtoClass cls, std::string pid)
    : ProtoObject(cls, std::move(pid)), geometry_(defaultComponentGeometry()) {}

std::vector<ComponentElement*> ComponentBase::elements() const {
    std::vector<ComponentElement*> out;
    out.reserve(elements_.size());
    for (const auto& el : elements_) out.push_back(el.get());
    return out;
}

ComponentElement& ComponentBase::addElement(std::unique_ptr<ComponentElement> element) {
    int top = 0;
    for (const auto& el : elements_) top = std::max(top, el->zOrder() + kZOrderStep);
    element->setZOrder(top);
    return insertElement(std::move(element));
}

ComponentElement& ComponentBase::insertElement(std::unique_ptr<ComponentElement> element) {
    ComponentElement* raw = element.get();
    if (registry()) registry()->registerObject(*raw);
    elements_.push_back(std::move(element));
    sortByZ();
    return *raw;
}

std::unique_ptr<ComponentElement> ComponentBase::removeElement(std::string_view pid) {
    auto it = findElement(pid);
    if (it == elements_.end()) return nullptr;
    std::unique_ptr<ComponentElement> removed = std::move(*it);
    elements_.erase(it);
    if (removed->registry()) removed->registry()->deregister(removed->pid());
    return removed;
}

ComponentElement* ComponentBase::element(std::string_view pid) const {
    for (const auto& el : elements_) {
        if (el->pid() == pid) return el.get();
    }
    return nullptr;
}

ComponentElement* ComponentBase::elementByName(std::string_view name) const {
    for (const auto& el : elements_) {
        if (el->name() == name) return el.get();
    }
    return nullptr;
}

void ComponentBase::bringToFront(std::string_view pid) {
    reorder(pid, elements_.size());
}

void ComponentBase::sendToBack(std::string_view pid) {
    reorder(pid, 0);
}

void ComponentBase::reorder(std::string_view pid, std::size_t index) {
    auto it = findElement(pid);
    if (it == elements_.end()) return;
    std::unique_ptr<ComponentElement> moving = std::move(*it);
    elements_.erase(it);
    index = std::min(index, elements_.size());
    elements_.insert(elements_.begin() + static_cast<std::ptrdiff_t>(index), std::move(moving));
    normalizeZOrder();
}

std::vector<std::string> ComponentBase::boundFields() const {
    std::vector<std::string> out;
    for (const auto& el : elements_) {
        if (el->isBound()) out.push_back(el->name());
    }
    return out;
}

void ComponentBase::forEachChild(const std::function<void(ProtoObject&)>& fn) {
    for (auto& el : elements_) fn(*el);
}

void ComponentBase::copyContentFrom(const ComponentBase& source) {
    name_ = source.name_;
    geometry_ = source.geometry_;
    style_ = source.style_;
    elements_.clear();
    elements_.reserve(source.elements_.size());
    for (const auto& el : source.elements_) {
        std::unique_ptr<ProtoObject> copy = el->cloneFresh();
        elements_.emplace_back(static_cast<ComponentElement*>(copy.release()));
    }
}

bool ComponentBase::sameContent(const ComponentBase& other) const {
    if (pid() != other.pid() || name_ != other.name_ || geometry_ != other.geometry_ || style_ != other.style_) {
        return false;
    }
    if (elements_.size() != other.elements_.size()) return false;
    for (std::size_t i = 0; i < elements_.size(); ++i) {
        if (!elements_[i]->equals(*other.elements_[i])) return false;
    }
    return true;
}

void ComponentBase::applyDataToElements(const DataRecord& record) {
    for (auto& el : elements_) el->applyData(record);
}

std::vector<std::unique_ptr<ComponentElement>>::iterator ComponentBase::findElement(std::string_view pid) {
    return std::find_if(elements_.begin(), elements_.end(),
                        [pid](const std::unique_ptr<ComponentElement>& el) { return el->pid() == pid; });
}

void ComponentBase::sortByZ() {
    std::stable_sort(elements_.begin(), elements_.end(),
                     [](const std::unique_ptr<ComponentElement>& a, const std::unique_ptr<ComponentElement>& b) {
                         return a->zOrder() < b->zOrder();
                     });
}

void ComponentBase::normalizeZOrder() {
    int z = 0;
    for (auto& el : elements_) {
        el->setZOrder(z);
        z += kZOrderStep;
    }
}

// =============================================================================
// ComponentTemplate
// =============================================================================

ComponentTemplate::ComponentTemplate(std::string pid) : ComponentBase(ProtoClass::ComponentTemplate, std::move(pid)) {
    setName("New Template");
}

std::unique_ptr<ProtoObject> ComponentTemplate::cloneFresh() const {
    auto copy = std::make_unique<ComponentTemplate>();
    copy->copyContentFrom(*this);
    return copy;
}

// =============================================================================
// ComponentInstance
// =============================================================================

ComponentInstance::ComponentInstance(std::string pid) : ComponentBase(ProtoClass::ComponentInstance, std::move(pid)) {}

std::shared_ptr<ComponentInstance> ComponentInstance::fromTemplate(const ComponentTemplate& source) {
    auto instance = std::make_shared<ComponentInstance>();
    instance->copyContentFrom(source);
    instance->templatePid_ = source.pid();
    return instance;
}

void ComponentInstance::resync(const ComponentTemplate& source) {
    copyContentFrom(source);
    templatePid_ = source.pid();
    if (registry()) {
        ProtoRegistry* reg = registry();
        forEachChild([reg](ProtoObject& child) { reg->registerObject(child); });
    }
    applyDataToElements(data_);
}

void ComponentInstance::applyData(const DataRecord& record, std::optional<DataRowRef> row) {
    applyDataToElements(record);
    data_ = record;
    dataRow_ = std::move(row);
}

std::unique_ptr<ProtoObject> ComponentInstance::cloneFresh() const {
    auto copy = std::make_unique<ComponentInstance>();
    copy->copyContentFrom(*this);
    copy->templatePid_ = templatePid_;
    copy->data_ = data_;
    copy->dataRow_ = dataRow_;
    return copy;
}

bool ComponentInstance::operator==(const ComponentInstance& other) const {
    return sameContent(other) && templatePid_ == other.templatePid_ && data_ == other.data_
        && dataRow_ == other.dataRow_;
}

std::shared_ptr<ProtoObject> ComponentInstance::detachReferences() {
    if (!slot_) return nullptr;
    return slot_->releaseContent(*this);
}

std::shared_ptr<ComponentInstance> instantiate(const ComponentTemplate& source, ProtoRegistry* registry) {
    auto instance = ComponentInstance::fromTemplate(source);
    if (registry) registry->registerObject(*instance);
    return instance;
}

} // namespace protolayout
