#include "protolayout/model/component_element.h"

#include "protolayout/core/errors.h"
#include "protolayout/core/string_utils.h"

#include <utility>

namespace protolayout {

const char* textAlignmentName(TextAlignment alignment) noexcept {
    switch (alignment) {
        case TextAlignment::Left: return "left";
        case TextAlignment::Center: return "center";
        case TextAlignment::Right: return "right";
    }
    return "left";
}

TextAlignment textAlignmentFromString(const std::string& name) {
    const std::string n = toLower(name);
    if (n == "left") return TextAlignment::Left;
    if (n == "center") return TextAlignment::Center;
    if (n == "right") return TextAlignment::Right;
    throw ParseError("unknown text alignment '" + name + "'");
}

// =============================================================================
// ComponentElement
// =============================================================================

ComponentElement::ComponentElement(ProtoClass cls, std::string pid)
    : ProtoObject(cls, std::move(pid)),
      geometry_(UnitStrGeometry::fromSize(UnitStr::fromNumber(1.0, Unit::In), UnitStr::fromNumber(0.5, Unit::In))) {}

bool ComponentElement::applyData(const DataRecord& record) {
    if (!isBound()) return false;
    auto it = record.find(name_);
    if (it == record.end()) return false;
    content_ = it->second;
    return true;
}

bool ComponentElement::equals(const ComponentElement& other) const {
    return pid() == other.pid() && protoClass() == other.protoClass() && name_ == other.name_
        && geometry_ == other.geometry_ && content_ == other.content_ && zOrder_ == other.zOrder_
        && style_ == other.style_;
}

void ComponentElement::copyFrom(const ComponentElement& other) {
    name_ = other.name_;
    geometry_ = other.geometry_;
    content_ = other.content_;
    zOrder_ = other.zOrder_;
    style_ = other.style_;
}

// =============================================================================
// TextElement
// =============================================================================

TextElement::TextElement(std::string pid) : ComponentElement(ProtoClass::TextElement, std::move(pid)) {}

std::unique_ptr<ProtoObject> TextElement::cloneFresh() const {
    auto copy = std::make_unique<TextElement>();
    copy->copyFrom(*this);
    copy->fontFamily_ = fontFamily_;
    copy->fontSize_ = fontSize_;
    copy->alignment_ = alignment_;
    copy->wordWrap_ = wordWrap_;
    return copy;
}

bool TextElement::equals(const ComponentElement& other) const {
    if (!ComponentElement::equals(other)) return false;
    const auto& text = static_cast<const TextElement&>(other);
    return fontFamily_ == text.fontFamily_ && fontSize_ == text.fontSize_ && alignment_ == text.alignment_
        && wordWrap_ == text.wordWrap_;
}

// =============================================================================
// ImageElement
// =============================================================================

ImageElement::ImageElement(std::string pid) : ComponentElement(ProtoClass::ImageElement, std::move(pid)) {}

std::unique_ptr<ProtoObject> ImageElement::cloneFresh() const {
    auto copy = std::make_unique<ImageElement>();
    copy->copyFrom(*this);
    copy->keepAspectRatio_ = keepAspectRatio_;
    return copy;
}

bool ImageElement::equals(const ComponentElement& other) const {
    if (!ComponentElement::equals(other)) return false;
    return keepAspectRatio_ == static_cast<const ImageElement&>(other).keepAspectRatio_;
}

} // namespace protolayout
