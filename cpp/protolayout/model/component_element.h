#ifndef PROTOLAYOUT_MODEL_COMPONENT_ELEMENT_H
#define PROTOLAYOUT_MODEL_COMPONENT_ELEMENT_H

#include "protolayout/core/types.h"
#include "protolayout/registry/proto_object.h"
#include "protolayout/units/unit_str_geometry.h"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>

namespace protolayout {

// Field name -> value for one merged data row.
using DataRecord = std::map<std::string, std::string>;

enum class ElementKind : std::uint8_t {
    Text = 0,
    Image = 1,
};

enum class TextAlignment : std::uint8_t {
    Left = 0,
    Center = 1,
    Right = 2,
};

const char* textAlignmentName(TextAlignment alignment) noexcept;
TextAlignment textAlignmentFromString(const std::string& name);

struct ElementStyle {
    std::uint32_t color = kColorBlack;
    std::uint32_t backgroundColor = kColorTransparent;
    std::uint32_t borderColor = kColorBlack;
    UnitStr borderWidth = UnitStr::zero(Unit::Pt);

    bool operator==(const ElementStyle& other) const noexcept {
        return color == other.color && backgroundColor == other.backgroundColor
            && borderColor == other.borderColor && borderWidth == other.borderWidth;
    }
    bool operator!=(const ElementStyle& other) const noexcept { return !(*this == other); }
};

// A text or image item placed on a component.
//
// Elements whose name starts with '@' are bound to the CSV column of the same
// name; applyData() replaces their content from a merged row.
class ComponentElement : public ProtoObject {
public:
    ElementKind kind() const noexcept {
        return protoClass() == ProtoClass::TextElement ? ElementKind::Text : ElementKind::Image;
    }

    const std::string& name() const noexcept { return name_; }
    void setName(std::string name) { name_ = std::move(name); }

    const UnitStrGeometry& geometry() const noexcept { return geometry_; }
    void setGeometry(const UnitStrGeometry& geometry) { geometry_ = geometry; }

    // Text for text elements, a file path for image elements.
    const std::string& content() const noexcept { return content_; }
    void setContent(std::string content) { content_ = std::move(content); }

    int zOrder() const noexcept { return zOrder_; }
    void setZOrder(int z) noexcept { zOrder_ = z; }

    const ElementStyle& style() const noexcept { return style_; }
    void setStyle(const ElementStyle& style) { style_ = style; }

    bool isBound() const noexcept { return !name_.empty() && name_.front() == kBindingPrefix; }
    // Returns true when the record carried a value for this element.
    bool applyData(const DataRecord& record);

    virtual bool equals(const ComponentElement& other) const;

protected:
    ComponentElement(ProtoClass cls, std::string pid);

    void copyFrom(const ComponentElement& other);

private:
    std::string name_;
    UnitStrGeometry geometry_;
    std::string content_;
    int zOrder_ = 0;
    ElementStyle style_;
};

class TextElement final : public ComponentElement {
public:
    explicit TextElement(std::string pid = {});

    const std::string& fontFamily() const noexcept { return fontFamily_; }
    void setFontFamily(std::string family) { fontFamily_ = std::move(family); }

    const UnitStr& fontSize() const noexcept { return fontSize_; }
    void setFontSize(const UnitStr& size) { fontSize_ = size; }

    TextAlignment alignment() const noexcept { return alignment_; }
    void setAlignment(TextAlignment alignment) noexcept { alignment_ = alignment; }

    bool wordWrap() const noexcept { return wordWrap_; }
    void setWordWrap(bool wrap) noexcept { wordWrap_ = wrap; }

    std::unique_ptr<ProtoObject> cloneFresh() const override;
    bool equals(const ComponentElement& other) const override;

private:
    std::string fontFamily_ = "Arial";
    UnitStr fontSize_ = UnitStr::fromNumber(12.0, Unit::Pt);
    TextAlignment alignment_ = TextAlignment::Left;
    bool wordWrap_ = true;
};

class ImageElement final : public ComponentElement {
public:
    explicit ImageElement(std::string pid = {});

    bool keepAspectRatio() const noexcept { return keepAspectRatio_; }
    void setKeepAspectRatio(bool keep) noexcept { keepAspectRatio_ = keep; }

    std::unique_ptr<ProtoObject> cloneFresh() const override;
    bool equals(const ComponentElement& other) const override;

private:
    bool keepAspectRatio_ = true;
};

} // namespace protolayout

#endif // PROTOLAYOUT_MODEL_COMPONENT_ELEMENT_H
