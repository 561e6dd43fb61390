#include "protolayout/units/unit_str_geometry.h"

#include <utility>

namespace protolayout {

UnitStrGeometry::UnitStrGeometry(UnitStr x, UnitStr y, UnitStr rectX, UnitStr rectY, UnitStr width, UnitStr height,
                                 double dpi)
    : x_(std::move(x)),
      y_(std::move(y)),
      rectX_(std::move(rectX)),
      rectY_(std::move(rectY)),
      width_(std::move(width)),
      height_(std::move(height)),
      dpi_(dpi) {}

UnitStrGeometry UnitStrGeometry::fromSize(UnitStr width, UnitStr height, double dpi) {
    const Unit unit = width.unit();
    return UnitStrGeometry(UnitStr::zero(unit), UnitStr::zero(unit), UnitStr::zero(unit), UnitStr::zero(unit),
                           std::move(width), std::move(height), dpi);
}

UnitStrGeometry UnitStrGeometry::fromPixels(const PixelRect& rect, const PixelPoint& pos, double dpi, Unit unit) {
    return UnitStrGeometry(UnitStr::fromPixels(pos.x, dpi, unit),
                           UnitStr::fromPixels(pos.y, dpi, unit),
                           UnitStr::fromPixels(rect.x, dpi, unit),
                           UnitStr::fromPixels(rect.y, dpi, unit),
                           UnitStr::fromPixels(rect.width, dpi, unit),
                           UnitStr::fromPixels(rect.height, dpi, unit),
                           dpi);
}

PixelRect UnitStrGeometry::toPixelRect(double dpi) const {
    return PixelRect{x_.toPixels(dpi), y_.toPixels(dpi), width_.toPixels(dpi), height_.toPixels(dpi)};
}

PixelRect UnitStrGeometry::localPixelRect(double dpi) const {
    return PixelRect{rectX_.toPixels(dpi), rectY_.toPixels(dpi), width_.toPixels(dpi), height_.toPixels(dpi)};
}

PixelPoint UnitStrGeometry::pixelPosition(double dpi) const {
    return PixelPoint{x_.toPixels(dpi), y_.toPixels(dpi)};
}

UnitStrGeometry UnitStrGeometry::withRect(const PixelRect& rect, double dpi) const {
    UnitStrGeometry out(*this);
    out.rectX_ = UnitStr::fromPixels(rect.x, dpi, rectX_.unit());
    out.rectY_ = UnitStr::fromPixels(rect.y, dpi, rectY_.unit());
    out.width_ = UnitStr::fromPixels(rect.width, dpi, width_.unit());
    out.height_ = UnitStr::fromPixels(rect.height, dpi, height_.unit());
    out.dpi_ = dpi;
    return out;
}

UnitStrGeometry UnitStrGeometry::withPosition(const PixelPoint& pos, double dpi) const {
    UnitStrGeometry out(*this);
    out.x_ = UnitStr::fromPixels(pos.x, dpi, x_.unit());
    out.y_ = UnitStr::fromPixels(pos.y, dpi, y_.unit());
    out.dpi_ = dpi;
    return out;
}

UnitStrGeometry UnitStrGeometry::withPosition(const UnitStr& x, const UnitStr& y) const {
    UnitStrGeometry out(*this);
    out.x_ = x;
    out.y_ = y;
    return out;
}

UnitStrGeometry UnitStrGeometry::withSize(const UnitStr& width, const UnitStr& height) const {
    UnitStrGeometry out(*this);
    out.width_ = width;
    out.height_ = height;
    return out;
}

UnitStrGeometry UnitStrGeometry::withDpi(double dpi) const {
    UnitStrGeometry out(*this);
    out.x_ = x_.withDpi(dpi);
    out.y_ = y_.withDpi(dpi);
    out.rectX_ = rectX_.withDpi(dpi);
    out.rectY_ = rectY_.withDpi(dpi);
    out.width_ = width_.withDpi(dpi);
    out.height_ = height_.withDpi(dpi);
    out.dpi_ = dpi;
    return out;
}

UnitStrGeometry UnitStrGeometry::withDisplayUnit(Unit unit) const {
    return UnitStrGeometry(x_.as(unit), y_.as(unit), rectX_.as(unit), rectY_.as(unit), width_.as(unit),
                           height_.as(unit), dpi_);
}

UnitStrGeometry UnitStrGeometry::rounded() const {
    return UnitStrGeometry(x_.rounded(), y_.rounded(), rectX_.rounded(), rectY_.rounded(), width_.rounded(),
                           height_.rounded(), dpi_);
}

bool UnitStrGeometry::contains(const PixelPoint& point, double dpi) const {
    const PixelRect r = toPixelRect(dpi);
    return point.x >= r.x && point.y >= r.y && point.x <= r.x + r.width && point.y <= r.y + r.height;
}

bool UnitStrGeometry::operator==(const UnitStrGeometry& other) const noexcept {
    return x_ == other.x_ && y_ == other.y_ && rectX_ == other.rectX_ && rectY_ == other.rectY_
        && width_ == other.width_ && height_ == other.height_;
}

} // namespace protolayout
