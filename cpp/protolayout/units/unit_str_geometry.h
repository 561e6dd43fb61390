#ifndef PROTOLAYOUT_UNITS_UNIT_STR_GEOMETRY_H
#define PROTOLAYOUT_UNITS_UNIT_STR_GEOMETRY_H

#include "protolayout/units/unit_str.h"

namespace protolayout {

struct PixelPoint {
    double x = 0.0;
    double y = 0.0;
};

struct PixelRect {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;
};

// Position plus local rectangle, each side stored as a UnitStr.
//
// `x`/`y` place the item in its parent; `rectX`/`rectY` are the origin of the
// local rectangle (usually zero). Instances are never mutated: every edit
// returns a new geometry so callers can keep the old/new pair for change
// notification and undo. Resizing (withRect) and moving (withPosition) touch
// disjoint fields.
class UnitStrGeometry {
public:
    UnitStrGeometry() = default;
    UnitStrGeometry(UnitStr x, UnitStr y, UnitStr rectX, UnitStr rectY, UnitStr width, UnitStr height,
                    double dpi = kDefaultDpi);

    static UnitStrGeometry fromSize(UnitStr width, UnitStr height, double dpi = kDefaultDpi);
    static UnitStrGeometry fromPixels(const PixelRect& rect, const PixelPoint& pos, double dpi,
                                      Unit unit = Unit::In);

    const UnitStr& x() const noexcept { return x_; }
    const UnitStr& y() const noexcept { return y_; }
    const UnitStr& rectX() const noexcept { return rectX_; }
    const UnitStr& rectY() const noexcept { return rectY_; }
    const UnitStr& width() const noexcept { return width_; }
    const UnitStr& height() const noexcept { return height_; }
    double dpi() const noexcept { return dpi_; }
    Unit unit() const noexcept { return width_.unit(); }

    // Position and size in pixels: (x, y, width, height).
    PixelRect toPixelRect(double dpi) const;
    // Local rectangle in pixels: (rectX, rectY, width, height).
    PixelRect localPixelRect(double dpi) const;
    PixelPoint pixelPosition(double dpi) const;

    // New geometry with size and local origin taken from `rect`; x/y are kept.
    UnitStrGeometry withRect(const PixelRect& rect, double dpi) const;
    // New geometry with x/y taken from `pos`; size and local origin are kept.
    UnitStrGeometry withPosition(const PixelPoint& pos, double dpi) const;

    UnitStrGeometry withPosition(const UnitStr& x, const UnitStr& y) const;
    UnitStrGeometry withSize(const UnitStr& width, const UnitStr& height) const;
    UnitStrGeometry withDpi(double dpi) const;
    UnitStrGeometry withDisplayUnit(Unit unit) const;
    UnitStrGeometry rounded() const;

    // Hit test in scene pixels against the positioned rectangle.
    bool contains(const PixelPoint& point, double dpi) const;
    bool isEmpty() const noexcept { return width_.nanoInches() <= 0 || height_.nanoInches() <= 0; }

    // Compares stored quantities only; DPI and display unit are presentation.
    bool operator==(const UnitStrGeometry& other) const noexcept;
    bool operator!=(const UnitStrGeometry& other) const noexcept { return !(*this == other); }

private:
    UnitStr x_;
    UnitStr y_;
    UnitStr rectX_;
    UnitStr rectY_;
    UnitStr width_;
    UnitStr height_;
    double dpi_ = kDefaultDpi;
};

} // namespace protolayout

#endif // PROTOLAYOUT_UNITS_UNIT_STR_GEOMETRY_H
