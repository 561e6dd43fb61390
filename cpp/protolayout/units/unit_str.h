#ifndef PROTOLAYOUT_UNITS_UNIT_STR_H
#define PROTOLAYOUT_UNITS_UNIT_STR_H

#include "protolayout/core/types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace protolayout {

enum class Unit : std::uint8_t {
    In = 0,
    Mm = 1,
    Cm = 2,
    Pt = 3,
    Px = 4,
};

const char* unitName(Unit unit) noexcept;
// Accepts canonical names plus aliases ("inch", "inches", "\"", "pixel", "pixels").
std::optional<Unit> parseUnit(std::string_view token);
// Throws ParseError on unknown tokens.
Unit unitFromString(std::string_view token);

// Immutable physical measurement.
//
// The magnitude is stored canonically as an integer number of nano-inches, so
// equality and ordering are exact after normalization. The display unit and
// DPI only affect how the value is presented and how px literals are read;
// they never participate in comparisons.
//
// There is intentionally no constructor from arithmetic types: adding or
// comparing a UnitStr with a bare number does not compile. Scaling by a
// dimensionless factor goes through operator* / operator/ with a double.
class UnitStr {
public:
    UnitStr() = default;

    // "2.5in", "6.35 cm", "72pt", "750px@300", ".5\"". Bare numbers use defaultUnit.
    static UnitStr fromString(std::string_view literal, Unit defaultUnit = Unit::Px, double dpi = kDefaultDpi);
    static UnitStr fromNumber(double value, Unit unit, double dpi = kDefaultDpi);
    static UnitStr fromInches(double inches, Unit displayUnit = Unit::In, double dpi = kDefaultDpi);
    static UnitStr fromPixels(double pixels, double dpi, Unit displayUnit = Unit::Px);
    static UnitStr zero(Unit displayUnit = Unit::In) { return fromInches(0.0, displayUnit); }

    // DPI is only consulted for Unit::Px.
    double to(Unit unit, double dpi = kDefaultDpi) const;
    double toPixels(double dpi) const { return to(Unit::Px, dpi); }
    double inches() const noexcept;
    std::int64_t nanoInches() const noexcept { return nano_; }

    Unit unit() const noexcept { return unit_; }
    double dpi() const noexcept { return dpi_; }
    // Magnitude in the display unit at the bound DPI.
    double value() const { return to(unit_, dpi_); }

    UnitStr as(Unit unit) const noexcept;
    UnitStr withDpi(double dpi) const;
    // Snaps to the display unit's editing increment (in 0.01, mm/cm 0.1, pt 1, px 1).
    UnitStr rounded() const;
    UnitStr abs() const noexcept;

    bool isZero() const noexcept { return nano_ == 0; }

    // "2.5 in", "750 px@300"; always re-parseable by fromString.
    std::string toString() const;

    UnitStr operator-() const noexcept;
    UnitStr operator+(const UnitStr& other) const noexcept;
    UnitStr operator-(const UnitStr& other) const noexcept;
    UnitStr operator*(double factor) const;
    UnitStr operator/(double divisor) const;
    // Ratio of two quantities is dimensionless.
    double operator/(const UnitStr& other) const;

    bool operator==(const UnitStr& other) const noexcept { return nano_ == other.nano_; }
    bool operator!=(const UnitStr& other) const noexcept { return nano_ != other.nano_; }
    bool operator<(const UnitStr& other) const noexcept { return nano_ < other.nano_; }
    bool operator>(const UnitStr& other) const noexcept { return nano_ > other.nano_; }
    bool operator<=(const UnitStr& other) const noexcept { return nano_ <= other.nano_; }
    bool operator>=(const UnitStr& other) const noexcept { return nano_ >= other.nano_; }

private:
    UnitStr(std::int64_t nano, Unit unit, double dpi) noexcept : nano_(nano), unit_(unit), dpi_(dpi) {}

    std::int64_t nano_ = 0;
    Unit unit_ = Unit::In;
    double dpi_ = kDefaultDpi;
};

inline UnitStr operator*(double factor, const UnitStr& q) { return q * factor; }

} // namespace protolayout

#endif // PROTOLAYOUT_UNITS_UNIT_STR_H
