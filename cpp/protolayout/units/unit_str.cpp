#include "protolayout/units/unit_str.h"

#include "protolayout/core/errors.h"
#include "protolayout/core/string_utils.h"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace protolayout {

namespace {

constexpr int kLiteralDecimals = 10;

// How many of `unit` make up one inch.
double unitsPerInch(Unit unit, double dpi) {
    switch (unit) {
        case Unit::In: return 1.0;
        case Unit::Mm: return kMmPerInch;
        case Unit::Cm: return kCmPerInch;
        case Unit::Pt: return kPtPerInch;
        case Unit::Px: return dpi;
    }
    return 1.0;
}

double roundingIncrement(Unit unit) {
    switch (unit) {
        case Unit::In: return 0.01;
        case Unit::Mm: return 0.1;
        case Unit::Cm: return 0.1;
        case Unit::Pt: return 1.0;
        case Unit::Px: return 1.0;
    }
    return 0.01;
}

void requirePositiveDpi(double dpi) {
    if (!std::isfinite(dpi) || dpi <= 0.0) {
        throw ParseError("dpi must be a positive number, got " + formatNumber(dpi, 3));
    }
}

std::int64_t toNano(double inches) {
    const double nano = inches * kNanoPerInch;
    // 2^63 itself does not fit in int64_t.
    if (!std::isfinite(nano) || std::fabs(nano) >= static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
        throw ParseError("quantity out of range");
    }
    return static_cast<std::int64_t>(std::llround(nano));
}

bool isUnitChar(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '"' || c == '\'';
}

} // namespace

const char* unitName(Unit unit) noexcept {
    switch (unit) {
        case Unit::In: return "in";
        case Unit::Mm: return "mm";
        case Unit::Cm: return "cm";
        case Unit::Pt: return "pt";
        case Unit::Px: return "px";
    }
    return "in";
}

std::optional<Unit> parseUnit(std::string_view token) {
    const std::string t = toLower(trimView(token));
    if (t == "in" || t == "inch" || t == "inches" || t == "\"") return Unit::In;
    if (t == "mm") return Unit::Mm;
    if (t == "cm") return Unit::Cm;
    if (t == "pt") return Unit::Pt;
    if (t == "px" || t == "pixel" || t == "pixels") return Unit::Px;
    return std::nullopt;
}

Unit unitFromString(std::string_view token) {
    const auto unit = parseUnit(token);
    if (!unit) throw ParseError("unrecognized unit '" + std::string(token) + "'");
    return *unit;
}

// =============================================================================
// Construction
// =============================================================================

UnitStr UnitStr::fromString(std::string_view literal, Unit defaultUnit, double dpi) {
    const std::string_view text = trimView(literal);
    const std::string quoted = "'" + std::string(literal) + "'";
    if (text.empty()) throw ParseError("empty unit literal");

    std::size_t pos = 0;
    if (text[pos] == '-' || text[pos] == '+') ++pos;
    const std::size_t intBegin = pos;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) ++pos;
    std::size_t digits = pos - intBegin;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        const std::size_t fracBegin = pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) ++pos;
        digits += pos - fracBegin;
    }
    if (digits == 0) throw ParseError("non-numeric magnitude in unit literal " + quoted);

    const std::string number(text.substr(0, pos));
    const double magnitude = std::strtod(number.c_str(), nullptr);

    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;

    Unit unit = defaultUnit;
    const std::size_t unitBegin = pos;
    while (pos < text.size() && isUnitChar(text[pos])) ++pos;
    if (pos > unitBegin) {
        const auto parsed = parseUnit(text.substr(unitBegin, pos - unitBegin));
        if (!parsed) {
            throw ParseError("unrecognized unit suffix '" + std::string(text.substr(unitBegin, pos - unitBegin))
                + "' in unit literal " + quoted);
        }
        unit = *parsed;
    }

    double sourceDpi = dpi;
    if (pos < text.size() && text[pos] == '@') {
        ++pos;
        const std::size_t dpiBegin = pos;
        while (pos < text.size() && (std::isdigit(static_cast<unsigned char>(text[pos])) || text[pos] == '.')) ++pos;
        if (pos == dpiBegin) throw ParseError("missing dpi after '@' in unit literal " + quoted);
        sourceDpi = std::strtod(std::string(text.substr(dpiBegin, pos - dpiBegin)).c_str(), nullptr);
    }

    if (pos != text.size()) throw ParseError("trailing characters in unit literal " + quoted);
    return fromNumber(magnitude, unit, sourceDpi);
}

UnitStr UnitStr::fromNumber(double value, Unit unit, double dpi) {
    requirePositiveDpi(dpi);
    if (!std::isfinite(value)) throw ParseError("non-finite magnitude");
    return UnitStr(toNano(value / unitsPerInch(unit, dpi)), unit, dpi);
}

UnitStr UnitStr::fromInches(double inches, Unit displayUnit, double dpi) {
    requirePositiveDpi(dpi);
    if (!std::isfinite(inches)) throw ParseError("non-finite magnitude");
    return UnitStr(toNano(inches), displayUnit, dpi);
}

UnitStr UnitStr::fromPixels(double pixels, double dpi, Unit displayUnit) {
    requirePositiveDpi(dpi);
    if (!std::isfinite(pixels)) throw ParseError("non-finite magnitude");
    return UnitStr(toNano(pixels / dpi), displayUnit, dpi);
}

// =============================================================================
// Conversion
// =============================================================================

double UnitStr::to(Unit unit, double dpi) const {
    if (unit == Unit::Px) requirePositiveDpi(dpi);
    return inches() * unitsPerInch(unit, dpi);
}

double UnitStr::inches() const noexcept {
    return static_cast<double>(nano_) / kNanoPerInch;
}

UnitStr UnitStr::as(Unit unit) const noexcept {
    return UnitStr(nano_, unit, dpi_);
}

UnitStr UnitStr::withDpi(double dpi) const {
    requirePositiveDpi(dpi);
    return UnitStr(nano_, unit_, dpi);
}

UnitStr UnitStr::rounded() const {
    const double increment = roundingIncrement(unit_);
    const double snapped = std::round(value() / increment) * increment;
    return fromNumber(snapped, unit_, dpi_);
}

UnitStr UnitStr::abs() const noexcept {
    return UnitStr(nano_ < 0 ? -nano_ : nano_, unit_, dpi_);
}

std::string UnitStr::toString() const {
    std::string out = formatNumber(value(), kLiteralDecimals);
    out += ' ';
    out += unitName(unit_);
    if (unit_ == Unit::Px) {
        out += '@';
        out += formatNumber(dpi_, 3);
    }
    return out;
}

// =============================================================================
// Arithmetic
// =============================================================================

UnitStr UnitStr::operator-() const noexcept {
    return UnitStr(-nano_, unit_, dpi_);
}

UnitStr UnitStr::operator+(const UnitStr& other) const noexcept {
    return UnitStr(nano_ + other.nano_, unit_, dpi_);
}

UnitStr UnitStr::operator-(const UnitStr& other) const noexcept {
    return UnitStr(nano_ - other.nano_, unit_, dpi_);
}

UnitStr UnitStr::operator*(double factor) const {
    return UnitStr(toNano(inches() * factor), unit_, dpi_);
}

UnitStr UnitStr::operator/(double divisor) const {
    if (divisor == 0.0) throw std::domain_error("division of a quantity by zero");
    return UnitStr(toNano(inches() / divisor), unit_, dpi_);
}

double UnitStr::operator/(const UnitStr& other) const {
    if (other.nano_ == 0) throw std::domain_error("ratio against a zero quantity");
    return static_cast<double>(nano_) / static_cast<double>(other.nano_);
}

} // namespace protolayout
