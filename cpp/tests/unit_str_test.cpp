#include <gtest/gtest.h>
#include "protolayout/core/errors.h"
#include "protolayout/units/unit_str.h"
#include <cmath>
#include <stdexcept>
#include <type_traits>
#include <utility>

using protolayout::ParseError;
using protolayout::Unit;
using protolayout::UnitStr;

namespace {

template <typename A, typename B, typename = void>
struct CanAdd : std::false_type {};
template <typename A, typename B>
struct CanAdd<A, B, std::void_t<decltype(std::declval<A>() + std::declval<B>())>> : std::true_type {};

template <typename A, typename B, typename = void>
struct CanAddAssign : std::false_type {};
template <typename A, typename B>
struct CanAddAssign<A, B, std::void_t<decltype(std::declval<A&>() += std::declval<B>())>> : std::true_type {};

template <typename A, typename B, typename = void>
struct CanSubtractAssign : std::false_type {};
template <typename A, typename B>
struct CanSubtractAssign<A, B, std::void_t<decltype(std::declval<A&>() -= std::declval<B>())>> : std::true_type {};

template <typename A, typename B, typename = void>
struct CanCompare : std::false_type {};
template <typename A, typename B>
struct CanCompare<A, B, std::void_t<decltype(std::declval<A>() < std::declval<B>())>> : std::true_type {};

} // namespace

// Mixing quantities with raw numbers must not compile.
static_assert(!std::is_convertible<double, UnitStr>::value, "no implicit conversion from double");
static_assert(!std::is_convertible<int, UnitStr>::value, "no implicit conversion from int");
static_assert(!CanAdd<UnitStr, double>::value, "UnitStr + double is rejected");
static_assert(!CanAdd<double, UnitStr>::value, "double + UnitStr is rejected");
// Quantities are immutable: arithmetic always yields a new value.
static_assert(!CanAddAssign<UnitStr, UnitStr>::value, "no UnitStr += UnitStr");
static_assert(!CanSubtractAssign<UnitStr, UnitStr>::value, "no UnitStr -= UnitStr");
static_assert(!CanCompare<UnitStr, double>::value, "UnitStr < double is rejected");
static_assert(CanAdd<UnitStr, UnitStr>::value, "UnitStr + UnitStr is allowed");

TEST(UnitStrTest, ParsesLiteralsWithUnits) {
    EXPECT_DOUBLE_EQ(UnitStr::fromString("2.5in").inches(), 2.5);
    EXPECT_DOUBLE_EQ(UnitStr::fromString("2.5 in").inches(), 2.5);
    EXPECT_DOUBLE_EQ(UnitStr::fromString("25.4mm").inches(), 1.0);
    EXPECT_DOUBLE_EQ(UnitStr::fromString("2.54cm").inches(), 1.0);
    EXPECT_DOUBLE_EQ(UnitStr::fromString("72pt").inches(), 1.0);
    EXPECT_DOUBLE_EQ(UnitStr::fromString("-.5in").inches(), -0.5);
    EXPECT_EQ(UnitStr::fromString("6.35 cm").unit(), Unit::Cm);
}

TEST(UnitStrTest, AcceptsUnitAliases) {
    EXPECT_EQ(UnitStr::fromString("1inch"), UnitStr::fromString("1in"));
    EXPECT_EQ(UnitStr::fromString("1 inches"), UnitStr::fromString("1in"));
    EXPECT_EQ(UnitStr::fromString("1\""), UnitStr::fromString("1in"));
    EXPECT_EQ(UnitStr::fromString("300 pixels"), UnitStr::fromString("1in"));
    EXPECT_EQ(UnitStr::fromString("1 IN").unit(), Unit::In);
}

TEST(UnitStrTest, BareNumbersUseDefaultUnit) {
    EXPECT_EQ(UnitStr::fromString("300").unit(), Unit::Px);
    EXPECT_DOUBLE_EQ(UnitStr::fromString("300").inches(), 1.0);
    EXPECT_DOUBLE_EQ(UnitStr::fromString("2", Unit::In).inches(), 2.0);
    EXPECT_DOUBLE_EQ(UnitStr::fromString("144", Unit::Px, 144.0).inches(), 1.0);
}

TEST(UnitStrTest, PixelLiteralCarriesSourceDpi) {
    const UnitStr px = UnitStr::fromString("150px@150");
    EXPECT_DOUBLE_EQ(px.inches(), 1.0);
    EXPECT_DOUBLE_EQ(px.dpi(), 150.0);
    EXPECT_DOUBLE_EQ(px.toPixels(300.0), 300.0);
    EXPECT_EQ(px, UnitStr::fromString("750px@750"));
}

TEST(UnitStrTest, RejectsMalformedLiterals) {
    EXPECT_THROW(UnitStr::fromString(""), ParseError);
    EXPECT_THROW(UnitStr::fromString("abc"), ParseError);
    EXPECT_THROW(UnitStr::fromString("2.5furlongs"), ParseError);
    EXPECT_THROW(UnitStr::fromString("2.5in extra"), ParseError);
    EXPECT_THROW(UnitStr::fromString("10px@"), ParseError);
    EXPECT_THROW(UnitStr::fromString("10px@0"), ParseError);
    EXPECT_THROW(UnitStr::fromNumber(1.0, Unit::Px, -72.0), ParseError);
    EXPECT_THROW(protolayout::unitFromString("parsec"), ParseError);
}

TEST(UnitStrTest, RejectsMagnitudesBeyondStorage) {
    // 2^63 nano-inches is one past the largest storable magnitude.
    const double limit = std::ldexp(1.0, 63) / 1e9;
    EXPECT_THROW(UnitStr::fromInches(limit), ParseError);
    EXPECT_THROW(UnitStr::fromInches(-limit), ParseError);
    EXPECT_THROW(UnitStr::fromInches(limit * 2.0), ParseError);
    EXPECT_NO_THROW(UnitStr::fromInches(limit / 2.0));
}

TEST(UnitStrTest, EqualityIsExactAfterNormalization) {
    EXPECT_EQ(UnitStr::fromString("2.5in"), UnitStr::fromString("6.35cm"));
    EXPECT_EQ(UnitStr::fromString("2.5in"), UnitStr::fromString("63.5mm"));
    EXPECT_EQ(UnitStr::fromString("2.5in"), UnitStr::fromString("180pt"));
    EXPECT_EQ(UnitStr::fromString("2.5in"), UnitStr::fromString("750px@300"));
    EXPECT_NE(UnitStr::fromString("2.5in"), UnitStr::fromString("2.51in"));
}

TEST(UnitStrTest, OrderingAcrossUnits) {
    const UnitStr inch = UnitStr::fromString("1in");
    const UnitStr mm = UnitStr::fromString("24mm");
    EXPECT_LT(mm, inch);
    EXPECT_GT(inch, mm);
    EXPECT_LE(inch, UnitStr::fromString("72pt"));
    EXPECT_GE(inch, UnitStr::fromString("72pt"));
}

TEST(UnitStrTest, ConvertsBetweenUnits) {
    const UnitStr q = UnitStr::fromString("2in");
    EXPECT_DOUBLE_EQ(q.to(Unit::Mm), 50.8);
    EXPECT_DOUBLE_EQ(q.to(Unit::Pt), 144.0);
    EXPECT_DOUBLE_EQ(q.to(Unit::Px, 300.0), 600.0);
    EXPECT_DOUBLE_EQ(q.toPixels(144.0), 288.0);
}

TEST(UnitStrTest, ToStringRoundTrips) {
    for (const char* literal : {"2.5in", "6.35cm", "12pt", "1.25mm", "750px@300", "-0.125in"}) {
        const UnitStr q = UnitStr::fromString(literal);
        const UnitStr back = UnitStr::fromString(q.toString());
        EXPECT_EQ(back, q) << literal << " -> " << q.toString();
        EXPECT_EQ(back.unit(), q.unit());
    }
    EXPECT_EQ(UnitStr::fromString("2.5in").toString(), "2.5 in");
    EXPECT_EQ(UnitStr::fromString("750px").toString(), "750 px@300");
}

TEST(UnitStrTest, ArithmeticKeepsLeftOperandUnit) {
    const UnitStr a = UnitStr::fromString("1in");
    const UnitStr b = UnitStr::fromString("25.4mm");
    const UnitStr sum = a + b;
    EXPECT_EQ(sum, UnitStr::fromString("2in"));
    EXPECT_EQ(sum.unit(), Unit::In);
    EXPECT_EQ(b + a, UnitStr::fromString("50.8mm"));
    EXPECT_EQ((b + a).unit(), Unit::Mm);
    EXPECT_EQ(a - b, UnitStr::zero());
    EXPECT_EQ(-a, UnitStr::fromString("-1in"));
    EXPECT_EQ((-a).abs(), a);
}

TEST(UnitStrTest, ScalingByDimensionlessFactors) {
    const UnitStr a = UnitStr::fromString("3in");
    EXPECT_EQ(a * 2.0, UnitStr::fromString("6in"));
    EXPECT_EQ(0.5 * a, UnitStr::fromString("1.5in"));
    EXPECT_EQ(a / 3.0, UnitStr::fromString("1in"));
    EXPECT_DOUBLE_EQ(a / UnitStr::fromString("1.5in"), 2.0);
    EXPECT_THROW(a / 0.0, std::domain_error);
    EXPECT_THROW(a / UnitStr::zero(), std::domain_error);
}

TEST(UnitStrTest, RoundingSnapsToDisplayIncrement) {
    EXPECT_EQ(UnitStr::fromString("1.234in").rounded(), UnitStr::fromString("1.23in"));
    EXPECT_EQ(UnitStr::fromString("12.36mm").rounded(), UnitStr::fromString("12.4mm"));
    EXPECT_EQ(UnitStr::fromString("11.6pt").rounded(), UnitStr::fromString("12pt"));
}

TEST(UnitStrTest, DisplayUnitDoesNotAffectEquality) {
    const UnitStr q = UnitStr::fromString("1in");
    EXPECT_EQ(q.as(Unit::Mm), q);
    EXPECT_DOUBLE_EQ(q.as(Unit::Mm).value(), 25.4);
    EXPECT_EQ(q.withDpi(72.0), q);
    EXPECT_TRUE(UnitStr::zero(Unit::Pt).isZero());
}
