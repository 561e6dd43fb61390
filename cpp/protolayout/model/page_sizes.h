#ifndef PROTOLAYOUT_MODEL_PAGE_SIZES_H
#define PROTOLAYOUT_MODEL_PAGE_SIZES_H

#include "protolayout/units/unit_str_geometry.h"

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace protolayout {

// Portrait dimensions of a named paper size.
struct PageSizeSpec {
    std::string_view name;
    double width;
    double height;
    Unit unit;
};

inline constexpr std::array<PageSizeSpec, 10> kPageSizes = {{
    {"Letter", 8.5, 11.0, Unit::In},
    {"Legal", 8.5, 14.0, Unit::In},
    {"Tabloid", 11.0, 17.0, Unit::In},
    {"Super B", 13.0, 19.0, Unit::In},
    {"A4", 210.0, 297.0, Unit::Mm},
    {"A3", 297.0, 420.0, Unit::Mm},
    {"A3+", 329.0, 483.0, Unit::Mm},
    {"A2", 420.0, 594.0, Unit::Mm},
    {"A1", 594.0, 841.0, Unit::Mm},
    {"A0", 841.0, 1189.0, Unit::Mm},
}};

std::optional<PageSizeSpec> findPageSize(std::string_view name);
// Throws ParseError for unknown names. Landscape swaps width and height.
UnitStrGeometry pageGeometry(std::string_view name, bool landscape = false, double dpi = kDefaultDpi);

// One-call page, orientation, grid and whitespace configuration.
struct PrintPreset {
    std::string_view name;
    std::string_view pageSize;
    bool landscape;
    std::size_t rows;
    std::size_t columns;
    // Inches: top, bottom, left, right, spacing x, spacing y.
    double marginTop;
    double marginBottom;
    double marginLeft;
    double marginRight;
    double spacingX;
    double spacingY;
    // Distinct component templates the layout accepts; 0 = any number.
    std::size_t lockAt;
    // Printed double-sided: the layout switches to DuplexInterleave.
    bool duplex;
};

inline constexpr std::array<PrintPreset, 4> kPrintPresets = {{
    {"Letter: 3x3 Standard 2.5\"x3.5\" Cards", "Letter", false, 3, 3, 0.25, 0.25, 0.5, 0.5, 0.0, 0.0, 1, false},
    {"Letter: 2x4 Standard 2.5\"x3.5\" Cards", "Letter", true, 2, 4, 0.75, 0.75, 0.5, 0.5, 0.0, 0.0, 0, false},
    {"Letter: 2x4 Standard 2.5\"x3.5\" Cards (Duplex)", "Letter", true, 2, 4, 0.75, 0.75, 0.5, 0.5, 0.0, 0.0, 0, true},
    {"Letter: 9x13 Small 0.5\" Tokens", "Letter", false, 13, 9, 0.5, 0.5, 0.5, 0.5, 0.25, 0.25, 0, false},
}};

std::optional<PrintPreset> findPrintPreset(std::string_view name);
std::vector<std::string_view> pageSizeNames();

} // namespace protolayout

#endif // PROTOLAYOUT_MODEL_PAGE_SIZES_H
