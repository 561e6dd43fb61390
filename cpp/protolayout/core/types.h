#ifndef PROTOLAYOUT_CORE_TYPES_H
#define PROTOLAYOUT_CORE_TYPES_H

#include <cstddef>
#include <cstdint>

// Lightweight constants shared by the layout core.

namespace protolayout {

// Resolution defaults
static constexpr double kDefaultDpi = 300.0;
static constexpr double kDisplayDpi = 144.0;
static constexpr double kPrintDpi = 300.0;

// Canonical storage: every quantity is kept as an integer count of nano-inches.
static constexpr double kNanoPerInch = 1e9;

// Conversion factors to inches
static constexpr double kMmPerInch = 25.4;
static constexpr double kCmPerInch = 2.54;
static constexpr double kPtPerInch = 72.0;

// Pagination
static constexpr std::size_t kDefaultPageCeiling = 1000;

// Export
static constexpr double kDefaultBleedInches = 0.125;

// Data binding
static constexpr char kBindingPrefix = '@';

// Z order step used when element stacking is normalized.
static constexpr int kZOrderStep = 100;

// Packed RGBA colors (0xRRGGBBAA)
static constexpr std::uint32_t kColorBlack = 0x000000FFu;
static constexpr std::uint32_t kColorWhite = 0xFFFFFFFFu;
static constexpr std::uint32_t kColorTransparent = 0x00000000u;

} // namespace protolayout

#endif // PROTOLAYOUT_CORE_TYPES_H
