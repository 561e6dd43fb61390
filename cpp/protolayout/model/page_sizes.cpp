#include "protolayout/model/page_sizes.h"

#include "protolayout/core/errors.h"

#include <string>
#include <utility>

namespace protolayout {

std::optional<PageSizeSpec> findPageSize(std::string_view name) {
    for (const auto& spec : kPageSizes) {
        if (spec.name == name) return spec;
    }
    return std::nullopt;
}

UnitStrGeometry pageGeometry(std::string_view name, bool landscape, double dpi) {
    const auto spec = findPageSize(name);
    if (!spec) throw ParseError("unknown page size '" + std::string(name) + "'");
    UnitStr width = UnitStr::fromNumber(spec->width, spec->unit, dpi);
    UnitStr height = UnitStr::fromNumber(spec->height, spec->unit, dpi);
    if (landscape) std::swap(width, height);
    return UnitStrGeometry::fromSize(width, height, dpi);
}

std::optional<PrintPreset> findPrintPreset(std::string_view name) {
    for (const auto& preset : kPrintPresets) {
        if (preset.name == name) return preset;
    }
    return std::nullopt;
}

std::vector<std::string_view> pageSizeNames() {
    std::vector<std::string_view> out;
    out.reserve(kPageSizes.size());
    for (const auto& spec : kPageSizes) out.push_back(spec.name);
    return out;
}

} // namespace protolayout
