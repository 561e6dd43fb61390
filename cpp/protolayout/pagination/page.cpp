#include "protolayout/pagination/page.h"

#include "protolayout/core/string_utils.h"
#include "protolayout/model/component.h"

namespace protolayout {

std::uint64_t pageDigest(const Page& page, std::uint64_t seed) {
    std::uint64_t h = hashU64(seed, page.index);
    h = hashU32(h, static_cast<std::uint32_t>(page.placements.size()));
    for (const auto& placement : page.placements) {
        h = hashString(h, placement.slotPid);
        if (placement.empty()) {
            h = hashU32(h, 0u);
            continue;
        }
        const ComponentInstance& instance = *placement.instance;
        h = hashU32(h, 1u);
        h = hashString(h, instance.templatePid());
        if (const auto& row = instance.dataRow()) {
            h = hashString(h, row->dataset);
            h = hashU64(h, row->line);
        }
        h = hashU32(h, static_cast<std::uint32_t>(instance.data().size()));
        for (const auto& kv : instance.data()) {
            h = hashString(h, kv.first);
            h = hashString(h, kv.second);
        }
    }
    return h;
}

} // namespace protolayout
