#ifndef PROTOLAYOUT_PAGINATION_PAGE_H
#define PROTOLAYOUT_PAGINATION_PAGE_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace protolayout {

class ComponentInstance;

// One slot of one page and what it shows. A null instance is an explicit
// empty slot. The slot is named by PID and cell, never held, so a page stays
// readable after the layout it came from is regridded.
struct Placement {
    std::string slotPid;
    std::size_t row = 0;
    std::size_t column = 0;
    std::shared_ptr<const ComponentInstance> instance;

    bool empty() const noexcept { return instance == nullptr; }
};

// Exactly one placement per layout slot, in row-major slot order.
struct Page {
    std::size_t index = 0;
    std::vector<Placement> placements;

    std::size_t filledCount() const noexcept {
        std::size_t n = 0;
        for (const auto& p : placements) n += p.empty() ? 0 : 1;
        return n;
    }
};

// Order-sensitive FNV-1a digest of a page's slot/template/data assignment.
// Instance PIDs are excluded so regenerated pages digest identically.
std::uint64_t pageDigest(const Page& page, std::uint64_t seed);

} // namespace protolayout

#endif // PROTOLAYOUT_PAGINATION_PAGE_H
