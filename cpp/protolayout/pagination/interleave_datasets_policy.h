#ifndef PROTOLAYOUT_PAGINATION_INTERLEAVE_DATASETS_POLICY_H
#define PROTOLAYOUT_PAGINATION_INTERLEAVE_DATASETS_POLICY_H

#include "protolayout/pagination/pagination_policy.h"

#include <nlohmann/json.hpp>

namespace protolayout {

// Default policy. Walks slots row-major; a data-bound slot takes the next row
// of its template's feed (datasets of one template rotate one row per slot),
// a static slot repeats one shared instance on every page. Pages continue
// while any feed still has rows; the first page is always emitted when at
// least one slot shows a template.
//
// Params: { "stride": n } starts the walk of page p at slot (p * n) mod the
// slot count, wrapping around. The default 0 keeps plain row-major order.
class InterleaveDatasetsPolicy : public PaginationPolicy {
public:
    static constexpr const char* kName = "InterleaveDatasets";

    // Throws PaginationError on malformed params.
    explicit InterleaveDatasetsPolicy(const nlohmann::json& params = nlohmann::json::object());

    const char* name() const noexcept override { return kName; }
    std::size_t stride() const noexcept { return stride_; }

protected:
    std::optional<Page> buildPage(std::size_t index) override;

private:
    std::size_t stride_ = 0;
};

} // namespace protolayout

#endif // PROTOLAYOUT_PAGINATION_INTERLEAVE_DATASETS_POLICY_H
