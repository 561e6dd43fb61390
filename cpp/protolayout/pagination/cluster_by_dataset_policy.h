#ifndef PROTOLAYOUT_PAGINATION_CLUSTER_BY_DATASET_POLICY_H
#define PROTOLAYOUT_PAGINATION_CLUSTER_BY_DATASET_POLICY_H

#include "protolayout/pagination/pagination_policy.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace protolayout {

// Fills whole pages from one data-bound template at a time. Slots of other
// data-bound templates stay empty; static slots repeat as usual.
//
// Params: { "order": ["ct_...", ...] } fixes the template sequence; without
// it templates are taken in first row-major appearance.
class ClusterByDatasetPolicy : public PaginationPolicy {
public:
    static constexpr const char* kName = "ClusterByDataset";

    // Throws PaginationError on malformed params.
    explicit ClusterByDatasetPolicy(const nlohmann::json& params = nlohmann::json::object());

    const char* name() const noexcept override { return kName; }

protected:
    void onPrepare() override;
    std::optional<Page> buildPage(std::size_t index) override;

private:
    std::vector<std::string> requestedOrder_;
    std::vector<std::string> order_;
    std::size_t current_ = 0;
};

} // namespace protolayout

#endif // PROTOLAYOUT_PAGINATION_CLUSTER_BY_DATASET_POLICY_H
