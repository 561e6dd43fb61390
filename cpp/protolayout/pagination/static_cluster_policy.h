#ifndef PROTOLAYOUT_PAGINATION_STATIC_CLUSTER_POLICY_H
#define PROTOLAYOUT_PAGINATION_STATIC_CLUSTER_POLICY_H

#include "protolayout/pagination/pagination_policy.h"

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

namespace protolayout {

// Pages are filled one template cluster at a time, statics included. Only the
// current cluster's slots are filled; every other slot stays empty.
//
// A static template is printed `copies` times (default 1): each page places
// one copy per slot showing it until the count is met, and the cluster ends
// there.
// A data-bound cluster ends when its feed runs dry.
//
// Params:
//   "static_first": true (default) runs static clusters before data-bound ones.
//   "order": explicit template sequence; templates left out never print.
//   "copies": { "ct_...": n } copies per static template.
class StaticClusterPolicy : public PaginationPolicy {
public:
    static constexpr const char* kName = "StaticCluster";

    // Throws PaginationError on malformed params.
    explicit StaticClusterPolicy(const nlohmann::json& params = nlohmann::json::object());

    const char* name() const noexcept override { return kName; }

protected:
    // Throws ConfigurationError when an ordered template is not shown by any slot.
    void onPrepare() override;
    std::optional<Page> buildPage(std::size_t index) override;

private:
    bool clusterDone(const std::string& templatePid);

    bool staticFirst_ = true;
    std::vector<std::string> requestedOrder_;
    std::map<std::string, std::size_t> copies_;
    std::vector<std::string> order_;
    std::map<std::string, std::size_t> copiesLeft_;
    std::size_t current_ = 0;
};

} // namespace protolayout

#endif // PROTOLAYOUT_PAGINATION_STATIC_CLUSTER_POLICY_H
