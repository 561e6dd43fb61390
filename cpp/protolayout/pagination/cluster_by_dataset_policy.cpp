#include "protolayout/pagination/cluster_by_dataset_policy.h"

#include "protolayout/model/component.h"

namespace protolayout {

ClusterByDatasetPolicy::ClusterByDatasetPolicy(const nlohmann::json& params) {
    if (!params.is_object()) throw PaginationError(std::string(kName) + ": params must be an object");
    auto it = params.find("order");
    if (it == params.end()) return;
    if (!it->is_array()) throw PaginationError(std::string(kName) + ": 'order' must be an array of template PIDs");
    for (const auto& entry : *it) {
        if (!entry.is_string()) throw PaginationError(std::string(kName) + ": 'order' entries must be strings");
        requestedOrder_.push_back(entry.get<std::string>());
    }
}

void ClusterByDatasetPolicy::onPrepare() {
    current_ = 0;
    if (requestedOrder_.empty()) {
        order_ = dynamicTemplates();
        return;
    }
    for (const auto& pid : requestedOrder_) {
        if (!feedFor(pid)) {
            throw ConfigurationError(std::string(kName) + ": no dataset binding for ordered template '" + pid + "'");
        }
    }
    order_ = requestedOrder_;
}

std::optional<Page> ClusterByDatasetPolicy::buildPage(std::size_t index) {
    while (current_ < order_.size() && feedFor(order_[current_])->remaining() == 0) ++current_;

    const bool clusterLeft = current_ < order_.size();
    if (!clusterLeft && !(index == 0 && hasTemplatedSlots())) return std::nullopt;

    Page page;
    page.placements.reserve(slotPlans().size());
    for (const SlotPlan& plan : slotPlans()) {
        Placement placement = plan.emptyPlacement();
        if (plan.source) {
            TemplateFeed* feed = feedFor(plan.source->pid());
            if (!feed) {
                placement.instance = staticInstance(*plan.source);
            } else if (clusterLeft && plan.source->pid() == order_[current_]) {
                placement.instance = mergedInstance(*plan.source, *feed);
            }
        }
        page.placements.push_back(std::move(placement));
    }
    return page;
}

} // namespace protolayout
