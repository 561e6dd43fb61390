#include "protolayout/pagination/static_cluster_policy.h"

#include "protolayout/model/component.h"

#include <algorithm>

namespace protolayout {

StaticClusterPolicy::StaticClusterPolicy(const nlohmann::json& params) {
    if (!params.is_object()) throw PaginationError(std::string(kName) + ": params must be an object");

    auto first = params.find("static_first");
    if (first != params.end()) {
        if (!first->is_boolean()) throw PaginationError(std::string(kName) + ": 'static_first' must be a boolean");
        staticFirst_ = first->get<bool>();
    }

    auto order = params.find("order");
    if (order != params.end()) {
        if (!order->is_array()) throw PaginationError(std::string(kName) + ": 'order' must be an array of template PIDs");
        for (const auto& entry : *order) {
            if (!entry.is_string()) throw PaginationError(std::string(kName) + ": 'order' entries must be strings");
            requestedOrder_.push_back(entry.get<std::string>());
        }
    }

    auto copies = params.find("copies");
    if (copies != params.end()) {
        if (!copies->is_object()) throw PaginationError(std::string(kName) + ": 'copies' must map template PIDs to counts");
        for (auto it = copies->begin(); it != copies->end(); ++it) {
            if (!it.value().is_number_integer() || it.value().get<long long>() < 0) {
                throw PaginationError(std::string(kName) + ": copies of '" + it.key()
                    + "' must be a non-negative integer");
            }
            copies_[it.key()] = static_cast<std::size_t>(it.value().get<long long>());
        }
    }
}

void StaticClusterPolicy::onPrepare() {
    current_ = 0;
    order_.clear();
    copiesLeft_.clear();

    std::vector<std::string> statics;
    for (const SlotPlan& plan : slotPlans()) {
        if (!plan.source || feedFor(plan.source->pid())) continue;
        if (std::find(statics.begin(), statics.end(), plan.source->pid()) == statics.end()) {
            statics.push_back(plan.source->pid());
        }
    }
    for (const auto& pid : statics) {
        auto it = copies_.find(pid);
        copiesLeft_[pid] = it == copies_.end() ? 1 : it->second;
    }

    if (!requestedOrder_.empty()) {
        for (const auto& pid : requestedOrder_) {
            if (!feedFor(pid) && copiesLeft_.count(pid) == 0) {
                throw ConfigurationError(std::string(kName) + ": no slot shows ordered template '" + pid + "'");
            }
        }
        order_ = requestedOrder_;
        return;
    }
    const std::vector<std::string>& dynamic = dynamicTemplates();
    if (staticFirst_) {
        order_ = statics;
        order_.insert(order_.end(), dynamic.begin(), dynamic.end());
    } else {
        order_ = dynamic;
        order_.insert(order_.end(), statics.begin(), statics.end());
    }
}

bool StaticClusterPolicy::clusterDone(const std::string& templatePid) {
    if (TemplateFeed* feed = feedFor(templatePid)) return feed->remaining() == 0;
    return copiesLeft_[templatePid] == 0;
}

std::optional<Page> StaticClusterPolicy::buildPage(std::size_t index) {
    while (current_ < order_.size() && clusterDone(order_[current_])) ++current_;

    const bool clusterLeft = current_ < order_.size();
    if (!clusterLeft && !(index == 0 && hasTemplatedSlots())) return std::nullopt;

    Page page;
    page.placements.reserve(slotPlans().size());
    std::size_t placedStatics = 0;
    for (const SlotPlan& plan : slotPlans()) {
        Placement placement = plan.emptyPlacement();
        if (clusterLeft && plan.source && plan.source->pid() == order_[current_]) {
            if (TemplateFeed* feed = feedFor(plan.source->pid())) {
                placement.instance = mergedInstance(*plan.source, *feed);
            } else if (placedStatics < copiesLeft_[plan.source->pid()]) {
                placement.instance = staticInstance(*plan.source);
                ++placedStatics;
            }
        }
        page.placements.push_back(std::move(placement));
    }
    if (clusterLeft && !feedFor(order_[current_])) copiesLeft_[order_[current_]] -= placedStatics;
    return page;
}

} // namespace protolayout
