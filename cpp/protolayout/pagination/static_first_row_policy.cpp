#include "protolayout/pagination/static_first_row_policy.h"

#include "protolayout/model/component.h"

#include <algorithm>

namespace protolayout {

StaticFirstRowPolicy::StaticFirstRowPolicy(const nlohmann::json& params) {
    if (!params.is_object()) throw PaginationError(std::string(kName) + ": params must be an object");
    auto it = params.find("static_rows");
    if (it == params.end()) return;
    if (!it->is_number_integer() || it->get<long long>() < 0) {
        throw PaginationError(std::string(kName) + ": 'static_rows' must be a non-negative integer");
    }
    staticRows_ = static_cast<std::size_t>(it->get<long long>());
}

void StaticFirstRowPolicy::onPrepare() {
    consumed_.clear();
    for (const SlotPlan& plan : slotPlans()) {
        if (!plan.source || plan.row < staticRows_ || !feedFor(plan.source->pid())) continue;
        if (std::find(consumed_.begin(), consumed_.end(), plan.source->pid()) == consumed_.end()) {
            consumed_.push_back(plan.source->pid());
        }
    }
}

std::optional<Page> StaticFirstRowPolicy::buildPage(std::size_t index) {
    const bool emit = index == 0 ? hasTemplatedSlots() : anyRemaining(consumed_);
    if (!emit) return std::nullopt;

    Page page;
    page.placements.reserve(slotPlans().size());
    for (const SlotPlan& plan : slotPlans()) {
        Placement placement = plan.emptyPlacement();
        if (plan.source) {
            TemplateFeed* feed = plan.row < staticRows_ ? nullptr : feedFor(plan.source->pid());
            placement.instance = feed ? mergedInstance(*plan.source, *feed) : staticInstance(*plan.source);
        }
        page.placements.push_back(std::move(placement));
    }
    return page;
}

} // namespace protolayout
