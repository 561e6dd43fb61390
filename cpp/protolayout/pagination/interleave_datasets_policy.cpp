#include "protolayout/pagination/interleave_datasets_policy.h"

#include "protolayout/model/component.h"

namespace protolayout {

InterleaveDatasetsPolicy::InterleaveDatasetsPolicy(const nlohmann::json& params) {
    if (!params.is_object()) throw PaginationError(std::string(kName) + ": params must be an object");
    auto it = params.find("stride");
    if (it == params.end()) return;
    if (!it->is_number_integer() || it->get<long long>() < 0) {
        throw PaginationError(std::string(kName) + ": 'stride' must be a non-negative integer");
    }
    stride_ = static_cast<std::size_t>(it->get<long long>());
}

std::optional<Page> InterleaveDatasetsPolicy::buildPage(std::size_t index) {
    const bool emit = index == 0 ? hasTemplatedSlots() : anyRemaining(dynamicTemplates());
    if (!emit) return std::nullopt;

    const std::vector<SlotPlan>& plans = slotPlans();
    Page page;
    page.placements.reserve(plans.size());
    for (const SlotPlan& plan : plans) page.placements.push_back(plan.emptyPlacement());

    const std::size_t offset = (index % plans.size()) * (stride_ % plans.size()) % plans.size();
    for (std::size_t k = 0; k < plans.size(); ++k) {
        const std::size_t i = (offset + k) % plans.size();
        const SlotPlan& plan = plans[i];
        if (!plan.source) continue;
        TemplateFeed* feed = feedFor(plan.source->pid());
        page.placements[i].instance = feed ? mergedInstance(*plan.source, *feed) : staticInstance(*plan.source);
    }
    return page;
}

} // namespace protolayout
