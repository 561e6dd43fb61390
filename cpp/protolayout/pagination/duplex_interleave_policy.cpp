#include "protolayout/pagination/duplex_interleave_policy.h"

#include "protolayout/model/component.h"
#include "protolayout/model/layout_template.h"
#include "protolayout/registry/proto_registry.h"

namespace protolayout {

DuplexInterleavePolicy::DuplexInterleavePolicy(const nlohmann::json& params) {
    if (!params.is_object()) throw PaginationError(std::string(kName) + ": params must be an object");
    auto back = params.find("back_pid");
    if (back != params.end() && !back->is_null()) {
        if (!back->is_string() || back->get<std::string>().empty()) {
            throw PaginationError(std::string(kName) + ": 'back_pid' must be a template PID");
        }
        requestedBack_ = back->get<std::string>();
    }
    auto flip = params.find("flip");
    if (flip == params.end()) return;
    if (flip->is_string() && flip->get<std::string>() == "long") {
        flip_ = Flip::LongEdge;
    } else if (flip->is_string() && flip->get<std::string>() == "short") {
        flip_ = Flip::ShortEdge;
    } else {
        throw PaginationError(std::string(kName) + ": 'flip' must be \"long\" or \"short\"");
    }
}

void DuplexInterleavePolicy::onPrepare() {
    front_.clear();
    back_ = nullptr;
    filled_.assign(slotPlans().size(), false);
    anyFilled_ = false;

    if (dynamicTemplates().empty()) {
        throw ConfigurationError(std::string(kName) + ": no slot shows a data-bound front template");
    }
    front_ = dynamicTemplates().front();

    if (!requestedBack_.empty()) {
        const ProtoRegistry* registry = layout().registry();
        back_ = registry ? registry->get<ComponentTemplate>(requestedBack_) : nullptr;
        if (!back_) {
            throw ConfigurationError(std::string(kName) + ": unknown back template '" + requestedBack_ + "'");
        }
        return;
    }
    for (const SlotPlan& plan : slotPlans()) {
        if (plan.source && plan.source->pid() != front_) {
            back_ = plan.source;
            return;
        }
    }
    throw ConfigurationError(std::string(kName) + ": no back template; set 'back_pid' or show a second template");
}

std::optional<Page> DuplexInterleavePolicy::buildPage(std::size_t index) {
    if (index % 2 == 1) {
        if (!anyFilled_) return std::nullopt;
        return backPage();
    }
    if (index > 0 && feedFor(front_)->remaining() == 0) return std::nullopt;
    return frontPage();
}

Page DuplexInterleavePolicy::frontPage() {
    TemplateFeed& feed = *feedFor(front_);
    Page page;
    page.placements.reserve(slotPlans().size());
    anyFilled_ = false;
    for (std::size_t i = 0; i < slotPlans().size(); ++i) {
        const SlotPlan& plan = slotPlans()[i];
        Placement placement = plan.emptyPlacement();
        if (plan.source && plan.source->pid() == front_) placement.instance = mergedInstance(*plan.source, feed);
        filled_[i] = !placement.empty();
        anyFilled_ = anyFilled_ || filled_[i];
        page.placements.push_back(std::move(placement));
    }
    return page;
}

Page DuplexInterleavePolicy::backPage() {
    TemplateFeed* feed = feedFor(back_->pid());
    Page page;
    page.placements.reserve(slotPlans().size());
    for (const SlotPlan& plan : slotPlans()) {
        Placement placement = plan.emptyPlacement();
        if (filled_[mirrorOf(plan)]) {
            placement.instance = feed ? mergedInstance(*back_, *feed) : staticInstance(*back_);
        }
        page.placements.push_back(std::move(placement));
    }
    return page;
}

std::size_t DuplexInterleavePolicy::mirrorOf(const SlotPlan& plan) const {
    const std::size_t rows = layout().rows();
    const std::size_t columns = layout().columns();
    if (flip_ == Flip::LongEdge) return plan.row * columns + (columns - 1 - plan.column);
    return (rows - 1 - plan.row) * columns + plan.column;
}

} // namespace protolayout
