#include "protolayout/pagination/pagination_policy.h"

#include "protolayout/core/logging.h"
#include "protolayout/model/component.h"
#include "protolayout/model/layout_template.h"
#include "protolayout/registry/proto_registry.h"

#include <algorithm>

namespace protolayout {

// =============================================================================
// TemplateFeed
// =============================================================================

TemplateFeed::TemplateFeed(std::string templatePid) : templatePid_(std::move(templatePid)) {}

void TemplateFeed::addDataset(std::shared_ptr<const Dataset> dataset) {
    cursors_.emplace_back(std::move(dataset));
}

std::size_t TemplateFeed::remaining() const noexcept {
    std::size_t total = 0;
    for (const auto& cursor : cursors_) total += cursor.remaining();
    return total;
}

std::optional<TemplateFeed::Row> TemplateFeed::pull(const WarningHandler& onWarning) {
    if (cursors_.empty()) return std::nullopt;
    DatasetCursor& cursor = cursors_[turn_ % cursors_.size()];
    ++turn_;
    const DataRow* row = cursor.next(onWarning);
    if (!row) return std::nullopt;
    return Row{&cursor.dataset(), row};
}

// =============================================================================
// PaginationPolicy
// =============================================================================

PaginationPolicy::~PaginationPolicy() = default;

void PaginationPolicy::prepare(const LayoutTemplate& layout, const std::vector<DatasetBinding>& bindings) {
    state_ = State::NotPrepared;
    layout_ = nullptr;
    plans_.clear();
    feeds_.clear();
    dynamicOrder_.clear();
    staticCache_.clear();
    emitted_ = 0;

    if (layout.slotCount() == 0) {
        throw ConfigurationError("layout '" + layout.pid() + "' has no slots to paginate");
    }

    const ProtoRegistry* registry = layout.registry();
    std::vector<SlotPlan> plans;
    plans.reserve(layout.slotCount());
    for (const LayoutSlot* slot : layout.slots()) {
        SlotPlan plan{slot->pid(), slot->row(), slot->column(), nullptr};
        if (slot->hasTemplate()) {
            if (!registry) {
                throw ConfigurationError("layout '" + layout.pid() + "' is not registered; cannot resolve template '"
                    + slot->templatePid() + "'");
            }
            plan.source = registry->get<ComponentTemplate>(slot->templatePid());
            if (!plan.source) {
                throw ConfigurationError("slot '" + slot->pid() + "' references unknown template '"
                    + slot->templatePid() + "'");
            }
        }
        plans.push_back(plan);
    }

    if (layout.lockAt() > 0) {
        std::vector<std::string> distinct;
        for (const auto& plan : plans) {
            if (plan.source && std::find(distinct.begin(), distinct.end(), plan.source->pid()) == distinct.end()) {
                distinct.push_back(plan.source->pid());
            }
        }
        if (distinct.size() > layout.lockAt()) {
            throw ConfigurationError("layout '" + layout.pid() + "' accepts " + std::to_string(layout.lockAt())
                + " component template(s) but its slots show " + std::to_string(distinct.size()));
        }
    }

    std::map<std::string, TemplateFeed> feeds;
    for (const auto& binding : bindings) {
        if (binding.templatePid.empty() || !binding.dataset) {
            throw ConfigurationError("dataset binding is missing its template or dataset");
        }
        const bool used = std::any_of(plans.begin(), plans.end(), [&binding](const SlotPlan& p) {
            return p.source && p.source->pid() == binding.templatePid;
        });
        if (!used) {
            warn("dataset '" + binding.dataset->name() + "' is bound to template '" + binding.templatePid
                + "', which no slot of the layout shows; ignored");
            continue;
        }
        auto it = feeds.find(binding.templatePid);
        if (it == feeds.end()) it = feeds.emplace(binding.templatePid, TemplateFeed(binding.templatePid)).first;
        it->second.addDataset(binding.dataset);
    }

    std::vector<std::string> order;
    for (const auto& plan : plans) {
        if (!plan.source || feeds.count(plan.source->pid()) == 0) continue;
        if (std::find(order.begin(), order.end(), plan.source->pid()) == order.end()) {
            order.push_back(plan.source->pid());
        }
    }

    layout_ = &layout;
    slotGeneration_ = layout.slotGeneration();
    plans_ = std::move(plans);
    feeds_ = std::move(feeds);
    dynamicOrder_ = std::move(order);
    onPrepare();
    state_ = State::Prepared;
    PROTOLAYOUT_LOG_DEBUG("%s prepared: %zu slots, %zu data-bound templates", name(), plans_.size(),
                          dynamicOrder_.size());
}

std::optional<Page> PaginationPolicy::nextPage() {
    if (state_ == State::NotPrepared) {
        throw PaginationError(std::string(name()) + ": nextPage() called before prepare()");
    }
    if (state_ == State::Exhausted) return std::nullopt;
    if (layout_->slotGeneration() != slotGeneration_) {
        throw PaginationError(std::string(name()) + ": slots of layout '" + layout_->pid()
            + "' changed since prepare()");
    }

    std::optional<Page> page = buildPage(emitted_);
    if (!page) {
        state_ = State::Exhausted;
        return std::nullopt;
    }
    if (page->placements.size() != plans_.size()) {
        throw PaginationError(std::string(name()) + ": page " + std::to_string(emitted_) + " has "
            + std::to_string(page->placements.size()) + " placements for " + std::to_string(plans_.size())
            + " slots");
    }
    page->index = emitted_++;
    return page;
}

TemplateFeed* PaginationPolicy::feedFor(const std::string& templatePid) {
    auto it = feeds_.find(templatePid);
    return it == feeds_.end() ? nullptr : &it->second;
}

bool PaginationPolicy::anyRemaining(const std::vector<std::string>& templatePids) const {
    for (const auto& pid : templatePids) {
        auto it = feeds_.find(pid);
        if (it != feeds_.end() && it->second.remaining() > 0) return true;
    }
    return false;
}

bool PaginationPolicy::hasTemplatedSlots() const noexcept {
    return std::any_of(plans_.begin(), plans_.end(), [](const SlotPlan& p) { return p.source != nullptr; });
}

std::shared_ptr<const ComponentInstance> PaginationPolicy::staticInstance(const ComponentTemplate& source) {
    auto it = staticCache_.find(source.pid());
    if (it != staticCache_.end()) return it->second;
    auto instance = ComponentInstance::fromTemplate(source);
    registerInstance(*instance);
    staticCache_.emplace(source.pid(), instance);
    return instance;
}

std::shared_ptr<const ComponentInstance> PaginationPolicy::mergedInstance(const ComponentTemplate& source,
                                                                         TemplateFeed& feed) {
    const auto pulled = feed.pull(onWarning_);
    if (!pulled) return nullptr;
    auto instance = ComponentInstance::fromTemplate(source);
    instance->applyData(pulled->dataset->record(*pulled->row), DataRowRef{pulled->dataset->name(), pulled->row->line});
    registerInstance(*instance);
    return instance;
}

void PaginationPolicy::warn(const std::string& message) const {
    PROTOLAYOUT_LOG_WARN("%s", message.c_str());
    if (onWarning_) onWarning_(message);
}

void PaginationPolicy::registerInstance(ComponentInstance& instance) {
    if (instanceRegistry_) instanceRegistry_->registerObject(instance);
}

} // namespace protolayout
