#ifndef PROTOLAYOUT_PAGINATION_PAGINATION_POLICY_H
#define PROTOLAYOUT_PAGINATION_PAGINATION_POLICY_H

#include "protolayout/core/errors.h"
#include "protolayout/merge/dataset.h"
#include "protolayout/merge/merge_manager.h"
#include "protolayout/pagination/page.h"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace protolayout {

class ComponentInstance;
class ComponentTemplate;
class LayoutTemplate;
class ProtoRegistry;

// A layout slot resolved against the registry. Blank slots have no source.
struct SlotPlan {
    std::string slotPid;
    std::size_t row = 0;
    std::size_t column = 0;
    const ComponentTemplate* source = nullptr;

    Placement emptyPlacement() const { return Placement{slotPid, row, column, nullptr}; }
};

// Cursors over every dataset bound to one template, consumed round-robin:
// one row per slot occurrence, rotating across datasets.
class TemplateFeed {
public:
    struct Row {
        const Dataset* dataset;
        const DataRow* row;
    };

    explicit TemplateFeed(std::string templatePid);

    const std::string& templatePid() const noexcept { return templatePid_; }
    void addDataset(std::shared_ptr<const Dataset> dataset);
    std::size_t datasetCount() const noexcept { return cursors_.size(); }
    std::size_t remaining() const noexcept;

    // Row for the next slot occurrence. When the dataset whose turn it is has
    // run dry the slot stays empty; the rotation still advances.
    std::optional<Row> pull(const WarningHandler& onWarning);

private:
    std::string templatePid_;
    std::vector<DatasetCursor> cursors_;
    std::size_t turn_ = 0;
};

// Strategy deciding the placements of each page.
//
// Lifecycle: NotPrepared -> prepare() -> Prepared -> nextPage()* -> Exhausted.
// prepare() may be called again at any time to restart. A policy exclusively
// owns the cursors it creates; datasets themselves are shared read-only.
class PaginationPolicy {
public:
    enum class State : std::uint8_t {
        NotPrepared = 0,
        Prepared = 1,
        Exhausted = 2,
    };

    virtual ~PaginationPolicy();

    PaginationPolicy(const PaginationPolicy&) = delete;
    PaginationPolicy& operator=(const PaginationPolicy&) = delete;

    virtual const char* name() const noexcept = 0;

    // Throws ConfigurationError if the layout has no slots, a slot names a
    // template the layout's registry cannot resolve, a binding is empty, or
    // the slots show more distinct templates than the layout's lockAt.
    void prepare(const LayoutTemplate& layout, const std::vector<DatasetBinding>& bindings);

    // Next page, or std::nullopt once nothing remains (terminal).
    // Throws PaginationError when called before prepare() or after the
    // layout's slots were recreated since prepare().
    std::optional<Page> nextPage();

    State state() const noexcept { return state_; }
    std::size_t pagesEmitted() const noexcept { return emitted_; }

    void setWarningHandler(WarningHandler handler) { onWarning_ = std::move(handler); }
    // Instances created from here on are registered into `registry` (may be null).
    void setInstanceRegistry(ProtoRegistry* registry) noexcept { instanceRegistry_ = registry; }

protected:
    PaginationPolicy() = default;

    // Policy-specific validation after the common preparation.
    virtual void onPrepare() {}
    virtual std::optional<Page> buildPage(std::size_t index) = 0;

    const LayoutTemplate& layout() const { return *layout_; }
    const std::vector<SlotPlan>& slotPlans() const noexcept { return plans_; }

    TemplateFeed* feedFor(const std::string& templatePid);
    // Data-bound templates in first row-major appearance.
    const std::vector<std::string>& dynamicTemplates() const noexcept { return dynamicOrder_; }
    bool anyRemaining(const std::vector<std::string>& templatePids) const;
    bool hasTemplatedSlots() const noexcept;

    // One shared unmerged instance per template for the whole run.
    std::shared_ptr<const ComponentInstance> staticInstance(const ComponentTemplate& source);
    // Fresh instance merged with the feed's next row; null when the row is missing.
    std::shared_ptr<const ComponentInstance> mergedInstance(const ComponentTemplate& source, TemplateFeed& feed);

    const WarningHandler& warningHandler() const noexcept { return onWarning_; }
    void warn(const std::string& message) const;

private:
    void registerInstance(ComponentInstance& instance);

    State state_ = State::NotPrepared;
    const LayoutTemplate* layout_ = nullptr;
    std::uint64_t slotGeneration_ = 0;
    std::vector<SlotPlan> plans_;
    std::map<std::string, TemplateFeed> feeds_;
    std::vector<std::string> dynamicOrder_;
    std::map<std::string, std::shared_ptr<const ComponentInstance>> staticCache_;
    std::size_t emitted_ = 0;
    WarningHandler onWarning_;
    ProtoRegistry* instanceRegistry_ = nullptr;
};

} // namespace protolayout

#endif // PROTOLAYOUT_PAGINATION_PAGINATION_POLICY_H
