#ifndef PROTOLAYOUT_MERGE_MERGE_MANAGER_H
#define PROTOLAYOUT_MERGE_MERGE_MANAGER_H

#include "protolayout/merge/dataset.h"

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace protolayout {

class ComponentBase;

// A dataset feeding one component template.
struct DatasetBinding {
    std::string templatePid;
    std::shared_ptr<const Dataset> dataset;
};

enum class HeaderStatus : std::uint8_t {
    Ok = 0,       // bound element and CSV column both present
    Missing = 1,  // bound element without a CSV column
    Unused = 2,   // '@' column without a bound element
};

const char* headerStatusName(HeaderStatus status) noexcept;

struct HeaderCheck {
    std::string field;
    HeaderStatus status;
};

// Owns the loaded CSV data and maps it to component templates. A template may
// be fed by several datasets; policies interleave them.
class MergeManager {
public:
    MergeManager() = default;

    void setWarningHandler(WarningHandler handler) { onWarning_ = std::move(handler); }
    const WarningHandler& warningHandler() const noexcept { return onWarning_; }

    // Throws ConfigurationError on an empty template PID or null dataset.
    void bind(const std::string& templatePid, std::shared_ptr<const Dataset> dataset);
    std::shared_ptr<const Dataset> loadCsv(const std::string& templatePid, const std::string& path);
    bool unbind(const std::string& templatePid);
    void clear() noexcept { bindings_.clear(); }

    bool hasBinding(const std::string& templatePid) const;
    std::vector<std::shared_ptr<const Dataset>> datasetsFor(const std::string& templatePid) const;
    // In bind order.
    const std::vector<DatasetBinding>& bindings() const noexcept { return bindings_; }
    // Valid rows across every dataset bound to the template.
    std::size_t remaining(const std::string& templatePid) const;

    // Bound element names first (paint order), then unused '@' columns.
    static std::vector<HeaderCheck> validateHeaders(const ComponentBase& component, const Dataset& dataset);

private:
    std::vector<DatasetBinding> bindings_;
    WarningHandler onWarning_;
};

} // namespace protolayout

#endif // PROTOLAYOUT_MERGE_MERGE_MANAGER_H
