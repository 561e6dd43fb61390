#include "protolayout/merge/merge_manager.h"

#include "protolayout/core/errors.h"
#include "protolayout/core/logging.h"
#include "protolayout/model/component.h"

#include <algorithm>
#include <utility>

namespace protolayout {

const char* headerStatusName(HeaderStatus status) noexcept {
    switch (status) {
        case HeaderStatus::Ok: return "ok";
        case HeaderStatus::Missing: return "missing";
        case HeaderStatus::Unused: return "unused";
    }
    return "ok";
}

void MergeManager::bind(const std::string& templatePid, std::shared_ptr<const Dataset> dataset) {
    if (templatePid.empty()) throw ConfigurationError("dataset binding needs a template PID");
    if (!dataset) throw ConfigurationError("null dataset bound to '" + templatePid + "'");
    PROTOLAYOUT_LOG_DEBUG("bound dataset %s (%zu rows) to %s", dataset->name().c_str(), dataset->rowCount(),
                          templatePid.c_str());
    bindings_.push_back(DatasetBinding{templatePid, std::move(dataset)});
}

std::shared_ptr<const Dataset> MergeManager::loadCsv(const std::string& templatePid, const std::string& path) {
    auto dataset = loadCsvFile(path, onWarning_);
    bind(templatePid, dataset);
    return dataset;
}

bool MergeManager::unbind(const std::string& templatePid) {
    const auto before = bindings_.size();
    bindings_.erase(std::remove_if(bindings_.begin(), bindings_.end(),
                                   [&templatePid](const DatasetBinding& b) { return b.templatePid == templatePid; }),
                    bindings_.end());
    return bindings_.size() != before;
}

bool MergeManager::hasBinding(const std::string& templatePid) const {
    return std::any_of(bindings_.begin(), bindings_.end(),
                       [&templatePid](const DatasetBinding& b) { return b.templatePid == templatePid; });
}

std::vector<std::shared_ptr<const Dataset>> MergeManager::datasetsFor(const std::string& templatePid) const {
    std::vector<std::shared_ptr<const Dataset>> out;
    for (const auto& b : bindings_) {
        if (b.templatePid == templatePid) out.push_back(b.dataset);
    }
    return out;
}

std::size_t MergeManager::remaining(const std::string& templatePid) const {
    std::size_t total = 0;
    for (const auto& b : bindings_) {
        if (b.templatePid == templatePid) total += b.dataset->validRowCount();
    }
    return total;
}

std::vector<HeaderCheck> MergeManager::validateHeaders(const ComponentBase& component, const Dataset& dataset) {
    std::vector<HeaderCheck> out;
    const std::vector<std::string> fields = component.boundFields();
    for (const auto& field : fields) {
        const bool present = dataset.columnIndex(field).has_value();
        out.push_back(HeaderCheck{field, present ? HeaderStatus::Ok : HeaderStatus::Missing});
    }
    for (const auto& header : dataset.bindingHeaders()) {
        if (std::find(fields.begin(), fields.end(), header) == fields.end()) {
            out.push_back(HeaderCheck{header, HeaderStatus::Unused});
        }
    }
    return out;
}

} // namespace protolayout
