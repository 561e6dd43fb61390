#include "protolayout/pagination/pagination_manager.h"

#include "protolayout/core/logging.h"
#include "protolayout/core/string_utils.h"
#include "protolayout/core/types.h"
#include "protolayout/model/layout_template.h"
#include "protolayout/pagination/policy_factory.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace protolayout {

PaginationManager::PaginationManager(const LayoutTemplate& layout, std::vector<DatasetBinding> bindings,
                                     PaginationOptions options)
    : layout_(layout), bindings_(std::move(bindings)), options_(std::move(options)) {}

PaginationManager::PaginationManager(const LayoutTemplate& layout, const MergeManager& merge,
                                     PaginationOptions options)
    : layout_(layout), bindings_(merge.bindings()), options_(std::move(options)) {
    if (!options_.onWarning) options_.onWarning = merge.warningHandler();
}

std::size_t PaginationManager::pageCount() {
    generate();
    return pages_.size();
}

const Page& PaginationManager::getPage(std::size_t index) {
    if (!ensurePage(index)) {
        throw std::out_of_range("page " + std::to_string(index) + " does not exist; layout has "
            + std::to_string(pages_.size()) + " page(s)");
    }
    return pages_[index];
}

const std::deque<Page>& PaginationManager::generate() {
    while (advance()) {
    }
    return pages_;
}

bool PaginationManager::ensurePage(std::size_t index) {
    while (pages_.size() <= index) {
        if (!advance()) return false;
    }
    return true;
}

std::size_t PaginationManager::pageCeiling() const noexcept {
    return options_.pageCeiling > 0 ? options_.pageCeiling : kDefaultPageCeiling;
}

void PaginationManager::reset() {
    policy_.reset();
    pages_.clear();
    exhausted_ = false;
}

std::uint64_t PaginationManager::digest() const {
    std::uint64_t h = hashU32(kDigestOffset, static_cast<std::uint32_t>(pages_.size()));
    for (const auto& page : pages_) h = pageDigest(page, h);
    return h;
}

void PaginationManager::ensurePolicy() {
    if (policy_) return;
    auto policy = PaginationPolicyFactory::create(layout_.paginationPolicy(), layout_.paginationParams());
    policy->setWarningHandler(options_.onWarning);
    policy->setInstanceRegistry(options_.instanceRegistry);
    policy->prepare(layout_, bindings_);
    policy_ = std::move(policy);
}

bool PaginationManager::advance() {
    if (exhausted_) return false;
    ensurePolicy();
    std::optional<Page> page = policy_->nextPage();
    if (!page) {
        exhausted_ = true;
        PROTOLAYOUT_LOG_DEBUG("pagination of %s finished with %zu page(s)", layout_.pid().c_str(), pages_.size());
        return false;
    }
    const std::size_t ceiling = pageCeiling();
    if (pages_.size() >= ceiling) {
        throw PaginationError("layout '" + layout_.pid() + "' exceeded the page ceiling of "
            + std::to_string(ceiling) + " page(s)");
    }
    pages_.push_back(std::move(*page));
    return true;
}

} // namespace protolayout
