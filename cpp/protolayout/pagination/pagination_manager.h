#ifndef PROTOLAYOUT_PAGINATION_PAGINATION_MANAGER_H
#define PROTOLAYOUT_PAGINATION_PAGINATION_MANAGER_H

#include "protolayout/core/errors.h"
#include "protolayout/merge/merge_manager.h"
#include "protolayout/pagination/page.h"
#include "protolayout/pagination/pagination_policy.h"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <iterator>
#include <memory>
#include <vector>

namespace protolayout {

class LayoutTemplate;
class ProtoRegistry;

struct PaginationOptions {
    // Hard page limit. 0 uses kDefaultPageCeiling.
    std::size_t pageCeiling = 0;
    // Registry receiving the generated instances; null keeps them unregistered.
    ProtoRegistry* instanceRegistry = nullptr;
    WarningHandler onWarning;
};

// Thin page cache in front of a pagination policy.
//
// The policy is built from the layout's policy name and params on first use.
// Pages are generated strictly in increasing order and cached; references
// returned by getPage() stay valid until reset(). Cached pages name slots by
// PID, so they stay readable when the layout is regridded, but generating
// further pages after a regrid throws PaginationError until reset().
class PaginationManager {
public:
    class PageIterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Page;
        using difference_type = std::ptrdiff_t;
        using pointer = const Page*;
        using reference = const Page&;

        PageIterator() = default;
        PageIterator(PaginationManager* manager, std::size_t index) : manager_(manager), index_(index) {}

        reference operator*() const { return manager_->getPage(index_); }
        pointer operator->() const { return &manager_->getPage(index_); }
        PageIterator& operator++() {
            ++index_;
            return *this;
        }

        bool operator==(const PageIterator& other) const {
            const bool end = atEnd();
            return end == other.atEnd() && (end || index_ == other.index_);
        }
        bool operator!=(const PageIterator& other) const { return !(*this == other); }

    private:
        bool atEnd() const { return manager_ == nullptr || !manager_->ensurePage(index_); }

        PaginationManager* manager_ = nullptr;
        std::size_t index_ = 0;
    };

    // Restartable view: each begin() starts over at page 0 from the cache.
    class PageRange {
    public:
        explicit PageRange(PaginationManager* manager) : manager_(manager) {}
        PageIterator begin() const { return PageIterator(manager_, 0); }
        PageIterator end() const { return PageIterator(); }

    private:
        PaginationManager* manager_;
    };

    PaginationManager(const LayoutTemplate& layout, std::vector<DatasetBinding> bindings = {},
                      PaginationOptions options = {});
    PaginationManager(const LayoutTemplate& layout, const MergeManager& merge, PaginationOptions options = {});

    PaginationManager(const PaginationManager&) = delete;
    PaginationManager& operator=(const PaginationManager&) = delete;

    // Total number of pages. This drains the policy: a count is only known
    // once the last page exists, so every page is generated and cached.
    std::size_t pageCount();
    // Generates pages 0..index as needed. Throws std::out_of_range past the last page.
    const Page& getPage(std::size_t index);
    // Drains the policy. Throws PaginationError if the ceiling is exceeded.
    const std::deque<Page>& generate();
    PageRange iterPages() { return PageRange(this); }

    // Generates up to `index`; false if the policy runs out first.
    bool ensurePage(std::size_t index);

    bool exhausted() const noexcept { return exhausted_; }
    std::size_t cachedPageCount() const noexcept { return pages_.size(); }
    std::size_t pageCeiling() const noexcept;
    const PaginationPolicy* policy() const noexcept { return policy_.get(); }

    // Drops cached pages and the policy; the next request starts over.
    void reset();
    // Digest of the cached pages, stable across regeneration.
    std::uint64_t digest() const;

private:
    void ensurePolicy();
    bool advance();

    const LayoutTemplate& layout_;
    std::vector<DatasetBinding> bindings_;
    PaginationOptions options_;
    std::unique_ptr<PaginationPolicy> policy_;
    std::deque<Page> pages_;
    bool exhausted_ = false;
};

} // namespace protolayout

#endif // PROTOLAYOUT_PAGINATION_PAGINATION_MANAGER_H
