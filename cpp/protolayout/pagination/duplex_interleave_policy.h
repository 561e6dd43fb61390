#ifndef PROTOLAYOUT_PAGINATION_DUPLEX_INTERLEAVE_POLICY_H
#define PROTOLAYOUT_PAGINATION_DUPLEX_INTERLEAVE_POLICY_H

#include "protolayout/pagination/pagination_policy.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace protolayout {

// Double-sided sheets: even pages are fronts, odd pages their backs.
//
// The front template is the first data-bound template in row-major order;
// its slots take the next feed rows and every other slot stays empty. Each
// front page is followed by a back page that puts the back template in the
// mirror cell of every filled front slot, so the two sides line up once the
// sheet is turned over. Backs merge rows when the back template has its own
// bound dataset and repeat one static instance otherwise. Pagination ends
// after the back of the last front page that placed anything.
//
// Params:
//   "back_pid": template for the backs; defaults to the first other template
//               shown by a slot. It need not appear in the layout.
//   "flip": "long" (default) mirrors columns, "short" mirrors rows.
class DuplexInterleavePolicy : public PaginationPolicy {
public:
    static constexpr const char* kName = "DuplexInterleave";

    enum class Flip : std::uint8_t {
        LongEdge = 0,
        ShortEdge = 1,
    };

    // Throws PaginationError on malformed params.
    explicit DuplexInterleavePolicy(const nlohmann::json& params = nlohmann::json::object());

    const char* name() const noexcept override { return kName; }
    Flip flip() const noexcept { return flip_; }

protected:
    // Throws ConfigurationError without a data-bound front template or a
    // resolvable back template.
    void onPrepare() override;
    std::optional<Page> buildPage(std::size_t index) override;

private:
    Page frontPage();
    Page backPage();
    std::size_t mirrorOf(const SlotPlan& plan) const;

    std::string requestedBack_;
    Flip flip_ = Flip::LongEdge;
    std::string front_;
    const ComponentTemplate* back_ = nullptr;
    std::vector<bool> filled_;
    bool anyFilled_ = false;
};

} // namespace protolayout

#endif // PROTOLAYOUT_PAGINATION_DUPLEX_INTERLEAVE_POLICY_H
