#ifndef PROTOLAYOUT_PAGINATION_STATIC_FIRST_ROW_POLICY_H
#define PROTOLAYOUT_PAGINATION_STATIC_FIRST_ROW_POLICY_H

#include "protolayout/pagination/pagination_policy.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace protolayout {

// The first `static_rows` grid rows always show the unmerged instance of
// their slot's template (headers, rules cards); the rest interleave.
//
// Params: { "static_rows": 1 }.
class StaticFirstRowPolicy : public PaginationPolicy {
public:
    static constexpr const char* kName = "StaticFirstRow";

    // Throws PaginationError on malformed params.
    explicit StaticFirstRowPolicy(const nlohmann::json& params = nlohmann::json::object());

    const char* name() const noexcept override { return kName; }
    std::size_t staticRows() const noexcept { return staticRows_; }

protected:
    void onPrepare() override;
    std::optional<Page> buildPage(std::size_t index) override;

private:
    std::size_t staticRows_ = 1;
    std::vector<std::string> consumed_;
};

} // namespace protolayout

#endif // PROTOLAYOUT_PAGINATION_STATIC_FIRST_ROW_POLICY_H
