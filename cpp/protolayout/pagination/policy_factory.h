#ifndef PROTOLAYOUT_PAGINATION_POLICY_FACTORY_H
#define PROTOLAYOUT_PAGINATION_POLICY_FACTORY_H

#include "protolayout/pagination/pagination_policy.h"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace protolayout {

// Closed name -> constructor table for pagination policies.
class PaginationPolicyFactory {
public:
    static constexpr const char* kDefaultPolicy = "InterleaveDatasets";

    // Throws PaginationError for unknown names or params the policy rejects.
    static std::unique_ptr<PaginationPolicy> create(std::string_view name,
                                                    const nlohmann::json& params = nlohmann::json::object());
    static bool has(std::string_view name);
    static std::vector<std::string> names();
};

} // namespace protolayout

#endif // PROTOLAYOUT_PAGINATION_POLICY_FACTORY_H
