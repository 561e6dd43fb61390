#include "protolayout/pagination/policy_factory.h"

#include "protolayout/pagination/cluster_by_dataset_policy.h"
#include "protolayout/pagination/duplex_interleave_policy.h"
#include "protolayout/pagination/interleave_datasets_policy.h"
#include "protolayout/pagination/static_cluster_policy.h"
#include "protolayout/pagination/static_first_row_policy.h"

#include <array>

namespace protolayout {

namespace {

using PolicyCtor = std::unique_ptr<PaginationPolicy> (*)(const nlohmann::json&);

struct PolicyEntry {
    std::string_view name;
    PolicyCtor create;
};

std::unique_ptr<PaginationPolicy> makeInterleave(const nlohmann::json& params) {
    return std::make_unique<InterleaveDatasetsPolicy>(params.is_null() ? nlohmann::json::object() : params);
}

std::unique_ptr<PaginationPolicy> makeCluster(const nlohmann::json& params) {
    return std::make_unique<ClusterByDatasetPolicy>(params.is_null() ? nlohmann::json::object() : params);
}

std::unique_ptr<PaginationPolicy> makeStaticFirstRow(const nlohmann::json& params) {
    return std::make_unique<StaticFirstRowPolicy>(params.is_null() ? nlohmann::json::object() : params);
}

std::unique_ptr<PaginationPolicy> makeDuplex(const nlohmann::json& params) {
    return std::make_unique<DuplexInterleavePolicy>(params.is_null() ? nlohmann::json::object() : params);
}

std::unique_ptr<PaginationPolicy> makeStaticCluster(const nlohmann::json& params) {
    return std::make_unique<StaticClusterPolicy>(params.is_null() ? nlohmann::json::object() : params);
}

constexpr std::array<PolicyEntry, 5> kPolicies = {{
    {"InterleaveDatasets", &makeInterleave},
    {"ClusterByDataset", &makeCluster},
    {"StaticFirstRow", &makeStaticFirstRow},
    {"DuplexInterleave", &makeDuplex},
    {"StaticCluster", &makeStaticCluster},
}};

} // namespace

std::unique_ptr<PaginationPolicy> PaginationPolicyFactory::create(std::string_view name, const nlohmann::json& params) {
    const std::string_view key = name.empty() ? std::string_view(kDefaultPolicy) : name;
    for (const auto& entry : kPolicies) {
        if (entry.name == key) return entry.create(params);
    }
    throw PaginationError("unknown pagination policy '" + std::string(name) + "'");
}

bool PaginationPolicyFactory::has(std::string_view name) {
    for (const auto& entry : kPolicies) {
        if (entry.name == name) return true;
    }
    return false;
}

std::vector<std::string> PaginationPolicyFactory::names() {
    std::vector<std::string> out;
    for (const auto& entry : kPolicies) out.emplace_back(entry.name);
    return out;
}

} // namespace protolayout
