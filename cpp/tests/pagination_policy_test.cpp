#include "tests/test_common.h"
#include "protolayout/core/errors.h"
#include "protolayout/pagination/cluster_by_dataset_policy.h"
#include "protolayout/pagination/duplex_interleave_policy.h"
#include "protolayout/pagination/interleave_datasets_policy.h"
#include "protolayout/pagination/policy_factory.h"
#include "protolayout/pagination/static_cluster_policy.h"
#include "protolayout/pagination/static_first_row_policy.h"
#include "protolayout/registry/pid.h"

using namespace protolayout;
using protolayout_test::LayoutFixture;
using protolayout_test::mergedNames;
using protolayout_test::namesCsv;

namespace {

using Names = std::vector<std::string>;

std::vector<Page> drain(PaginationPolicy& policy) {
    std::vector<Page> pages;
    while (auto page = policy.nextPage()) pages.push_back(std::move(*page));
    return pages;
}

std::vector<Page> paginate(PaginationPolicy& policy, const LayoutTemplate& layout,
                           const std::vector<DatasetBinding>& bindings) {
    policy.prepare(layout, bindings);
    return drain(policy);
}

} // namespace

// =============================================================================
// InterleaveDatasets
// =============================================================================

TEST(InterleavePolicyTest, FillsSlotsRowMajorAcrossPages) {
    LayoutFixture fx(3, 2);
    const auto& hero = fx.addCard("Hero", {"@name"});
    fx.layout->assignTemplate(hero);

    InterleaveDatasetsPolicy policy;
    const auto pages = paginate(policy, *fx.layout, {{hero.pid(), namesCsv("hero", 10)}});

    ASSERT_EQ(pages.size(), 2u);
    EXPECT_EQ(mergedNames(pages[0]), (Names{"hero1", "hero2", "hero3", "hero4", "hero5", "hero6"}));
    EXPECT_EQ(mergedNames(pages[1]), (Names{"hero7", "hero8", "hero9", "hero10", "", ""}));
    EXPECT_EQ(pages[1].index, 1u);
    EXPECT_EQ(pages[1].filledCount(), 4u);
    EXPECT_EQ(pages[1].placements[4].slotPid, fx.layout->slotAt(2, 0).pid());
    EXPECT_EQ(pages[1].placements[4].row, 2u);
    EXPECT_EQ(pages[1].placements[4].column, 0u);
}

TEST(InterleavePolicyTest, SameInputsGiveSamePages) {
    LayoutFixture fx(3, 2);
    const auto& hero = fx.addCard("Hero", {"@name"});
    fx.layout->assignTemplate(hero);
    const std::vector<DatasetBinding> bindings{{hero.pid(), namesCsv("hero", 10)}};

    InterleaveDatasetsPolicy first;
    InterleaveDatasetsPolicy second;
    const auto a = paginate(first, *fx.layout, bindings);
    const auto b = paginate(second, *fx.layout, bindings);
    ASSERT_EQ(a.size(), b.size());
    for (std::size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(mergedNames(a[i]), mergedNames(b[i]));
        EXPECT_EQ(pageDigest(a[i], 0), pageDigest(b[i], 0));
    }
}

TEST(InterleavePolicyTest, StaticOnlyLayoutEmitsOnePageSharingOneInstance) {
    LayoutFixture fx(2, 3);
    const auto& rules = fx.addCard("Rules", {"title"});
    fx.layout->assignTemplate(rules);

    InterleaveDatasetsPolicy policy;
    const auto pages = paginate(policy, *fx.layout, {});
    ASSERT_EQ(pages.size(), 1u);
    ASSERT_EQ(pages[0].placements.size(), 6u);
    const auto shared = pages[0].placements[0].instance;
    ASSERT_NE(shared, nullptr);
    for (const auto& placement : pages[0].placements) EXPECT_EQ(placement.instance, shared);
    EXPECT_FALSE(shared->isMerged());
    EXPECT_EQ(shared->templatePid(), rules.pid());
}

TEST(InterleavePolicyTest, EmptyDatasetStillEmitsFirstPage) {
    LayoutFixture fx(2, 2);
    const auto& hero = fx.addCard("Hero", {"@name"});
    fx.layout->assignTemplate(hero);

    InterleaveDatasetsPolicy policy;
    const auto pages = paginate(policy, *fx.layout, {{hero.pid(), namesCsv("hero", 0)}});
    ASSERT_EQ(pages.size(), 1u);
    EXPECT_EQ(pages[0].filledCount(), 0u);
    EXPECT_EQ(pages[0].placements.size(), 4u);
}

TEST(InterleavePolicyTest, BlankLayoutEmitsNothing) {
    LayoutFixture fx(2, 2);
    InterleaveDatasetsPolicy policy;
    EXPECT_TRUE(paginate(policy, *fx.layout, {}).empty());
    EXPECT_EQ(policy.state(), PaginationPolicy::State::Exhausted);
}

TEST(InterleavePolicyTest, RotatesAcrossDatasetsOfOneTemplate) {
    LayoutFixture fx(2, 2);
    const auto& hero = fx.addCard("Hero", {"@name"});
    fx.layout->assignTemplate(hero);

    InterleaveDatasetsPolicy policy;
    const auto pages = paginate(policy, *fx.layout,
                                {{hero.pid(), namesCsv("a", 3, "a.csv")}, {hero.pid(), namesCsv("b", 3, "b.csv")}});
    ASSERT_EQ(pages.size(), 2u);
    EXPECT_EQ(mergedNames(pages[0]), (Names{"a1", "b1", "a2", "b2"}));
    EXPECT_EQ(mergedNames(pages[1]), (Names{"a3", "b3", "", ""}));
    EXPECT_EQ(pages[0].placements[1].instance->dataRow()->dataset, "b.csv");
}

TEST(InterleavePolicyTest, ExhaustedDatasetLeavesItsTurnEmpty) {
    LayoutFixture fx(2, 2);
    const auto& hero = fx.addCard("Hero", {"@name"});
    fx.layout->assignTemplate(hero);

    InterleaveDatasetsPolicy policy;
    const auto pages = paginate(policy, *fx.layout,
                                {{hero.pid(), namesCsv("a", 1, "a.csv")}, {hero.pid(), namesCsv("b", 3, "b.csv")}});
    ASSERT_EQ(pages.size(), 2u);
    EXPECT_EQ(mergedNames(pages[0]), (Names{"a1", "b1", "", "b2"}));
    EXPECT_EQ(mergedNames(pages[1]), (Names{"", "b3", "", ""}));
}

TEST(InterleavePolicyTest, StaticSlotsRepeatBesideDataSlots) {
    LayoutFixture fx(2, 2);
    const auto& hero = fx.addCard("Hero", {"@name"});
    const auto& rules = fx.addCard("Rules", {"title"});
    fx.layout->slotAt(0, 0).setTemplatePid(hero.pid());
    fx.layout->slotAt(0, 1).setTemplatePid(hero.pid());
    fx.layout->slotAt(1, 0).setTemplatePid(rules.pid());
    fx.layout->slotAt(1, 1).setTemplatePid(rules.pid());

    InterleaveDatasetsPolicy policy;
    const auto pages = paginate(policy, *fx.layout, {{hero.pid(), namesCsv("hero", 3)}});
    ASSERT_EQ(pages.size(), 2u);
    EXPECT_EQ(mergedNames(pages[0]), (Names{"hero1", "hero2", "<static>", "<static>"}));
    EXPECT_EQ(mergedNames(pages[1]), (Names{"hero3", "", "<static>", "<static>"}));
    EXPECT_EQ(pages[0].placements[2].instance, pages[1].placements[3].instance);
}

TEST(InterleavePolicyTest, MalformedRowsAreSkippedWithWarning) {
    LayoutFixture fx(1, 3);
    const auto& hero = fx.addCard("Hero", {"@name"});
    fx.layout->assignTemplate(hero);
    const auto data = protolayout_test::csvFromText("@name,@power\nA,1\nB\nC,3\n", "heroes.csv");

    std::vector<std::string> warnings;
    InterleaveDatasetsPolicy policy;
    policy.setWarningHandler([&warnings](const std::string& w) { warnings.push_back(w); });
    const auto pages = paginate(policy, *fx.layout, {{hero.pid(), data}});
    ASSERT_EQ(pages.size(), 1u);
    EXPECT_EQ(mergedNames(pages[0]), (Names{"A", "C", ""}));
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_NE(warnings[0].find("heroes.csv:3"), std::string::npos) << warnings[0];
}

TEST(InterleavePolicyTest, StrideRotatesWhereEachPageStarts) {
    LayoutFixture fx(2, 2);
    const auto& hero = fx.addCard("Hero", {"@name"});
    fx.layout->assignTemplate(hero);

    InterleaveDatasetsPolicy policy(nlohmann::json{{"stride", 1}});
    EXPECT_EQ(policy.stride(), 1u);
    const auto pages = paginate(policy, *fx.layout, {{hero.pid(), namesCsv("hero", 6)}});
    ASSERT_EQ(pages.size(), 2u);
    EXPECT_EQ(mergedNames(pages[0]), (Names{"hero1", "hero2", "hero3", "hero4"}));
    EXPECT_EQ(mergedNames(pages[1]), (Names{"", "hero5", "hero6", ""}));
    EXPECT_EQ(pages[1].placements[1].row, 0u);
    EXPECT_EQ(pages[1].placements[1].column, 1u);

    EXPECT_EQ(InterleaveDatasetsPolicy().stride(), 0u);
    EXPECT_THROW((InterleaveDatasetsPolicy{nlohmann::json{{"stride", -2}}}), PaginationError);
    EXPECT_THROW((InterleaveDatasetsPolicy{nlohmann::json{{"stride", "wide"}}}), PaginationError);
}

// =============================================================================
// Lifecycle
// =============================================================================

TEST(PaginationPolicyTest, StateMachine) {
    LayoutFixture fx(1, 2);
    const auto& hero = fx.addCard("Hero", {"@name"});
    fx.layout->assignTemplate(hero);

    InterleaveDatasetsPolicy policy;
    EXPECT_EQ(policy.state(), PaginationPolicy::State::NotPrepared);
    EXPECT_THROW(policy.nextPage(), PaginationError);

    const std::vector<DatasetBinding> bindings{{hero.pid(), namesCsv("hero", 3)}};
    policy.prepare(*fx.layout, bindings);
    EXPECT_EQ(policy.state(), PaginationPolicy::State::Prepared);
    EXPECT_TRUE(policy.nextPage().has_value());
    EXPECT_TRUE(policy.nextPage().has_value());
    EXPECT_FALSE(policy.nextPage().has_value());
    EXPECT_EQ(policy.state(), PaginationPolicy::State::Exhausted);
    EXPECT_FALSE(policy.nextPage().has_value());
    EXPECT_EQ(policy.pagesEmitted(), 2u);

    policy.prepare(*fx.layout, bindings);
    EXPECT_EQ(policy.pagesEmitted(), 0u);
    const auto again = drain(policy);
    ASSERT_EQ(again.size(), 2u);
    EXPECT_EQ(mergedNames(again[0]), (Names{"hero1", "hero2"}));
}

TEST(PaginationPolicyTest, PrepareRejectsUnusableLayouts) {
    InterleaveDatasetsPolicy policy;

    LayoutFixture empty(0, 0);
    EXPECT_THROW(policy.prepare(*empty.layout, {}), ConfigurationError);

    LayoutTemplate unregistered;
    unregistered.setGrid(1, 1);
    unregistered.assignTemplate(issuePid(ProtoClass::ComponentTemplate));
    EXPECT_THROW(policy.prepare(unregistered, {}), ConfigurationError);

    LayoutFixture unknown(1, 1);
    unknown.layout->assignTemplate(issuePid(ProtoClass::ComponentTemplate));
    EXPECT_THROW(policy.prepare(*unknown.layout, {}), ConfigurationError);
    EXPECT_EQ(policy.state(), PaginationPolicy::State::NotPrepared);
}

TEST(PaginationPolicyTest, RegridAfterPrepareStopsThePolicy) {
    LayoutFixture fx(2, 2);
    const auto& hero = fx.addCard("Hero", {"@name"});
    fx.layout->assignTemplate(hero);

    InterleaveDatasetsPolicy policy;
    policy.prepare(*fx.layout, {{hero.pid(), namesCsv("hero", 9)}});
    const auto first = policy.nextPage();
    ASSERT_TRUE(first.has_value());

    fx.layout->setGrid(1, 1);
    EXPECT_THROW(policy.nextPage(), PaginationError);
    EXPECT_EQ(first->placements[3].slotPid.substr(0, 3), "ls_");
    EXPECT_EQ(fx.layout->findSlot(first->placements[3].slotPid), nullptr);

    policy.prepare(*fx.layout, {{hero.pid(), namesCsv("hero", 2)}});
    EXPECT_EQ(drain(policy).size(), 2u);
}

TEST(PaginationPolicyTest, PrepareRejectsIncompleteBindings) {
    LayoutFixture fx(1, 1);
    const auto& hero = fx.addCard("Hero", {"@name"});
    fx.layout->assignTemplate(hero);

    InterleaveDatasetsPolicy policy;
    EXPECT_THROW(policy.prepare(*fx.layout, {{hero.pid(), nullptr}}), ConfigurationError);
    EXPECT_THROW(policy.prepare(*fx.layout, {{"", namesCsv("hero", 1)}}), ConfigurationError);
}

TEST(PaginationPolicyTest, WarnsAboutBindingsNoSlotUses) {
    LayoutFixture fx(1, 2);
    const auto& hero = fx.addCard("Hero", {"@name"});
    const auto& villain = fx.addCard("Villain", {"@name"});
    fx.layout->assignTemplate(hero);

    std::vector<std::string> warnings;
    InterleaveDatasetsPolicy policy;
    policy.setWarningHandler([&warnings](const std::string& w) { warnings.push_back(w); });
    const auto pages = paginate(policy, *fx.layout,
                                {{hero.pid(), namesCsv("hero", 2)}, {villain.pid(), namesCsv("villain", 5, "v.csv")}});
    EXPECT_EQ(pages.size(), 1u);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_NE(warnings[0].find("v.csv"), std::string::npos);
}

TEST(PaginationPolicyTest, RegistersInstancesWhenAsked) {
    LayoutFixture fx(1, 2);
    const auto& hero = fx.addCard("Hero", {"@name"});
    fx.layout->assignTemplate(hero);

    ProtoRegistry instances;
    InterleaveDatasetsPolicy policy;
    policy.setInstanceRegistry(&instances);
    const auto pages = paginate(policy, *fx.layout, {{hero.pid(), namesCsv("hero", 2)}});
    ASSERT_EQ(pages.size(), 1u);
    for (const auto& placement : pages[0].placements) {
        EXPECT_TRUE(instances.has(placement.instance->pid()));
    }
}

// =============================================================================
// ClusterByDataset
// =============================================================================

class ClusterPolicyTest : public ::testing::Test {
protected:
    void SetUp() override {
        hero_ = &fx_.addCard("Hero", {"@name"});
        villain_ = &fx_.addCard("Villain", {"@name"});
        fx_.layout->slotAt(0, 0).setTemplatePid(hero_->pid());
        fx_.layout->slotAt(0, 1).setTemplatePid(hero_->pid());
        fx_.layout->slotAt(1, 0).setTemplatePid(villain_->pid());
        fx_.layout->slotAt(1, 1).setTemplatePid(villain_->pid());
        bindings_ = {{hero_->pid(), namesCsv("hero", 3)}, {villain_->pid(), namesCsv("villain", 1)}};
    }

    LayoutFixture fx_{2, 2};
    const ComponentTemplate* hero_ = nullptr;
    const ComponentTemplate* villain_ = nullptr;
    std::vector<DatasetBinding> bindings_;
};

TEST_F(ClusterPolicyTest, FillsPagesOneTemplateAtATime) {
    ClusterByDatasetPolicy policy;
    const auto pages = paginate(policy, *fx_.layout, bindings_);
    ASSERT_EQ(pages.size(), 3u);
    EXPECT_EQ(mergedNames(pages[0]), (Names{"hero1", "hero2", "", ""}));
    EXPECT_EQ(mergedNames(pages[1]), (Names{"hero3", "", "", ""}));
    EXPECT_EQ(mergedNames(pages[2]), (Names{"", "", "villain1", ""}));
}

TEST_F(ClusterPolicyTest, HonoursExplicitOrder) {
    ClusterByDatasetPolicy policy(nlohmann::json{{"order", {villain_->pid(), hero_->pid()}}});
    const auto pages = paginate(policy, *fx_.layout, bindings_);
    ASSERT_EQ(pages.size(), 3u);
    EXPECT_EQ(mergedNames(pages[0]), (Names{"", "", "villain1", ""}));
    EXPECT_EQ(mergedNames(pages[1]), (Names{"hero1", "hero2", "", ""}));
}

TEST_F(ClusterPolicyTest, SkipsTemplatesWithNoRows) {
    bindings_[0].dataset = namesCsv("hero", 0);
    ClusterByDatasetPolicy policy;
    const auto pages = paginate(policy, *fx_.layout, bindings_);
    ASSERT_EQ(pages.size(), 1u);
    EXPECT_EQ(mergedNames(pages[0]), (Names{"", "", "villain1", ""}));
}

TEST_F(ClusterPolicyTest, RejectsOrderEntriesWithoutData) {
    ClusterByDatasetPolicy policy(nlohmann::json{{"order", nlohmann::json::array({issuePid(ProtoClass::ComponentTemplate)})}});
    EXPECT_THROW(policy.prepare(*fx_.layout, bindings_), ConfigurationError);
    EXPECT_THROW((ClusterByDatasetPolicy{nlohmann::json{{"order", "ct_x"}}}), PaginationError);
    EXPECT_THROW((ClusterByDatasetPolicy{nlohmann::json{{"order", {1, 2}}}}), PaginationError);
}

// =============================================================================
// StaticFirstRow
// =============================================================================

TEST(StaticFirstRowPolicyTest, LeadingRowsStayUnmerged) {
    LayoutFixture fx(2, 2);
    const auto& hero = fx.addCard("Hero", {"@name"});
    fx.layout->assignTemplate(hero);

    StaticFirstRowPolicy policy;
    EXPECT_EQ(policy.staticRows(), 1u);
    const auto pages = paginate(policy, *fx.layout, {{hero.pid(), namesCsv("hero", 3)}});
    ASSERT_EQ(pages.size(), 2u);
    EXPECT_EQ(mergedNames(pages[0]), (Names{"<static>", "<static>", "hero1", "hero2"}));
    EXPECT_EQ(mergedNames(pages[1]), (Names{"<static>", "<static>", "hero3", ""}));
}

TEST(StaticFirstRowPolicyTest, ValidatesParams) {
    EXPECT_EQ(StaticFirstRowPolicy(nlohmann::json{{"static_rows", 2}}).staticRows(), 2u);
    EXPECT_THROW((StaticFirstRowPolicy{nlohmann::json{{"static_rows", -1}}}), PaginationError);
    EXPECT_THROW((StaticFirstRowPolicy{nlohmann::json{{"static_rows", "one"}}}), PaginationError);
    EXPECT_THROW((StaticFirstRowPolicy{nlohmann::json::array()}), PaginationError);
}

// =============================================================================
// DuplexInterleave
// =============================================================================

class DuplexPolicyTest : public ::testing::Test {
protected:
    void SetUp() override {
        hero_ = &fx_.addCard("Hero", {"@name"});
        back_ = &fx_.addCard("Back", {"logo"});
        fx_.layout->assignTemplate(*hero_);
    }

    nlohmann::json params(const char* flip) const { return {{"back_pid", back_->pid()}, {"flip", flip}}; }
    std::vector<DatasetBinding> heroes(int count) const { return {{hero_->pid(), namesCsv("hero", count)}}; }

    LayoutFixture fx_{2, 3};
    const ComponentTemplate* hero_ = nullptr;
    const ComponentTemplate* back_ = nullptr;
};

TEST_F(DuplexPolicyTest, BacksMirrorColumnsOnLongEdgeFlip) {
    DuplexInterleavePolicy policy(params("long"));
    EXPECT_EQ(policy.flip(), DuplexInterleavePolicy::Flip::LongEdge);
    const auto pages = paginate(policy, *fx_.layout, heroes(4));
    ASSERT_EQ(pages.size(), 2u);
    EXPECT_EQ(mergedNames(pages[0]), (Names{"hero1", "hero2", "hero3", "hero4", "", ""}));
    EXPECT_EQ(mergedNames(pages[1]), (Names{"<static>", "<static>", "<static>", "", "", "<static>"}));
    EXPECT_EQ(pages[1].placements[5].instance->templatePid(), back_->pid());
    EXPECT_EQ(pages[1].placements[0].instance, pages[1].placements[5].instance);
}

TEST_F(DuplexPolicyTest, BacksMirrorRowsOnShortEdgeFlip) {
    DuplexInterleavePolicy policy(params("short"));
    const auto pages = paginate(policy, *fx_.layout, heroes(4));
    ASSERT_EQ(pages.size(), 2u);
    EXPECT_EQ(mergedNames(pages[1]), (Names{"<static>", "", "", "<static>", "<static>", "<static>"}));
}

TEST_F(DuplexPolicyTest, AlternatesFrontsAndBacksUntilRowsRunOut) {
    DuplexInterleavePolicy policy(params("long"));
    const auto pages = paginate(policy, *fx_.layout, heroes(7));
    ASSERT_EQ(pages.size(), 4u);
    EXPECT_EQ(pages[1].filledCount(), 6u);
    EXPECT_EQ(mergedNames(pages[2]), (Names{"hero7", "", "", "", "", ""}));
    EXPECT_EQ(mergedNames(pages[3]), (Names{"", "", "<static>", "", "", ""}));
}

TEST_F(DuplexPolicyTest, BackDefaultsToTheOtherTemplateShown) {
    fx_.layout->slotAt(1, 0).setTemplatePid(back_->pid());
    fx_.layout->slotAt(1, 1).setTemplatePid(back_->pid());
    fx_.layout->slotAt(1, 2).setTemplatePid(back_->pid());

    DuplexInterleavePolicy policy;
    const auto pages = paginate(policy, *fx_.layout, heroes(2));
    ASSERT_EQ(pages.size(), 2u);
    EXPECT_EQ(mergedNames(pages[0]), (Names{"hero1", "hero2", "", "", "", ""}));
    EXPECT_EQ(mergedNames(pages[1]), (Names{"", "<static>", "<static>", "", "", ""}));
}

TEST_F(DuplexPolicyTest, RejectsLayoutsWithoutBothSides) {
    DuplexInterleavePolicy noBack;
    EXPECT_THROW(noBack.prepare(*fx_.layout, heroes(3)), ConfigurationError);

    DuplexInterleavePolicy noFront(params("long"));
    EXPECT_THROW(noFront.prepare(*fx_.layout, {}), ConfigurationError);

    DuplexInterleavePolicy unknownBack(nlohmann::json{{"back_pid", issuePid(ProtoClass::ComponentTemplate)}});
    EXPECT_THROW(unknownBack.prepare(*fx_.layout, heroes(3)), ConfigurationError);

    EXPECT_THROW((DuplexInterleavePolicy{nlohmann::json{{"flip", "diagonal"}}}), PaginationError);
    EXPECT_THROW((DuplexInterleavePolicy{nlohmann::json{{"back_pid", 7}}}), PaginationError);
}

// =============================================================================
// StaticCluster
// =============================================================================

class StaticClusterPolicyTest : public ::testing::Test {
protected:
    void SetUp() override {
        hero_ = &fx_.addCard("Hero", {"@name"});
        rules_ = &fx_.addCard("Rules", {"title"});
        fx_.layout->slotAt(0, 0).setTemplatePid(hero_->pid());
        fx_.layout->slotAt(0, 1).setTemplatePid(hero_->pid());
        fx_.layout->slotAt(1, 0).setTemplatePid(rules_->pid());
        fx_.layout->slotAt(1, 1).setTemplatePid(rules_->pid());
        bindings_ = {{hero_->pid(), namesCsv("hero", 3)}};
    }

    LayoutFixture fx_{2, 2};
    const ComponentTemplate* hero_ = nullptr;
    const ComponentTemplate* rules_ = nullptr;
    std::vector<DatasetBinding> bindings_;
};

TEST_F(StaticClusterPolicyTest, PrintsStaticCopiesBeforeData) {
    StaticClusterPolicy policy(nlohmann::json{{"copies", {{rules_->pid(), 3}}}});
    const auto pages = paginate(policy, *fx_.layout, bindings_);
    ASSERT_EQ(pages.size(), 4u);
    EXPECT_EQ(mergedNames(pages[0]), (Names{"", "", "<static>", "<static>"}));
    EXPECT_EQ(mergedNames(pages[1]), (Names{"", "", "<static>", ""}));
    EXPECT_EQ(mergedNames(pages[2]), (Names{"hero1", "hero2", "", ""}));
    EXPECT_EQ(mergedNames(pages[3]), (Names{"hero3", "", "", ""}));
}

TEST_F(StaticClusterPolicyTest, DataFirstWhenAsked) {
    StaticClusterPolicy policy(nlohmann::json{{"static_first", false}});
    const auto pages = paginate(policy, *fx_.layout, bindings_);
    ASSERT_EQ(pages.size(), 3u);
    EXPECT_EQ(mergedNames(pages[0]), (Names{"hero1", "hero2", "", ""}));
    EXPECT_EQ(mergedNames(pages[2]), (Names{"", "", "<static>", ""}));
}

TEST_F(StaticClusterPolicyTest, ExplicitOrderAndZeroCopies) {
    StaticClusterPolicy skipRules(nlohmann::json{{"copies", {{rules_->pid(), 0}}}});
    EXPECT_EQ(paginate(skipRules, *fx_.layout, bindings_).size(), 2u);

    StaticClusterPolicy heroOnly(nlohmann::json{{"order", nlohmann::json::array({hero_->pid()})}});
    const auto pages = paginate(heroOnly, *fx_.layout, bindings_);
    ASSERT_EQ(pages.size(), 2u);
    EXPECT_EQ(mergedNames(pages[1]), (Names{"hero3", "", "", ""}));

    StaticClusterPolicy unknown(nlohmann::json{{"order", nlohmann::json::array({issuePid(ProtoClass::ComponentTemplate)})}});
    EXPECT_THROW(unknown.prepare(*fx_.layout, bindings_), ConfigurationError);
}

TEST_F(StaticClusterPolicyTest, ValidatesParams) {
    EXPECT_THROW((StaticClusterPolicy{nlohmann::json{{"static_first", "yes"}}}), PaginationError);
    EXPECT_THROW((StaticClusterPolicy{nlohmann::json{{"copies", {{"ct_x", -1}}}}}), PaginationError);
    EXPECT_THROW((StaticClusterPolicy{nlohmann::json{{"copies", 2}}}), PaginationError);
    EXPECT_THROW((StaticClusterPolicy{nlohmann::json{{"order", "ct_x"}}}), PaginationError);
}

// =============================================================================
// Factory
// =============================================================================

TEST(PolicyFactoryTest, CreatesByName) {
    EXPECT_STREQ(PaginationPolicyFactory::create("")->name(), "InterleaveDatasets");
    EXPECT_STREQ(PaginationPolicyFactory::create("ClusterByDataset")->name(), "ClusterByDataset");
    auto staticFirst = PaginationPolicyFactory::create("StaticFirstRow", nlohmann::json{{"static_rows", 0}});
    EXPECT_EQ(static_cast<StaticFirstRowPolicy&>(*staticFirst).staticRows(), 0u);

    EXPECT_TRUE(PaginationPolicyFactory::has("StaticFirstRow"));
    EXPECT_FALSE(PaginationPolicyFactory::has("Shuffle"));
    EXPECT_STREQ(PaginationPolicyFactory::create("DuplexInterleave")->name(), "DuplexInterleave");
    EXPECT_STREQ(PaginationPolicyFactory::create("StaticCluster", nullptr)->name(), "StaticCluster");
    auto strided = PaginationPolicyFactory::create("InterleaveDatasets", nlohmann::json{{"stride", 2}});
    EXPECT_EQ(static_cast<InterleaveDatasetsPolicy&>(*strided).stride(), 2u);
    EXPECT_EQ(PaginationPolicyFactory::names().size(), 5u);
}

TEST(PolicyFactoryTest, RejectsUnknownNamesAndBadParams) {
    EXPECT_THROW(PaginationPolicyFactory::create("Shuffle"), PaginationError);
    EXPECT_THROW(PaginationPolicyFactory::create("InterleaveDatasets", nlohmann::json::array()), PaginationError);
    EXPECT_THROW(PaginationPolicyFactory::create("StaticFirstRow", nlohmann::json{{"static_rows", 1.5}}),
                 PaginationError);
}
