#include "tests/test_common.h"
#include "protolayout/core/errors.h"
#include "protolayout/pagination/pagination_manager.h"
#include "protolayout/registry/pid.h"
#include "protolayout/serialization/json_codec.h"
#include "protolayout/serialization/template_io.h"
#include <fstream>

using namespace protolayout;
using protolayout_test::LayoutFixture;
using protolayout_test::makeCard;
using nlohmann::json;

namespace {

std::unique_ptr<ComponentTemplate> richCard() {
    auto card = makeCard("Hero", {"@name", "@power"});
    card->setGeometry(UnitStrGeometry::fromSize(UnitStr::fromString("2.5in"), UnitStr::fromString("3.5in")));
    ComponentStyle style;
    style.backgroundColor = 0x112233ff;
    style.roundedCorners = true;
    style.cornerRadius = UnitStr::fromString("0.125in");
    card->setStyle(style);

    auto& title = static_cast<TextElement&>(*card->elementByName("@name"));
    title.setAlignment(TextAlignment::Center);
    title.setFontSize(UnitStr::fromString("18pt"));
    title.setWordWrap(false);

    auto art = std::make_unique<ImageElement>();
    art->setName("art");
    art->setContent("art/hero.png");
    art->setKeepAspectRatio(false);
    art->setZOrder(5);
    card->addElement(std::move(art));
    return card;
}

std::string writeTemp(const std::string& fileName, const std::string& text) {
    const std::string path = testing::TempDir() + fileName;
    std::ofstream out(path);
    out << text;
    return path;
}

} // namespace

// =============================================================================
// Components
// =============================================================================

TEST(ComponentJsonTest, TemplateRoundTrip) {
    const auto card = richCard();
    const json j = componentToJson(*card);
    EXPECT_EQ(j.at("elements").size(), 3u);
    EXPECT_EQ(j.at("elements")[0].at("alignment").get<std::string>(), "center");
    EXPECT_FALSE(j.at("elements")[2].at("keep_aspect_ratio").get<bool>());

    const auto loaded = componentTemplateFromJson(j);
    EXPECT_EQ(*loaded, *card);
    EXPECT_EQ(loaded->elementByName("art")->kind(), ElementKind::Image);
}

TEST(ComponentJsonTest, InstanceKeepsTemplateAndData) {
    const auto card = richCard();
    auto instance = ComponentInstance::fromTemplate(*card);
    instance->applyData({{"@name", "Jane"}, {"@power", "7"}}, DataRowRef{"heroes.csv", 4});

    const json j = componentToJson(*instance);
    EXPECT_EQ(j.at("template_pid").get<std::string>(), card->pid());
    EXPECT_EQ(j.at("data_row").at("line").get<int>(), 4);

    const auto loaded = componentInstanceFromJson(j);
    EXPECT_EQ(*loaded, *instance);
    EXPECT_EQ(loaded->elementByName("@name")->content(), "Jane");
}

TEST(ComponentJsonTest, PidClassMustMatchTheDocument) {
    const auto card = richCard();
    const auto instance = ComponentInstance::fromTemplate(*card);
    EXPECT_THROW(componentTemplateFromJson(componentToJson(*instance)), RegistryError);
    EXPECT_THROW(componentInstanceFromJson(componentToJson(*card)), RegistryError);
}

TEST(ComponentJsonTest, RejectsMalformedDocuments) {
    json j = componentToJson(*richCard());

    json noPid = j;
    noPid.erase("pid");
    EXPECT_THROW(componentTemplateFromJson(noPid), ParseError);

    json badPid = j;
    badPid["pid"] = "not-a-pid";
    EXPECT_THROW(componentTemplateFromJson(badPid), ParseError);

    json unknownPrefix = j;
    unknownPrefix["pid"] = "zz_1b4e28ba-2fa1-4d3b-a3f5-ef19b5a7633b";
    EXPECT_THROW(componentTemplateFromJson(unknownPrefix), RegistryError);

    json layoutElement = j;
    layoutElement["elements"][0]["pid"] = issuePid(ProtoClass::LayoutTemplate);
    EXPECT_THROW(componentTemplateFromJson(layoutElement), ParseError);

    json wrongType = j;
    wrongType["elements"] = "none";
    EXPECT_THROW(componentTemplateFromJson(wrongType), ParseError);

    EXPECT_THROW(componentTemplateFromJson(json::array()), ParseError);
}

// =============================================================================
// Layouts
// =============================================================================

TEST(LayoutJsonTest, RoundTripPreservesSettingsAndSlots) {
    LayoutFixture fx(2, 3);
    auto& hero = fx.addCard("Hero", {"@name"});
    fx.layout->setName("Sheet");
    fx.layout->setLandscape(true);
    fx.layout->setPageSize("A4");
    fx.layout->setMargins({UnitStr::fromString("0.5in"), UnitStr::fromString("0.5in"), UnitStr::fromString("10mm"),
                           UnitStr::fromString("10mm")});
    fx.layout->setPaginationPolicy("StaticFirstRow", json{{"static_rows", 1}});
    fx.layout->setLockAt(12);
    fx.layout->assignTemplate(hero);
    fx.layout->slotAt(1, 2).setMountMode(MountMode::LiveMount);
    fx.layout->slotAt(0, 0).setContent(instantiate(hero, &fx.registry));

    const json j = layoutToJson(*fx.layout);
    EXPECT_EQ(j.at("slots").size(), 6u);
    EXPECT_EQ(j.at("slots")[0].at("content").at("template_pid").get<std::string>(), hero.pid());
    EXPECT_FALSE(j.at("slots")[1].contains("content"));

    const auto loaded = layoutFromJson(j);
    EXPECT_EQ(*loaded, *fx.layout);
    EXPECT_EQ(loaded->slotAt(1, 2).mountMode(), MountMode::LiveMount);
    EXPECT_EQ(loaded->pageSize(), "A4");
    EXPECT_TRUE(loaded->landscape());
}

TEST(LayoutJsonTest, RejectsSlotsOutsideTheGrid) {
    LayoutFixture fx(2, 2);
    json j = layoutToJson(*fx.layout);
    j["rows"] = 1;
    EXPECT_THROW(layoutFromJson(j), ParseError);

    json badParams = layoutToJson(*fx.layout);
    badParams["pagination_params"] = json::array();
    EXPECT_THROW(layoutFromJson(badParams), ParseError);
}

TEST(LayoutJsonTest, EmbeddedTemplatesNeedALibrary) {
    LayoutFixture fx(1, 2);
    auto& hero = fx.addCard("Hero", {"@name"});
    fx.layout->assignTemplate(hero);

    const json j = layoutToJson(*fx.layout, true);
    EXPECT_EQ(j.at("slots")[1].at("content").at("pid").get<std::string>(), hero.pid());
    EXPECT_THROW(layoutFromJson(j), ParseError);

    ProtoRegistry registry;
    TemplateLibrary library(registry);
    LayoutTemplate& loaded = library.loadLayout(j);
    ASSERT_EQ(library.components().size(), 1u);
    EXPECT_EQ(*library.components()[0], hero);
    EXPECT_TRUE(registry.has(hero.pid()));
    EXPECT_TRUE(registry.has(loaded.slotAt(0, 1).pid()));
    EXPECT_EQ(library.layout(loaded.pid()), &loaded);
}

// =============================================================================
// TemplateLibrary
// =============================================================================

TEST(TemplateLibraryTest, LoadsFilesByDocumentType) {
    const auto card = makeCard("Rules", {"title"});
    LayoutFixture source(2, 3);
    source.layout->assignTemplate(*card);
    const std::string cardPath = writeTemp("protolayout_rules.json", componentToJson(*card).dump(2));
    const std::string layoutPath = writeTemp("protolayout_sheet.json", layoutToJson(*source.layout).dump(2));

    ProtoRegistry registry;
    TemplateLibrary library(registry);
    ProtoObject& first = library.loadFile(cardPath);
    ProtoObject& second = library.loadFile(layoutPath);
    EXPECT_EQ(first.protoClass(), ProtoClass::ComponentTemplate);
    EXPECT_EQ(second.protoClass(), ProtoClass::LayoutTemplate);
    ASSERT_NE(library.component(card->pid()), nullptr);
    EXPECT_EQ(library.layouts().size(), 1u);

    EXPECT_THROW(library.loadFile(cardPath), RegistryError);
}

TEST(TemplateLibraryTest, ReportsUnreadableFiles) {
    ProtoRegistry registry;
    TemplateLibrary library(registry);
    EXPECT_THROW(library.loadFile(testing::TempDir() + "protolayout_missing.json"), Error);
    EXPECT_THROW(library.loadFile(writeTemp("protolayout_broken.json", "{\"pid\": ")), ParseError);

    const json slotDoc{{"pid", issuePid(ProtoClass::LayoutSlot)}};
    EXPECT_THROW(library.loadFile(writeTemp("protolayout_slot.json", slotDoc.dump())), ParseError);
    EXPECT_TRUE(library.components().empty());
}

TEST(TemplateLibraryTest, LoadedStaticSheetPaginatesToOneSharedPage) {
    const auto card = makeCard("Rules", {"title"});
    LayoutFixture source(2, 3);
    source.layout->assignTemplate(*card);

    ProtoRegistry registry;
    TemplateLibrary library(registry);
    library.loadFile(writeTemp("protolayout_static_card.json", componentToJson(*card).dump()));
    LayoutTemplate& layout =
        static_cast<LayoutTemplate&>(library.loadFile(writeTemp("protolayout_static_sheet.json",
                                                                layoutToJson(*source.layout).dump())));

    PaginationManager pages(layout);
    ASSERT_EQ(pages.pageCount(), 1u);
    const Page& page = pages.getPage(0);
    ASSERT_EQ(page.placements.size(), 6u);
    for (const auto& placement : page.placements) {
        ASSERT_NE(placement.instance, nullptr);
        EXPECT_EQ(placement.instance, page.placements[0].instance);
        EXPECT_EQ(placement.instance->templatePid(), card->pid());
    }
}
