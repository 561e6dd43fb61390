// protolayout-export: load component and layout templates, merge CSV data,
// paginate, and write the export plan of every page as JSON.

#include "protolayout/core/errors.h"
#include "protolayout/export/export_plan.h"
#include "protolayout/merge/merge_manager.h"
#include "protolayout/model/layout_template.h"
#include "protolayout/pagination/pagination_manager.h"
#include "protolayout/registry/proto_registry.h"
#include "protolayout/serialization/template_io.h"
#include "protolayout/units/unit_str.h"

#include <args.hxx>
#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace {

struct CliOptions {
    std::string exportPath;
    double dpi = protolayout::kPrintDpi;
    protolayout::ExportOptions exportOptions;
    std::vector<std::pair<std::string, std::string>> csvBindings;  // template pid, csv path
    std::size_t maxPages = 0;
    std::vector<std::string> templatePaths;
};

std::pair<std::string, std::string> splitBinding(const std::string& text) {
    const auto eq = text.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 == text.size()) {
        throw protolayout::ConfigurationError("--csv expects TEMPLATE_PID=PATH, got '" + text + "'");
    }
    return {text.substr(0, eq), text.substr(eq + 1)};
}

nlohmann::json exportLayout(const protolayout::LayoutTemplate& layout, const protolayout::MergeManager& merge,
                            const protolayout::RenderContext& context, const CliOptions& cli) {
    protolayout::PaginationOptions options;
    options.pageCeiling = cli.maxPages;
    protolayout::PaginationManager pages(layout, merge, options);

    nlohmann::json out = nlohmann::json::array();
    for (const protolayout::Page& page : pages.iterPages()) {
        out.push_back(protolayout::toJson(protolayout::planPage(layout, page, context)));
    }
    std::cerr << layout.pid() << ": " << out.size() << " page(s)\n";
    return out;
}

int run(const CliOptions& cli) {
    const protolayout::RenderContext context =
        protolayout::RenderContext::exportContext(protolayout::routeForPath(cli.exportPath), cli.dpi);

    protolayout::ProtoRegistry registry;
    protolayout::TemplateLibrary library(registry);
    std::vector<protolayout::ProtoObject*> documents;
    for (const auto& path : cli.templatePaths) documents.push_back(&library.loadFile(path));

    protolayout::MergeManager merge;
    merge.setWarningHandler([](const std::string& message) { std::cerr << "warning: " << message << "\n"; });
    for (const auto& binding : cli.csvBindings) merge.loadCsv(binding.first, binding.second);

    nlohmann::json result = {
        {"export", cli.exportPath},
        {"route", protolayout::renderRouteName(context.route())},
        {"dpi", context.dpi()},
        {"documents", nlohmann::json::array()},
    };
    for (protolayout::ProtoObject* doc : documents) {
        nlohmann::json entry = {{"pid", doc->pid()}};
        if (doc->protoClass() == protolayout::ProtoClass::LayoutTemplate) {
            entry["pages"] = exportLayout(static_cast<protolayout::LayoutTemplate&>(*doc), merge, context, cli);
        } else {
            const auto& component = static_cast<const protolayout::ComponentTemplate&>(*doc);
            entry["component"] = protolayout::toJson(protolayout::planComponent(component, context, cli.exportOptions));
            entry["bleed"] = cli.exportOptions.bleed;
        }
        result["documents"].push_back(std::move(entry));
    }

    std::ofstream out(cli.exportPath);
    if (!out) throw protolayout::Error("cannot write export file '" + cli.exportPath + "'");
    out << result.dump(2) << "\n";
    if (!out) throw protolayout::Error("failed writing export file '" + cli.exportPath + "'");
    return 0;
}

} // namespace

int main(int argc, const char** argv) {
    args::ArgumentParser parser("protolayout-export", "Paginate prototype layouts and write their export plans.");
    parser.Prog("protolayout-export");

    args::HelpFlag helpFlag(parser, "help", "Show this help", {'h', "help"});
    args::ValueFlag<std::string> exportFlag(parser, "path",
        "Output file; the extension picks the route (.png, .pdf, .json)", {"export"});
    args::ValueFlag<double> dpiFlag(parser, "dpi", "Export resolution (default: 300)", {"dpi"},
        protolayout::kPrintDpi);
    args::Flag bleedFlag(parser, "bleed", "Grow component exports by the bleed size", {"bleed"});
    args::ValueFlag<std::string> bleedSizeFlag(parser, "quantity", "Bleed size (default: 0.125in)",
        {"bleed-size"}, "0.125in");
    args::ValueFlagList<std::string> csvFlag(parser, "pid=path",
        "Bind a CSV file to a component template (repeatable)", {"csv"});
    args::ValueFlag<std::size_t> maxPagesFlag(parser, "pages", "Page ceiling per layout (default: 1000)",
        {"max-pages"}, 0);
    args::PositionalList<std::string> templates(parser, "templates", "Component or layout template files");

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::cout << parser;
        return 0;
    } catch (const args::Error& e) {
        std::cerr << e.what() << "\n";
        std::cerr << parser;
        return 1;
    }

    if (!exportFlag) {
        std::cerr << "protolayout-export: --export PATH is required\n";
        return 1;
    }
    if (args::get(templates).empty()) {
        std::cerr << "protolayout-export: at least one template path is required\n";
        return 1;
    }

    try {
        CliOptions cli;
        cli.exportPath = args::get(exportFlag);
        cli.dpi = args::get(dpiFlag);
        cli.exportOptions.bleed = args::get(bleedFlag);
        cli.exportOptions.bleedSize = protolayout::UnitStr::fromString(args::get(bleedSizeFlag), protolayout::Unit::In);
        for (const auto& binding : args::get(csvFlag)) cli.csvBindings.push_back(splitBinding(binding));
        cli.maxPages = args::get(maxPagesFlag);
        cli.templatePaths = args::get(templates);
        return run(cli);
    } catch (const protolayout::Error& e) {
        std::cerr << "protolayout-export: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "protolayout-export: " << e.what() << "\n";
        return 1;
    }
}
