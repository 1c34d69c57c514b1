#include "cli_common.hpp"
#include <governing/governing_section.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/model_json.hpp>
#include <common/logging.hpp>

namespace framesplice::cli {

namespace {

void print_govern_usage() {
    std::cerr << "Usage: framesplice govern <connected.json> --results <solver.json> "
                 "--export <export.json> -o <updated-export.json>\n";
    std::cerr << "\n";
    std::cerr << "Folds per-line solver sections back onto the original members and\n";
    std::cerr << "writes the governing section of each one into the export.\n";
}

}  // namespace

int command_govern(int argc, char** argv) {
    auto log = framesplice::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help) {
            print_govern_usage();
            return 0;
        }
        if (ctx.input_path.empty() || ctx.output_path.empty() ||
            ctx.results_path.empty() || ctx.export_path.empty()) {
            print_govern_usage();
            return 1;
        }
        if (ctx.verbose) {
            log->set_level(spdlog::level::debug);
        }

        log->info("Reading connected model: {}", ctx.input_path);
        json::SerializedData connected = json::read_serialized(ctx.input_path);
        if (connected.step != "connected") {
            throw std::runtime_error(ctx.input_path + " is not a connect output (step '" +
                                     connected.step + "')");
        }
        Lineage lineage = lineage_from_json(connected.data.at("lineage"));

        log->info("Reading solver results: {}", ctx.results_path);
        SolverResults results = solver_results_from_json(json::read_json_file(ctx.results_path));

        nlohmann::json export_document = json::read_json_file(ctx.export_path);

        GoverningReport report = select_governing_sections(lineage, results);
        apply_sections_to_export(export_document, results, report);

        json::write_json_file(ctx.output_path, export_document);

        if (!report.mothers_without_results.empty()) {
            log->warn("{} of {} mothers have no child in the solver results",
                      report.mothers_without_results.size(), lineage.mother_count());
        }
        log->info("Wrote updated export to {}", ctx.output_path);
        std::cerr << "Wrote " << ctx.output_path << " ("
                  << report.applied_children << " lines and "
                  << report.updated_mothers << " mothers updated)\n";

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace framesplice::cli
