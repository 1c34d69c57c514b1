#include "cli_common.hpp"
#include <parser/export_parser.hpp>
#include <cleanup/duplicate_nodes.hpp>
#include <connect/connector.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/config_json.hpp>
#include <serialization/model_json.hpp>
#include <common/logging.hpp>

namespace framesplice::cli {

namespace {

void print_connect_usage() {
    std::cerr << "Usage: framesplice connect <export.json> -o <connected.json> [options]\n";
    std::cerr << "Options:\n";
    std::cerr << "  -c, --config FILE            Connect configuration (JSON)\n";
    std::cerr << "  --tolerance T                Geometric tolerance (default: from config or 1e-6)\n";
    std::cerr << "  --elevation-tolerance T      Coplanarity tolerance (default: 10 * tolerance)\n";
    std::cerr << "  --merge-duplicates           Merge coincident input nodes first\n";
    std::cerr << "  --no-attach                  Do not attach existing lines lying on a mother\n";
    std::cerr << "  -v, --verbose                Debug logging\n";
}

}  // namespace

int command_connect(int argc, char** argv) {
    auto log = framesplice::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help) {
            print_connect_usage();
            return 0;
        }
        if (ctx.input_path.empty() || ctx.output_path.empty()) {
            print_connect_usage();
            return 1;
        }
        if (ctx.verbose) {
            log->set_level(spdlog::level::debug);
        }

        // Configuration: file first, then command-line overrides
        ConnectConfig config;
        if (ctx.config_path.has_value()) {
            config = json::read_json_file(ctx.config_path.value()).get<ConnectConfig>();
            log->info("Using configuration from {}", ctx.config_path.value());
        }
        if (ctx.tolerance.has_value()) {
            config.tolerance = ctx.tolerance.value();
        }
        if (ctx.elevation_tolerance.has_value()) {
            config.elevation_tolerance = ctx.elevation_tolerance.value();
        }
        if (ctx.merge_duplicates) {
            config.merge_duplicate_nodes = true;
        }
        if (ctx.no_attach) {
            config.attach_existing_segments = false;
        }
        config.validate();

        log->info("Reading export: {}", ctx.input_path);
        nlohmann::json document = json::read_json_file(ctx.input_path);

        parser::ExportParser parser;
        parser::ParsedExport parsed = parser.parse(document);

        size_t merged_nodes = 0;
        if (config.merge_duplicate_nodes) {
            merged_nodes = merge_duplicate_nodes(parsed.model).size();
        }

        ConnectResult result = Connector::connect(parsed.model, config);

        nlohmann::json cross_sections = nlohmann::json::array();
        for (const auto& [id, section] : parsed.cross_sections) {
            cross_sections.push_back(nlohmann::json(section));
        }

        // Serialize to JSON
        json::SerializedData data;
        data.step = "connected";
        data.timestamp = json::get_timestamp();
        data.source_file = ctx.input_path;
        data.config = config;
        data.data = {
            {"model", model_to_json(result.model)},
            {"cross_sections", cross_sections},
            {"lineage", lineage_to_json(result.lineage)}
        };
        data.stats = result.stats;
        data.stats["input_nodes"] = parsed.model.node_count();
        data.stats["input_lines"] = parsed.model.line_count();
        data.stats["output_nodes"] = result.model.node_count();
        data.stats["output_lines"] = result.model.line_count();
        data.stats["output_members"] = result.model.member_count();
        data.stats["merged_nodes"] = merged_nodes;
        data.stats["skipped_members"] = parser.warnings().size();

        json::write_serialized(ctx.output_path, data);

        log->info("Wrote connected model to {}", ctx.output_path);
        std::cerr << "Wrote " << ctx.output_path << " ("
                  << result.model.node_count() << " nodes, "
                  << result.model.line_count() << " lines, "
                  << result.stats.split_lines << " lines split)\n";

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace framesplice::cli
