#include "duplicate_nodes.hpp"
#include "logging.hpp"
#include <algorithm>
#include <tuple>
#include <unordered_set>
#include <vector>

namespace framesplice {

NodeReplacements merge_duplicate_nodes(StructuralModel& model) {
    auto log = framesplice::logging::get_logger();

    // Group node ids by exact coordinates
    std::map<std::tuple<double, double, double>, std::vector<NodeId>> by_coordinate;
    for (const auto& node : model.nodes()) {
        by_coordinate[{node.x, node.y, node.z}].push_back(node.id);
    }

    NodeReplacements replacements;
    for (const auto& [coordinate, ids] : by_coordinate) {
        if (ids.size() < 2) continue;
        NodeId kept = *std::min_element(ids.begin(), ids.end());
        for (NodeId id : ids) {
            if (id != kept) {
                replacements[id] = kept;
            }
        }
    }

    if (replacements.empty()) {
        log->debug("No duplicate nodes found");
        return replacements;
    }

    std::vector<LineId> line_ids;
    line_ids.reserve(model.line_count());
    for (const auto& line : model.lines()) {
        line_ids.push_back(line.id);
    }
    for (LineId id : line_ids) {
        Line& line = model.line(id);
        auto ni = replacements.find(line.ni);
        if (ni != replacements.end()) line.ni = ni->second;
        auto nj = replacements.find(line.nj);
        if (nj != replacements.end()) line.nj = nj->second;
    }

    std::unordered_set<NodeId> removed;
    for (const auto& [old_id, kept] : replacements) {
        removed.insert(old_id);
    }
    model.remove_nodes(removed);

    log->info("Merged {} duplicate nodes", replacements.size());
    return replacements;
}

}  // namespace framesplice
