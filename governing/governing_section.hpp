#ifndef FRAMESPLICE_GOVERNING_GOVERNING_SECTION_HPP
#define FRAMESPLICE_GOVERNING_GOVERNING_SECTION_HPP

#include <connect/lineage.hpp>
#include <model/elements.hpp>
#include <nlohmann/json.hpp>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace framesplice {

// Section assignments computed by the external solver, per analysed line
struct SolverResults {
    std::map<LineId, CrossSectionId> section_by_line;
    std::map<CrossSectionId, CrossSection> cross_sections;
};

// Accepts {"members": ..., "cross_sections": ...} or the two-element array
// [members, cross_sections]; each part may be an array or an object keyed
// by id. Throws std::runtime_error on any other shape.
SolverResults solver_results_from_json(const nlohmann::json& j);

// Size rank of a section name: the number after the last 'x' ("HEB300x117"
// -> 117), otherwise the largest number in the name ("IPE400" -> 400),
// otherwise -1.
double section_rank(const std::string& name);

struct GoverningChoice {
    LineId mother = 0;
    LineId child = 0;
    CrossSection section;
    double rank = -1.0;
};

struct GoverningReport {
    std::map<LineId, GoverningChoice> choices;      // by mother
    std::vector<LineId> mothers_without_results;
    size_t applied_children = 0;
    size_t updated_mothers = 0;
};

// For every mother, pick the child whose solver section ranks highest.
// Ties keep the first child in lineage order.
GoverningReport select_governing_sections(const Lineage& lineage, const SolverResults& results);

// Write solver sections into the export: first each analysed line's own
// section, then each mother's governing section. Export members are matched
// by "line_id", falling back to "id". Updates the counters in report.
void apply_sections_to_export(nlohmann::json& export_document,
                              const SolverResults& results,
                              GoverningReport& report);

}  // namespace framesplice

#endif // FRAMESPLICE_GOVERNING_GOVERNING_SECTION_HPP
