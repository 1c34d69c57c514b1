#ifndef FRAMESPLICE_PARSER_EXPORT_PARSER_HPP
#define FRAMESPLICE_PARSER_EXPORT_PARSER_HPP

#include <model/structural_model.hpp>
#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

namespace framesplice {
namespace parser {

using CrossSectionCatalog = std::map<CrossSectionId, CrossSection>;

struct ParsedExport {
    StructuralModel model;
    CrossSectionCatalog cross_sections;
};

// Reads the analytical-member export of the authoring tool. Each member
// becomes one line (line id == member id) with its two end nodes, one
// member record and, on first use, a cross-section catalog entry.
// Malformed members are skipped and reported in warnings().
class ExportParser {
public:
    // Throws std::runtime_error when the document lists no members.
    ParsedExport parse(const nlohmann::json& document);

    const std::vector<std::string>& warnings() const { return warnings_; }
    bool has_warnings() const { return !warnings_.empty(); }

private:
    void parse_member(const nlohmann::json& raw, size_t index, ParsedExport& out);

    std::vector<std::string> warnings_;
};

}  // namespace parser
}  // namespace framesplice

#endif // FRAMESPLICE_PARSER_EXPORT_PARSER_HPP
