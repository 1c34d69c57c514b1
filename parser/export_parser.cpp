#include "export_parser.hpp"
#include "logging.hpp"
#include <array>
#include <cmath>
#include <initializer_list>
#include <stdexcept>

namespace framesplice {
namespace parser {

namespace {

std::int64_t to_id(const nlohmann::json& value, const char* what) {
    if (value.is_number_integer()) {
        return value.get<std::int64_t>();
    }
    if (value.is_number_float()) {
        double d = value.get<double>();
        if (std::isfinite(d) && d == std::floor(d)) {
            return static_cast<std::int64_t>(d);
        }
    }
    if (value.is_string()) {
        const auto& s = value.get_ref<const std::string&>();
        size_t consumed = 0;
        std::int64_t id = std::stoll(s, &consumed);
        if (consumed == s.size()) {
            return id;
        }
    }
    throw std::invalid_argument(std::string(what) + " is not an integer id");
}

// First present, non-null entry among keys
const nlohmann::json* first_present(const nlohmann::json& object,
                                    std::initializer_list<const char*> keys) {
    if (!object.is_object()) return nullptr;
    for (const char* key : keys) {
        auto it = object.find(key);
        if (it != object.end() && !it->is_null() && !(it->is_array() && it->empty())) {
            return &*it;
        }
    }
    return nullptr;
}

std::array<double, 3> read_point(const nlohmann::json& endpoints,
                                 std::initializer_list<const char*> keys) {
    const nlohmann::json* value = first_present(endpoints, keys);
    if (value == nullptr) {
        return {0.0, 0.0, 0.0};
    }
    if (!value->is_array() || value->size() < 3) {
        throw std::invalid_argument("endpoint is not an [x, y, z] array");
    }
    return {(*value)[0].get<double>(), (*value)[1].get<double>(), (*value)[2].get<double>()};
}

// Missing, null and zero values all fall back to the default
double section_value(const nlohmann::json& props,
                     std::initializer_list<const char*> keys, double fallback) {
    if (!props.is_object()) return fallback;
    for (const char* key : keys) {
        auto it = props.find(key);
        if (it != props.end() && it->is_number() && it->get<double>() != 0.0) {
            return it->get<double>();
        }
    }
    return fallback;
}

}  // namespace

ParsedExport ExportParser::parse(const nlohmann::json& document) {
    auto log = framesplice::logging::get_logger();
    warnings_.clear();

    const nlohmann::json* members = first_present(document, {"analytical_members", "members"});
    if (members == nullptr || !members->is_array() || members->empty()) {
        throw std::runtime_error("No members found in analysis output");
    }

    ParsedExport out;
    for (size_t i = 0; i < members->size(); ++i) {
        try {
            parse_member((*members)[i], i, out);
        } catch (const std::exception& e) {
            warnings_.push_back("Skipping member #" + std::to_string(i) + ": " + e.what());
        }
    }

    for (const auto& warning : warnings_) {
        log->warn("{}", warning);
    }
    log->info("Parsed export: {} nodes, {} lines, {} cross sections ({} members skipped)",
              out.model.node_count(), out.model.line_count(),
              out.cross_sections.size(), warnings_.size());
    return out;
}

void ExportParser::parse_member(const nlohmann::json& raw, size_t index, ParsedExport& out) {
    if (!raw.is_object()) {
        throw std::invalid_argument("member is not an object");
    }

    std::int64_t member_id = raw.contains("id") ? to_id(raw["id"], "id")
                                                : static_cast<std::int64_t>(index);
    if (!raw.contains("nodeI") || !raw.contains("nodeJ")) {
        throw std::invalid_argument("member has no nodeI/nodeJ");
    }
    NodeId node_i = to_id(raw["nodeI"], "nodeI");
    NodeId node_j = to_id(raw["nodeJ"], "nodeJ");
    if (out.model.has_line(member_id)) {
        throw std::invalid_argument("duplicate member id " + std::to_string(member_id));
    }

    static const nlohmann::json kEmpty = nlohmann::json::object();
    const nlohmann::json& endpoints = raw.contains("endpoints") ? raw["endpoints"] : kEmpty;
    auto coord_i = read_point(endpoints, {"i", "I"});
    auto coord_j = read_point(endpoints, {"j", "J"});

    const nlohmann::json& section = raw.contains("section") ? raw["section"] : kEmpty;
    const nlohmann::json& props = raw.contains("section_properties") ? raw["section_properties"] : kEmpty;
    CrossSectionId section_id = member_id;
    if (section.is_object() && section.contains("type_id") && !section["type_id"].is_null()) {
        section_id = to_id(section["type_id"], "section.type_id");
    }

    Material material = Material::Steel;
    if (raw.contains("material") && raw["material"].is_string()) {
        const auto& name = raw["material"].get_ref<const std::string&>();
        if (name == "Concrete") {
            material = Material::Concrete;
        } else if (name != "Steel") {
            warnings_.push_back("Member " + std::to_string(member_id) +
                                ": unknown material '" + name + "', using Steel");
        }
    }

    // Everything validated; commit
    if (!out.model.has_node(node_i)) {
        out.model.add_node({node_i, coord_i[0], coord_i[1], coord_i[2]});
    }
    if (!out.model.has_node(node_j)) {
        out.model.add_node({node_j, coord_j[0], coord_j[1], coord_j[2]});
    }
    out.model.add_line({member_id, node_i, node_j});

    if (!out.cross_sections.count(section_id)) {
        CrossSection cs;
        cs.id = section_id;
        if (const auto* name = first_present(section, {"type_name", "family_name"});
            name != nullptr && name->is_string() && !name->get_ref<const std::string&>().empty()) {
            cs.name = name->get<std::string>();
        }
        cs.height = section_value(props, {"STRUCTURAL_SECTION_COMMON_HEIGHT", "HEIGHT"}, 0.3);
        cs.width = section_value(props, {"STRUCTURAL_SECTION_COMMON_WIDTH", "WIDTH"}, cs.height);
        cs.area = section_value(props, {"STRUCTURAL_SECTION_AREA"}, 0.01);
        cs.iz = section_value(props, {"STRUCTURAL_SECTION_COMMON_MOMENT_OF_INERTIA_STRONG_AXIS"}, 1e-4);
        cs.iy = section_value(props, {"STRUCTURAL_SECTION_COMMON_MOMENT_OF_INERTIA_WEAK_AXIS"}, 1e-5);
        cs.jxx = section_value(props, {"STRUCTURAL_SECTION_COMMON_TORSIONAL_MOMENT_OF_INERTIA"}, 1e-6);
        out.cross_sections.emplace(section_id, cs);
    }

    out.model.add_member({member_id, section_id, material});
}

}  // namespace parser
}  // namespace framesplice
