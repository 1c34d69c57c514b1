#ifndef FRAMESPLICE_SERIALIZATION_MODEL_JSON_HPP
#define FRAMESPLICE_SERIALIZATION_MODEL_JSON_HPP

#include <nlohmann/json.hpp>
#include <model/elements.hpp>
#include <model/structural_model.hpp>
#include <connect/lineage.hpp>
#include <connect/connector.hpp>
#include <map>
#include <string>

namespace framesplice {

// Material enum serialization
NLOHMANN_JSON_SERIALIZE_ENUM(Material, {
    {Material::Steel, "Steel"},
    {Material::Concrete, "Concrete"},
})

// Node serialization
inline void to_json(nlohmann::json& j, const Node& node) {
    j = {
        {"id", node.id},
        {"x", node.x},
        {"y", node.y},
        {"z", node.z}
    };
}

inline void from_json(const nlohmann::json& j, Node& node) {
    node.id = j.at("id").get<NodeId>();
    node.x = j.at("x").get<double>();
    node.y = j.at("y").get<double>();
    node.z = j.at("z").get<double>();
}

// Line serialization (Ni/Nj as in the analysis exchange format)
inline void to_json(nlohmann::json& j, const Line& line) {
    j = {
        {"id", line.id},
        {"Ni", line.ni},
        {"Nj", line.nj}
    };
}

inline void from_json(const nlohmann::json& j, Line& line) {
    line.id = j.at("id").get<LineId>();
    line.ni = j.at("Ni").get<NodeId>();
    line.nj = j.at("Nj").get<NodeId>();
}

// Member serialization
inline void to_json(nlohmann::json& j, const Member& member) {
    j = {
        {"line_id", member.line_id},
        {"cross_section_id", member.cross_section_id},
        {"material_name", member.material}
    };
}

inline void from_json(const nlohmann::json& j, Member& member) {
    member.line_id = j.at("line_id").get<LineId>();
    member.cross_section_id = j.at("cross_section_id").get<CrossSectionId>();
    member.material = j.value("material_name", Material::Steel);
}

// CrossSection serialization
inline void to_json(nlohmann::json& j, const CrossSection& section) {
    j = {
        {"id", section.id},
        {"name", section.name},
        {"A", section.area},
        {"Iz", section.iz},
        {"Iy", section.iy},
        {"Jxx", section.jxx},
        {"b", section.width},
        {"h", section.height}
    };
}

inline void from_json(const nlohmann::json& j, CrossSection& section) {
    CrossSection defaults;
    section.id = j.at("id").get<CrossSectionId>();
    section.name = j.value("name", defaults.name);
    section.area = j.value("A", defaults.area);
    section.iz = j.value("Iz", defaults.iz);
    section.iy = j.value("Iy", defaults.iy);
    section.jxx = j.value("Jxx", defaults.jxx);
    section.width = j.value("b", defaults.width);
    section.height = j.value("h", defaults.height);
}

// Section properties as written back into the export (everything but id and name)
inline nlohmann::json section_properties_json(const CrossSection& section) {
    nlohmann::json j = section;
    j.erase("id");
    j.erase("name");
    return j;
}

// StructuralModel serialization
inline nlohmann::json model_to_json(const StructuralModel& model) {
    return {
        {"nodes", model.nodes()},
        {"lines", model.lines()},
        {"members", model.members()}
    };
}

inline StructuralModel model_from_json(const nlohmann::json& j) {
    StructuralModel model;
    for (const auto& node : j.at("nodes")) {
        model.add_node(node.get<Node>());
    }
    for (const auto& line : j.at("lines")) {
        model.add_line(line.get<Line>());
    }
    if (j.contains("members")) {
        for (const auto& member : j["members"]) {
            model.add_member(member.get<Member>());
        }
    }
    return model;
}

// Lineage serialization. JSON object keys are the decimal line ids.
inline nlohmann::json lineage_to_json(const Lineage& lineage) {
    nlohmann::json mother_to_children = nlohmann::json::object();
    for (const auto& [mother, children] : lineage.mother_to_children()) {
        mother_to_children[std::to_string(mother)] = children;
    }
    nlohmann::json child_to_mother = nlohmann::json::object();
    for (const auto& [child, mother] : lineage.child_to_mother()) {
        child_to_mother[std::to_string(child)] = mother;
    }
    return {
        {"mother_to_children", mother_to_children},
        {"child_to_mother", child_to_mother}
    };
}

// child_to_mother is the inverse of mother_to_children and is rebuilt from it
inline Lineage lineage_from_json(const nlohmann::json& j) {
    Lineage lineage;
    for (const auto& [key, children] : j.at("mother_to_children").items()) {
        LineId mother = std::stoll(key);
        lineage.add_mother(mother);
        for (const auto& child : children) {
            lineage.add_child(mother, child.get<LineId>());
        }
    }
    return lineage;
}

inline void to_json(nlohmann::json& j, const ConnectStats& stats) {
    j = {
        {"candidate_pairs", stats.candidate_pairs},
        {"intersections", stats.intersections},
        {"created_nodes", stats.created_nodes},
        {"split_lines", stats.split_lines},
        {"created_lines", stats.created_lines},
        {"attached_segments", stats.attached_segments}
    };
}

}  // namespace framesplice

#endif // FRAMESPLICE_SERIALIZATION_MODEL_JSON_HPP
