#include "governing_section.hpp"
#include "logging.hpp"
#include <serialization/model_json.hpp>
#include <cstdlib>
#include <optional>
#include <regex>
#include <stdexcept>
#include <unordered_map>

namespace framesplice {

namespace {

std::optional<double> parse_number(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    const char* begin = text.c_str();
    char* end = nullptr;
    double value = std::strtod(begin, &end);
    if (end == begin || *end != '\0') {
        return std::nullopt;
    }
    return value;
}

std::optional<std::int64_t> json_id(const nlohmann::json& value) {
    if (value.is_number_integer()) {
        return value.get<std::int64_t>();
    }
    if (value.is_string()) {
        auto number = parse_number(value.get<std::string>());
        if (number) {
            return static_cast<std::int64_t>(*number);
        }
    }
    return std::nullopt;
}

// Iterate either an array or the values of an object
template <typename Fn>
void for_each_entry(const nlohmann::json& collection, Fn&& fn) {
    if (collection.is_array()) {
        for (const auto& entry : collection) fn(entry);
    } else if (collection.is_object()) {
        for (const auto& [key, entry] : collection.items()) fn(entry);
    } else {
        throw std::runtime_error("Solver results: expected an array or an object");
    }
}

void apply_section(nlohmann::json& member, const CrossSection& section) {
    nlohmann::json& target = member["section"];
    if (!target.is_object()) {
        target = nlohmann::json::object();
    }
    target["type_name"] = section.name;
    target["type_id"] = section.id;
    target["family_name"] = section.name;
    member["section_properties"] = section_properties_json(section);
}

}  // namespace

SolverResults solver_results_from_json(const nlohmann::json& j) {
    const nlohmann::json* members = nullptr;
    const nlohmann::json* sections = nullptr;
    if (j.is_object() && j.contains("members") && j.contains("cross_sections")) {
        members = &j["members"];
        sections = &j["cross_sections"];
    } else if (j.is_array() && j.size() == 2) {
        members = &j[0];
        sections = &j[1];
    } else {
        throw std::runtime_error(
            "Solver results must be {\"members\", \"cross_sections\"} or [members, cross_sections]");
    }

    SolverResults results;
    for_each_entry(*sections, [&](const nlohmann::json& entry) {
        CrossSection section = entry.get<CrossSection>();
        results.cross_sections[section.id] = section;
    });
    for_each_entry(*members, [&](const nlohmann::json& entry) {
        results.section_by_line[entry.at("line_id").get<LineId>()] =
            entry.at("cross_section_id").get<CrossSectionId>();
    });
    return results;
}

double section_rank(const std::string& name) {
    auto last_x = name.find_last_of('x');
    if (last_x != std::string::npos) {
        if (auto tail = parse_number(name.substr(last_x + 1))) {
            return *tail;
        }
    }

    static const std::regex kNumber(R"(\d+(?:\.\d+)?)");
    double best = -1.0;
    bool found = false;
    for (auto it = std::sregex_iterator(name.begin(), name.end(), kNumber);
         it != std::sregex_iterator(); ++it) {
        double value = std::strtod(it->str().c_str(), nullptr);
        if (!found || value > best) {
            best = value;
            found = true;
        }
    }
    return found ? best : -1.0;
}

GoverningReport select_governing_sections(const Lineage& lineage, const SolverResults& results) {
    auto log = framesplice::logging::get_logger();
    GoverningReport report;

    for (const auto& [mother, children] : lineage.mother_to_children()) {
        std::optional<GoverningChoice> best;
        bool any_result = false;

        for (LineId child : children) {
            auto assigned = results.section_by_line.find(child);
            if (assigned == results.section_by_line.end()) {
                continue;
            }
            any_result = true;
            auto section = results.cross_sections.find(assigned->second);
            if (section == results.cross_sections.end()) {
                log->warn("Line {}: solver section {} is not in the catalog", child, assigned->second);
                continue;
            }
            double rank = section_rank(section->second.name);
            if (!best || rank > best->rank) {
                best = GoverningChoice{mother, child, section->second, rank};
            }
        }

        if (!any_result) {
            report.mothers_without_results.push_back(mother);
        }
        if (best) {
            report.choices[mother] = *best;
        }
    }

    if (!report.mothers_without_results.empty()) {
        log->debug("{} mothers have no child in the solver results",
                   report.mothers_without_results.size());
    }
    return report;
}

void apply_sections_to_export(nlohmann::json& export_document,
                              const SolverResults& results,
                              GoverningReport& report) {
    auto log = framesplice::logging::get_logger();

    nlohmann::json* members = nullptr;
    for (const char* key : {"analytical_members", "members"}) {
        if (export_document.contains(key) && export_document[key].is_array() &&
            !export_document[key].empty()) {
            members = &export_document[key];
            break;
        }
    }
    if (members == nullptr) {
        throw std::runtime_error("Export has no members to update");
    }

    // Exports identify members by line_id or by id
    std::unordered_map<std::int64_t, nlohmann::json*> by_line;
    std::unordered_map<std::int64_t, nlohmann::json*> by_id;
    for (auto& member : *members) {
        if (!member.is_object()) continue;
        if (member.contains("line_id")) {
            if (auto id = json_id(member["line_id"])) by_line[*id] = &member;
        }
        if (member.contains("id")) {
            if (auto id = json_id(member["id"])) by_id[*id] = &member;
        }
    }
    auto find_member = [&](LineId line_id) -> nlohmann::json* {
        auto it = by_line.find(line_id);
        if (it != by_line.end()) return it->second;
        auto jt = by_id.find(line_id);
        return jt != by_id.end() ? jt->second : nullptr;
    };

    for (const auto& [line_id, section_id] : results.section_by_line) {
        auto section = results.cross_sections.find(section_id);
        if (section == results.cross_sections.end()) continue;
        nlohmann::json* member = find_member(line_id);
        if (member == nullptr) continue;
        apply_section(*member, section->second);
        ++report.applied_children;
    }

    for (const auto& [mother, choice] : report.choices) {
        nlohmann::json* member = find_member(mother);
        if (member == nullptr) {
            log->debug("Mother {} not found in export", mother);
            continue;
        }
        apply_section(*member, choice.section);
        log->debug("Mother {}: governing section '{}' from child {}",
                   mother, choice.section.name, choice.child);
        ++report.updated_mothers;
    }

    log->info("Applied {} solver sections to analysed lines, {} governing sections to mothers",
              report.applied_children, report.updated_mothers);
}

}  // namespace framesplice
