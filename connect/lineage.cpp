#include "lineage.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace framesplice {

void Lineage::add_mother(LineId mother) {
    mother_to_children_.try_emplace(mother);
}

void Lineage::add_child(LineId mother, LineId child) {
    auto& kids = mother_to_children_[mother];
    if (std::find(kids.begin(), kids.end(), child) == kids.end()) {
        kids.push_back(child);
    }
    child_to_mother_[child] = mother;
}

void Lineage::self_map(LineId id) {
    mother_to_children_[id] = {id};
    child_to_mother_[id] = id;
}

void Lineage::attach(LineId mother, LineId line) {
    if (!is_self_mapped(line)) {
        throw std::logic_error("Lineage::attach: line " + std::to_string(line) +
                               " is already owned");
    }
    mother_to_children_[line].clear();
    add_child(mother, line);
}

bool Lineage::has_mother(LineId mother) const {
    return mother_to_children_.find(mother) != mother_to_children_.end();
}

const std::vector<LineId>& Lineage::children(LineId mother) const {
    auto it = mother_to_children_.find(mother);
    if (it == mother_to_children_.end()) {
        throw std::out_of_range("Lineage::children: unknown mother " + std::to_string(mother));
    }
    return it->second;
}

std::optional<LineId> Lineage::mother_of(LineId child) const {
    auto it = child_to_mother_.find(child);
    if (it == child_to_mother_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Lineage::is_self_mapped(LineId id) const {
    auto mother = mother_of(id);
    if (!mother || *mother != id) {
        return false;
    }
    const auto& kids = children(id);
    return kids.size() == 1 && kids.front() == id;
}

bool Lineage::owned_elsewhere(LineId id) const {
    auto mother = mother_of(id);
    return mother.has_value() && *mother != id;
}

}  // namespace framesplice
