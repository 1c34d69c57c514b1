#include "structural_model.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace framesplice {

void StructuralModel::add_node(const Node& node) {
    if (node_index_.count(node.id)) {
        throw std::invalid_argument("StructuralModel::add_node: duplicate node id " +
                                    std::to_string(node.id));
    }
    node_index_[node.id] = nodes_.size();
    nodes_.push_back(node);
}

Node& StructuralModel::node(NodeId id) {
    auto it = node_index_.find(id);
    if (it == node_index_.end()) {
        throw std::out_of_range("StructuralModel::node: invalid node id " + std::to_string(id));
    }
    return nodes_[it->second];
}

const Node& StructuralModel::node(NodeId id) const {
    auto it = node_index_.find(id);
    if (it == node_index_.end()) {
        throw std::out_of_range("StructuralModel::node: invalid node id " + std::to_string(id));
    }
    return nodes_[it->second];
}

bool StructuralModel::has_node(NodeId id) const {
    return node_index_.find(id) != node_index_.end();
}

NodeId StructuralModel::next_node_id() const {
    if (nodes_.empty()) {
        return 1;
    }
    auto it = std::max_element(nodes_.begin(), nodes_.end(),
        [](const Node& a, const Node& b) { return a.id < b.id; });
    return it->id + 1;
}

void StructuralModel::remove_nodes(const std::unordered_set<NodeId>& ids) {
    if (ids.empty()) return;
    nodes_.erase(std::remove_if(nodes_.begin(), nodes_.end(),
                     [&ids](const Node& n) { return ids.count(n.id) > 0; }),
                 nodes_.end());
    rebuild_node_index();
}

void StructuralModel::add_line(const Line& line) {
    if (line_index_.count(line.id)) {
        throw std::invalid_argument("StructuralModel::add_line: duplicate line id " +
                                    std::to_string(line.id));
    }
    line_index_[line.id] = lines_.size();
    lines_.push_back(line);
}

Line& StructuralModel::line(LineId id) {
    auto it = line_index_.find(id);
    if (it == line_index_.end()) {
        throw std::out_of_range("StructuralModel::line: invalid line id " + std::to_string(id));
    }
    return lines_[it->second];
}

const Line& StructuralModel::line(LineId id) const {
    auto it = line_index_.find(id);
    if (it == line_index_.end()) {
        throw std::out_of_range("StructuralModel::line: invalid line id " + std::to_string(id));
    }
    return lines_[it->second];
}

bool StructuralModel::has_line(LineId id) const {
    return line_index_.find(id) != line_index_.end();
}

LineId StructuralModel::next_line_id() const {
    if (lines_.empty()) {
        return 1;
    }
    auto it = std::max_element(lines_.begin(), lines_.end(),
        [](const Line& a, const Line& b) { return a.id < b.id; });
    return it->id + 1;
}

void StructuralModel::remove_lines(const std::unordered_set<LineId>& ids) {
    if (ids.empty()) return;
    lines_.erase(std::remove_if(lines_.begin(), lines_.end(),
                     [&ids](const Line& l) { return ids.count(l.id) > 0; }),
                 lines_.end());
    rebuild_line_index();
}

void StructuralModel::add_member(const Member& member) {
    if (member_index_.count(member.line_id)) {
        throw std::invalid_argument("StructuralModel::add_member: line " +
                                    std::to_string(member.line_id) + " already has a member");
    }
    member_index_[member.line_id] = members_.size();
    members_.push_back(member);
}

const Member* StructuralModel::member_for_line(LineId line_id) const {
    auto it = member_index_.find(line_id);
    if (it == member_index_.end()) {
        return nullptr;
    }
    return &members_[it->second];
}

bool StructuralModel::has_member(LineId line_id) const {
    return member_index_.find(line_id) != member_index_.end();
}

std::optional<Member> StructuralModel::take_member(LineId line_id) {
    auto it = member_index_.find(line_id);
    if (it == member_index_.end()) {
        return std::nullopt;
    }
    Member member = members_[it->second];
    members_.erase(members_.begin() + static_cast<std::ptrdiff_t>(it->second));
    rebuild_member_index();
    return member;
}

double StructuralModel::mean_elevation(const Line& line) const {
    return 0.5 * (start_node(line).z + end_node(line).z);
}

void StructuralModel::rebuild_node_index() {
    node_index_.clear();
    for (size_t i = 0; i < nodes_.size(); ++i) {
        node_index_[nodes_[i].id] = i;
    }
}

void StructuralModel::rebuild_line_index() {
    line_index_.clear();
    for (size_t i = 0; i < lines_.size(); ++i) {
        line_index_[lines_[i].id] = i;
    }
}

void StructuralModel::rebuild_member_index() {
    member_index_.clear();
    for (size_t i = 0; i < members_.size(); ++i) {
        member_index_[members_[i].line_id] = i;
    }
}

}  // namespace framesplice
