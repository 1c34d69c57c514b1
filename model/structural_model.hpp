#ifndef FRAMESPLICE_MODEL_STRUCTURAL_MODEL_HPP
#define FRAMESPLICE_MODEL_STRUCTURAL_MODEL_HPP

#include "elements.hpp"
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace framesplice {

// Container for nodes, lines and members of an analytical frame model.
// Elements are kept in insertion order and indexed by id.
class StructuralModel {
public:
    StructuralModel() = default;

    // Node management
    void add_node(const Node& node);
    Node& node(NodeId id);
    const Node& node(NodeId id) const;
    bool has_node(NodeId id) const;
    size_t node_count() const { return nodes_.size(); }
    const std::vector<Node>& nodes() const { return nodes_; }
    NodeId next_node_id() const;
    void remove_nodes(const std::unordered_set<NodeId>& ids);

    // Line management
    void add_line(const Line& line);
    Line& line(LineId id);
    const Line& line(LineId id) const;
    bool has_line(LineId id) const;
    size_t line_count() const { return lines_.size(); }
    const std::vector<Line>& lines() const { return lines_; }
    LineId next_line_id() const;
    void remove_lines(const std::unordered_set<LineId>& ids);

    // Member management (keyed by line id)
    void add_member(const Member& member);
    const Member* member_for_line(LineId line_id) const;
    bool has_member(LineId line_id) const;
    std::optional<Member> take_member(LineId line_id);
    size_t member_count() const { return members_.size(); }
    const std::vector<Member>& members() const { return members_; }

    // Endpoint helpers. Throw std::out_of_range on dangling references.
    const Node& start_node(const Line& line) const { return node(line.ni); }
    const Node& end_node(const Line& line) const { return node(line.nj); }
    double mean_elevation(const Line& line) const;

private:
    void rebuild_node_index();
    void rebuild_line_index();
    void rebuild_member_index();

    std::vector<Node> nodes_;
    std::vector<Line> lines_;
    std::vector<Member> members_;

    std::unordered_map<NodeId, size_t> node_index_;
    std::unordered_map<LineId, size_t> line_index_;
    std::unordered_map<LineId, size_t> member_index_;
};

}  // namespace framesplice

#endif // FRAMESPLICE_MODEL_STRUCTURAL_MODEL_HPP
