#ifndef FRAMESPLICE_CONNECT_LINEAGE_HPP
#define FRAMESPLICE_CONNECT_LINEAGE_HPP

#include <model/elements.hpp>
#include <map>
#include <optional>
#include <vector>

namespace framesplice {

// Bidirectional index between original (mother) lines and the lines that
// make them up after splitting (children). A mother that was not split
// is its own single child.
class Lineage {
public:
    // Ensure mother has an entry (possibly empty)
    void add_mother(LineId mother);

    // Append child under mother and point child back to mother
    void add_child(LineId mother, LineId child);

    // Record mother as its own single child
    void self_map(LineId id);

    // Move a self-mapped line under another mother. The line's own entry
    // is left empty.
    void attach(LineId mother, LineId line);

    bool has_mother(LineId mother) const;
    const std::vector<LineId>& children(LineId mother) const;
    std::optional<LineId> mother_of(LineId child) const;

    // True when id maps only to itself (unsplit, not attached elsewhere)
    bool is_self_mapped(LineId id) const;

    // True when id is a child of a mother other than itself
    bool owned_elsewhere(LineId id) const;

    const std::map<LineId, std::vector<LineId>>& mother_to_children() const {
        return mother_to_children_;
    }
    const std::map<LineId, LineId>& child_to_mother() const {
        return child_to_mother_;
    }

    size_t mother_count() const { return mother_to_children_.size(); }
    size_t child_count() const { return child_to_mother_.size(); }

private:
    std::map<LineId, std::vector<LineId>> mother_to_children_;
    std::map<LineId, LineId> child_to_mother_;
};

}  // namespace framesplice

#endif // FRAMESPLICE_CONNECT_LINEAGE_HPP
