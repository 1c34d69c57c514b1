#ifndef FRAMESPLICE_CLEANUP_DUPLICATE_NODES_HPP
#define FRAMESPLICE_CLEANUP_DUPLICATE_NODES_HPP

#include <model/structural_model.hpp>
#include <cstddef>
#include <map>

namespace framesplice {

// Old node id -> kept node id for every merged node
using NodeReplacements = std::map<NodeId, NodeId>;

// Merge nodes with identical coordinates onto the smallest id among them,
// rewrite line endpoints and drop the merged nodes. Lines that become
// zero-length are kept. Returns the replacements applied.
NodeReplacements merge_duplicate_nodes(StructuralModel& model);

}  // namespace framesplice

#endif // FRAMESPLICE_CLEANUP_DUPLICATE_NODES_HPP
