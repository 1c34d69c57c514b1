#ifndef FRAMESPLICE_CONNECT_CONNECTOR_HPP
#define FRAMESPLICE_CONNECT_CONNECTOR_HPP

#include "connect_config.hpp"
#include "lineage.hpp"
#include "split_list.hpp"
#include <model/structural_model.hpp>
#include <geometry/segment_math.hpp>
#include <math/vec2.hpp>
#include <cstddef>
#include <unordered_map>
#include <vector>

namespace framesplice {

// Counters describing one connect pass
struct ConnectStats {
    size_t candidate_pairs = 0;      // pairs passing the elevation check
    size_t intersections = 0;        // plan hits
    size_t created_nodes = 0;
    size_t split_lines = 0;          // mothers replaced by children
    size_t created_lines = 0;
    size_t attached_segments = 0;    // existing lines attached to a mother
};

struct ConnectResult {
    StructuralModel model;
    Lineage lineage;
    ConnectStats stats;
};

// Locate a node within tol on every axis, or append a new one with id
// max(existing)+1. Returns the node id and whether it was created.
std::pair<NodeId, bool> find_or_create_node(
    StructuralModel& model, double x, double y, double z, double tol);

// Splits lines at their coplanar plan intersections so that crossing or
// touching members share nodes, and records which output lines make up each
// input line.
class Connector {
public:
    // Connect a model. The input is not modified. Throws std::out_of_range
    // when a line references a node that does not exist.
    static ConnectResult connect(
        const StructuralModel& input,
        const ConnectConfig& config = ConnectConfig{}
    );

private:
    Connector(const StructuralModel& input, const ConnectConfig& config);

    // Plan endpoints and mean elevation of a line
    struct LineGeometry {
        LineId id = 0;
        Vec2 a;
        Vec2 b;
        double elevation = 0.0;
    };

    struct PendingHit {
        size_t other = 0;
        SegmentHit hit;
    };

    // Hits found by pairing one line with every later line
    struct PairScan {
        std::vector<PendingHit> hits;
        size_t coplanar_pairs = 0;
    };

    LineGeometry geometry_of(const Line& line) const;

    void collect_intersections();
    PairScan scan_pairs_from(size_t i) const;
    void split_lines();
    void attach_existing_segments();
    void finalize_lineage();

    ConnectConfig config_;
    double elevation_tol_;

    StructuralModel model_;
    Lineage lineage_;
    ConnectStats stats_;

    std::vector<LineGeometry> original_geometry_;
    std::unordered_map<LineId, SplitList> splits_;
};

}  // namespace framesplice

#endif // FRAMESPLICE_CONNECT_CONNECTOR_HPP
