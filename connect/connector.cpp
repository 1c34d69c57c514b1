#include "connector.hpp"
#include "logging.hpp"
#include <cmath>
#include <unordered_set>
#ifdef _OPENMP
#include <omp.h>
#endif

namespace framesplice {

namespace {

// Below this many lines the pair scan runs serially
constexpr size_t kParallelScanThreshold = 256;

}  // namespace

std::pair<NodeId, bool> find_or_create_node(
    StructuralModel& model, double x, double y, double z, double tol) {

    for (const auto& node : model.nodes()) {
        if (std::abs(node.x - x) <= tol &&
            std::abs(node.y - y) <= tol &&
            std::abs(node.z - z) <= tol) {
            return {node.id, false};
        }
    }

    Node created;
    created.id = model.next_node_id();
    created.x = x;
    created.y = y;
    created.z = z;
    model.add_node(created);
    return {created.id, true};
}

ConnectResult Connector::connect(const StructuralModel& input, const ConnectConfig& config) {
    config.validate();

    auto log = framesplice::logging::get_logger();
    log->info("Connector: {} nodes, {} lines, {} members (tol={}, elevation tol={})",
              input.node_count(), input.line_count(), input.member_count(),
              config.tolerance, config.effective_elevation_tolerance());

    Connector connector(input, config);
    connector.collect_intersections();
    connector.split_lines();
    connector.attach_existing_segments();
    connector.finalize_lineage();

    const auto& stats = connector.stats_;
    log->info("Connector: {} intersections, {} new nodes, {} lines split into {} children, "
              "{} existing segments attached",
              stats.intersections, stats.created_nodes, stats.split_lines,
              stats.created_lines, stats.attached_segments);

    return ConnectResult{std::move(connector.model_), std::move(connector.lineage_), stats};
}

Connector::Connector(const StructuralModel& input, const ConnectConfig& config)
    : config_(config),
      elevation_tol_(config.effective_elevation_tolerance()),
      model_(input) {
}

Connector::LineGeometry Connector::geometry_of(const Line& line) const {
    const Node& ni = model_.start_node(line);
    const Node& nj = model_.end_node(line);

    LineGeometry geometry;
    geometry.id = line.id;
    geometry.a = ni.plan();
    geometry.b = nj.plan();
    geometry.elevation = 0.5 * (ni.z + nj.z);
    return geometry;
}

void Connector::collect_intersections() {
    auto log = framesplice::logging::get_logger();

    original_geometry_.clear();
    original_geometry_.reserve(model_.line_count());
    for (const auto& line : model_.lines()) {
        original_geometry_.push_back(geometry_of(line));
        splits_.emplace(line.id, SplitList(line));
    }

    const size_t n = original_geometry_.size();
    std::vector<PairScan> scans(n);

    // Pair tests only read the precomputed geometry. Node creation below
    // stays serial so synthetic ids follow discovery order.
    #pragma omp parallel for schedule(dynamic, 16) if(n > kParallelScanThreshold)
    for (size_t i = 0; i < n; ++i) {
        scans[i] = scan_pairs_from(i);
    }

    for (size_t i = 0; i < n; ++i) {
        const auto& gi = original_geometry_[i];
        stats_.candidate_pairs += scans[i].coplanar_pairs;

        for (const auto& pending : scans[i].hits) {
            const auto& gj = original_geometry_[pending.other];
            double z = 0.5 * (gi.elevation + gj.elevation);

            auto [node_id, created] = find_or_create_node(
                model_, pending.hit.x, pending.hit.y, z, config_.tolerance);
            if (created) {
                ++stats_.created_nodes;
                log->trace("Created node {} at ({}, {}, {})",
                           node_id, pending.hit.x, pending.hit.y, z);
            }

            splits_.at(gi.id).add(pending.hit.t, node_id);
            splits_.at(gj.id).add(pending.hit.u, node_id);
            ++stats_.intersections;
        }
    }

    log->debug("Collected {} intersections over {} coplanar pairs",
               stats_.intersections, stats_.candidate_pairs);
}

Connector::PairScan Connector::scan_pairs_from(size_t i) const {
    PairScan scan;
    const auto& gi = original_geometry_[i];

    for (size_t j = i + 1; j < original_geometry_.size(); ++j) {
        const auto& gj = original_geometry_[j];
        if (std::abs(gi.elevation - gj.elevation) > elevation_tol_) {
            continue;
        }
        ++scan.coplanar_pairs;

        auto hit = intersect_segments_xy(gi.a, gi.b, gj.a, gj.b, config_.tolerance);
        if (!hit) {
            continue;
        }
        scan.hits.push_back({j, *hit});
    }
    return scan;
}

void Connector::split_lines() {
    auto log = framesplice::logging::get_logger();

    LineId next_line_id = model_.next_line_id();
    std::unordered_set<LineId> split_mothers;

    for (const auto& mother : original_geometry_) {
        lineage_.add_mother(mother.id);

        std::vector<SplitPoint> points = splits_.at(mother.id).resolve();
        if (points.size() <= 2) {
            lineage_.self_map(mother.id);
            continue;
        }

        split_mothers.insert(mother.id);
        std::optional<Member> mother_member = model_.take_member(mother.id);

        for (size_t k = 0; k + 1 < points.size(); ++k) {
            if (points[k].node == points[k + 1].node) {
                continue;
            }

            Line child;
            child.id = next_line_id++;
            child.ni = points[k].node;
            child.nj = points[k + 1].node;
            model_.add_line(child);
            lineage_.add_child(mother.id, child.id);
            ++stats_.created_lines;

            if (mother_member) {
                Member member = *mother_member;
                member.line_id = child.id;
                model_.add_member(member);
            }
        }

        ++stats_.split_lines;
        log->debug("Line {} split into {} children", mother.id,
                   lineage_.children(mother.id).size());
    }

    model_.remove_lines(split_mothers);
}

void Connector::attach_existing_segments() {
    if (!config_.attach_existing_segments) {
        return;
    }
    auto log = framesplice::logging::get_logger();
    const double tol = config_.tolerance;

    std::vector<LineGeometry> candidates;
    candidates.reserve(model_.line_count());
    for (const auto& line : model_.lines()) {
        candidates.push_back(geometry_of(line));
    }

    for (const auto& mother : original_geometry_) {
        if (lineage_.owned_elsewhere(mother.id)) {
            continue;
        }
        // A span with no plan length (a column seen from above) covers nothing
        if ((mother.b - mother.a).length_squared() <= tol * tol) {
            continue;
        }

        for (const auto& cand : candidates) {
            if (cand.id == mother.id || !lineage_.is_self_mapped(cand.id)) {
                continue;
            }
            if (std::abs(cand.elevation - mother.elevation) > elevation_tol_) {
                continue;
            }
            if (!collinear_xy(mother.a, mother.b, cand.a, tol) ||
                !collinear_xy(mother.a, mother.b, cand.b, tol)) {
                continue;
            }
            if (!point_on_segment_xy(mother.a, mother.b, cand.a, tol) ||
                !point_on_segment_xy(mother.a, mother.b, cand.b, tol)) {
                continue;
            }

            lineage_.attach(mother.id, cand.id);
            ++stats_.attached_segments;
            log->debug("Line {} lies on line {}, attached as its child", cand.id, mother.id);
        }
    }
}

void Connector::finalize_lineage() {
    for (const auto& original : original_geometry_) {
        lineage_.add_mother(original.id);
        if (lineage_.children(original.id).empty() &&
            model_.has_line(original.id) &&
            !lineage_.owned_elsewhere(original.id)) {
            lineage_.self_map(original.id);
        }
    }
}

}  // namespace framesplice
