#ifndef FRAMESPLICE_CONNECT_SPLIT_LIST_HPP
#define FRAMESPLICE_CONNECT_SPLIT_LIST_HPP

#include <model/elements.hpp>
#include <algorithm>
#include <vector>

namespace framesplice {

// A node lying on a line at parameter t (0 = start, 1 = end).
struct SplitPoint {
    double t = 0.0;
    NodeId node = 0;
};

// Ordered split parameters of one line, seeded with its own endpoints.
class SplitList {
public:
    explicit SplitList(const Line& line)
        : points_{{0.0, line.ni}, {1.0, line.nj}} {}

    void add(double t, NodeId node) { points_.push_back({t, node}); }

    size_t size() const { return points_.size(); }

    // Sorted by parameter with consecutive repeats of the same node collapsed.
    // Ties keep discovery order.
    std::vector<SplitPoint> resolve() const {
        std::vector<SplitPoint> sorted = points_;
        std::stable_sort(sorted.begin(), sorted.end(),
            [](const SplitPoint& a, const SplitPoint& b) { return a.t < b.t; });

        std::vector<SplitPoint> result;
        result.reserve(sorted.size());
        for (const auto& p : sorted) {
            if (result.empty() || result.back().node != p.node) {
                result.push_back(p);
            }
        }
        return result;
    }

private:
    std::vector<SplitPoint> points_;
};

}  // namespace framesplice

#endif // FRAMESPLICE_CONNECT_SPLIT_LIST_HPP
