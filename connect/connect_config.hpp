#ifndef FRAMESPLICE_CONNECT_CONFIG_HPP
#define FRAMESPLICE_CONNECT_CONFIG_HPP

#include <algorithm>
#include <cmath>
#include <optional>
#include <stdexcept>

namespace framesplice {

// Configuration for connecting lines at their plan intersections
struct ConnectConfig {
    // Coordinate, collinearity and parametric tolerance.
    // 1e-6 for clean models, 1e-4 is typical for CAD exports.
    double tolerance = 1e-6;

    // Maximum difference of mean line elevations for two lines to be
    // considered coplanar. Defaults to 10 * tolerance.
    std::optional<double> elevation_tolerance;

    // Attach existing lines lying on a mother span to that mother
    bool attach_existing_segments = true;

    // Merge bit-identical input nodes before connecting
    bool merge_duplicate_nodes = false;

    double effective_elevation_tolerance() const {
        if (elevation_tolerance.has_value()) {
            return elevation_tolerance.value();
        }
        return std::max(tolerance, 10.0 * tolerance);
    }

    void validate() const {
        if (!std::isfinite(tolerance) || tolerance < 0.0) {
            throw std::invalid_argument("ConnectConfig: tolerance must be finite and non-negative");
        }
        double elevation = effective_elevation_tolerance();
        if (!std::isfinite(elevation) || elevation < 0.0) {
            throw std::invalid_argument(
                "ConnectConfig: elevation_tolerance must be finite and non-negative");
        }
    }
};

}  // namespace framesplice

#endif // FRAMESPLICE_CONNECT_CONFIG_HPP
