#include "segment_math.hpp"
#include <algorithm>
#include <cmath>

namespace framesplice {

double cross_sign(const Vec2& u, const Vec2& v) {
    return u.cross(v);
}

std::optional<SegmentHit> intersect_segments_xy(
    const Vec2& p1, const Vec2& p2,
    const Vec2& q1, const Vec2& q2,
    double tol) {

    Vec2 dp = p2 - p1;
    Vec2 dq = q2 - q1;
    double det = cross_sign(dp, dq);
    if (std::abs(det) <= tol) {
        return std::nullopt;
    }

    Vec2 r = q1 - p1;
    double t = cross_sign(r, dq) / det;
    double u = cross_sign(r, dp) / det;
    if (t < -tol || t > 1.0 + tol || u < -tol || u > 1.0 + tol) {
        return std::nullopt;
    }
    t = std::clamp(t, 0.0, 1.0);
    u = std::clamp(u, 0.0, 1.0);

    Vec2 point = p1 + dp * t;
    if (!point.is_finite()) {
        return std::nullopt;
    }
    return SegmentHit{point.x, point.y, t, u};
}

bool collinear_xy(const Vec2& a, const Vec2& b, const Vec2& c, double tol) {
    return std::abs(cross_sign(b - a, c - a)) <= tol;
}

double param_on_segment_xy(const Vec2& a, const Vec2& b, const Vec2& p) {
    Vec2 ab = b - a;
    double denom = ab.length_squared();
    if (denom == 0.0) {
        return 0.0;
    }
    return (p - a).dot(ab) / denom;
}

bool point_on_segment_xy(const Vec2& a, const Vec2& b, const Vec2& p, double tol) {
    if (!collinear_xy(a, b, p, tol)) {
        return false;
    }
    double t = param_on_segment_xy(a, b, p);
    return t >= -tol && t <= 1.0 + tol;
}

}  // namespace framesplice
