#ifndef FRAMESPLICE_GEOMETRY_SEGMENT_MATH_HPP
#define FRAMESPLICE_GEOMETRY_SEGMENT_MATH_HPP

#include <math/vec2.hpp>
#include <optional>

namespace framesplice {

// Result of a plan intersection between segments p1->p2 and q1->q2.
// t is the parameter along p, u along q, both clamped to [0, 1].
struct SegmentHit {
    double x = 0.0;
    double y = 0.0;
    double t = 0.0;
    double u = 0.0;
};

// 2D cross product u.x*v.y - u.y*v.x
double cross_sign(const Vec2& u, const Vec2& v);

// Solve p1 + t*(p2-p1) == q1 + u*(q2-q1).
// Returns nullopt when |det| <= tol (parallel or collinear), when either
// parameter falls outside [-tol, 1+tol], or when the point is not finite.
// Touching endpoints count as a hit.
std::optional<SegmentHit> intersect_segments_xy(
    const Vec2& p1, const Vec2& p2,
    const Vec2& q1, const Vec2& q2,
    double tol);

// |signed area of abc| <= tol
bool collinear_xy(const Vec2& a, const Vec2& b, const Vec2& c, double tol);

// Projection parameter of p on a->b; 0 for a degenerate segment.
double param_on_segment_xy(const Vec2& a, const Vec2& b, const Vec2& p);

// Collinear with a->b and projected parameter within [-tol, 1+tol].
bool point_on_segment_xy(const Vec2& a, const Vec2& b, const Vec2& p, double tol);

}  // namespace framesplice

#endif // FRAMESPLICE_GEOMETRY_SEGMENT_MATH_HPP
