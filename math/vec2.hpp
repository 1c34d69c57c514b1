#ifndef FRAMESPLICE_MATH_VEC2_HPP
#define FRAMESPLICE_MATH_VEC2_HPP

#include <cmath>

namespace framesplice {

// Plan (XY) vector. Elevation is handled separately by the callers.
struct Vec2 {
    double x = 0.0;
    double y = 0.0;

    constexpr Vec2() = default;
    constexpr Vec2(double x_, double y_) : x(x_), y(y_) {}

    constexpr Vec2 operator+(const Vec2& other) const {
        return {x + other.x, y + other.y};
    }

    constexpr Vec2 operator-(const Vec2& other) const {
        return {x - other.x, y - other.y};
    }

    constexpr Vec2 operator*(double scalar) const {
        return {x * scalar, y * scalar};
    }

    constexpr double dot(const Vec2& other) const {
        return x * other.x + y * other.y;
    }

    // z component of the 3D cross product of (x, y, 0) vectors
    constexpr double cross(const Vec2& other) const {
        return x * other.y - y * other.x;
    }

    constexpr double length_squared() const {
        return x * x + y * y;
    }

    double length() const {
        return std::sqrt(length_squared());
    }

    bool is_finite() const {
        return std::isfinite(x) && std::isfinite(y);
    }

    // Comparison (exact)
    constexpr bool operator==(const Vec2& other) const {
        return x == other.x && y == other.y;
    }

    constexpr bool operator!=(const Vec2& other) const {
        return !(*this == other);
    }
};

constexpr Vec2 operator*(double scalar, const Vec2& v) {
    return v * scalar;
}

}  // namespace framesplice

#endif // FRAMESPLICE_MATH_VEC2_HPP
