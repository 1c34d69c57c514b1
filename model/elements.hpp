#ifndef FRAMESPLICE_MODEL_ELEMENTS_HPP
#define FRAMESPLICE_MODEL_ELEMENTS_HPP

#include <math/vec2.hpp>
#include <cstdint>
#include <string>

namespace framesplice {

using NodeId = std::int64_t;
using LineId = std::int64_t;
using CrossSectionId = std::int64_t;

enum class Material {
    Steel,
    Concrete
};

// A point of the analytical model.
struct Node {
    NodeId id = 0;
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    Vec2 plan() const { return {x, y}; }
};

// Straight connector between two nodes, referenced by id.
struct Line {
    LineId id = 0;
    NodeId ni = 0;
    NodeId nj = 0;
};

// Section and material assignment of a line. At most one per line.
struct Member {
    LineId line_id = 0;
    CrossSectionId cross_section_id = 0;
    Material material = Material::Steel;
};

// Catalog entry for a cross section (SI units as exported).
struct CrossSection {
    CrossSectionId id = 0;
    std::string name = "Section";
    double area = 0.01;     // A
    double iz = 1e-4;       // strong axis moment of inertia
    double iy = 1e-5;       // weak axis moment of inertia
    double jxx = 1e-6;      // torsional constant
    double width = 0.3;     // b
    double height = 0.3;    // h
};

}  // namespace framesplice

#endif // FRAMESPLICE_MODEL_ELEMENTS_HPP
