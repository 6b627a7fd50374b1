#pragma once

namespace cargopack {

struct Vec3 {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

// Box extents along the container axes: dx along x (length), dy along y (height, gravity), dz along z (depth).
struct Extents {
    double dx = 0.0;
    double dy = 0.0;
    double dz = 0.0;

    double volume() const { return dx * dy * dz; }
};

struct Box3 {
    Vec3 min;
    Vec3 max;

    double volume() const { return (max.x - min.x) * (max.y - min.y) * (max.z - min.z); }
};

inline Box3 box_at(const Vec3& p, const Extents& e) {
    return Box3{p, Vec3{p.x + e.dx, p.y + e.dy, p.z + e.dz}};
}

// Returns true only when the boxes share positive-volume interior (touching faces is NOT overlap).
inline bool boxes_overlap_strict(const Box3& a, const Box3& b, double eps = 0.0) {
    return (a.min.x < b.max.x - eps && a.max.x > b.min.x + eps) &&
           (a.min.y < b.max.y - eps && a.max.y > b.min.y + eps) &&
           (a.min.z < b.max.z - eps && a.max.z > b.min.z + eps);
}

inline bool point_inside_strict(const Vec3& p, const Box3& b, double eps = 0.0) {
    return (p.x > b.min.x + eps && p.x < b.max.x - eps) && (p.y > b.min.y + eps && p.y < b.max.y - eps) &&
           (p.z > b.min.z + eps && p.z < b.max.z - eps);
}

}  // namespace cargopack
