#pragma once

#include <array>

#include "cargopack/cargo.hpp"
#include "cargopack/geometry.hpp"

namespace cargopack {

constexpr int kOrientationCount = 6;

using Orientations = std::array<Extents, kOrientationCount>;

// All axis permutations of (length, width, height), always in the same order:
// (l,w,h) (w,l,h) (h,w,l) (l,h,w) (w,h,l) (h,l,w), read as (along x, along z, along y).
// Equal extents produce repeated entries; they are not deduplicated.
Orientations item_orientations(const Dimensions& d);

inline bool fits_container(const Extents& e, const Container& c, double eps = 0.0) {
    return e.dx <= c.width + eps && e.dy <= c.height + eps && e.dz <= c.depth + eps;
}

}  // namespace cargopack
