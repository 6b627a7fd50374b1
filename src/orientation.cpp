#include "cargopack/orientation.hpp"

namespace cargopack {

Orientations item_orientations(const Dimensions& d) {
    const double l = d.length;
    const double w = d.width;
    const double h = d.height;
    // Extents{dx, dy, dz}: the triples in the header are (dx, dz, dy).
    return Orientations{{
        Extents{l, h, w},
        Extents{w, h, l},
        Extents{h, l, w},
        Extents{l, w, h},
        Extents{w, l, h},
        Extents{h, w, l},
    }};
}

}  // namespace cargopack
