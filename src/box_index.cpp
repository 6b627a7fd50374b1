#include "cargopack/box_index.hpp"

#include <cmath>
#include <stdexcept>

namespace cargopack {

BoxIndex::BoxIndex(double cell_size) : cell_size_(cell_size) {
    if (!(cell_size_ > 0.0) || !std::isfinite(cell_size_)) {
        throw std::invalid_argument("BoxIndex: cell_size must be finite and > 0");
    }
}

std::int64_t BoxIndex::coord_to_cell(double v) const {
    return static_cast<std::int64_t>(std::floor(v / cell_size_));
}

int BoxIndex::insert(const Box3& box) {
    const int id = size();
    boxes_.push_back(box);

    const std::int64_t ix0 = coord_to_cell(box.min.x);
    const std::int64_t ix1 = coord_to_cell(box.max.x);
    const std::int64_t iy0 = coord_to_cell(box.min.y);
    const std::int64_t iy1 = coord_to_cell(box.max.y);
    const std::int64_t iz0 = coord_to_cell(box.min.z);
    const std::int64_t iz1 = coord_to_cell(box.max.z);
    for (std::int64_t ix = ix0; ix <= ix1; ++ix) {
        for (std::int64_t iy = iy0; iy <= iy1; ++iy) {
            for (std::int64_t iz = iz0; iz <= iz1; ++iz) {
                cells_[CellKey{ix, iy, iz}].push_back(id);
            }
        }
    }
    return id;
}

bool BoxIndex::overlaps_any(const Box3& query, double eps) const {
    if (boxes_.empty()) {
        return false;
    }
    const std::int64_t ix0 = coord_to_cell(query.min.x);
    const std::int64_t ix1 = coord_to_cell(query.max.x);
    const std::int64_t iy0 = coord_to_cell(query.min.y);
    const std::int64_t iy1 = coord_to_cell(query.max.y);
    const std::int64_t iz0 = coord_to_cell(query.min.z);
    const std::int64_t iz1 = coord_to_cell(query.max.z);

    // A box may be tested more than once when it spans several cells; the answer is the same.
    for (std::int64_t ix = ix0; ix <= ix1; ++ix) {
        for (std::int64_t iy = iy0; iy <= iy1; ++iy) {
            for (std::int64_t iz = iz0; iz <= iz1; ++iz) {
                auto it = cells_.find(CellKey{ix, iy, iz});
                if (it == cells_.end()) {
                    continue;
                }
                for (const int id : it->second) {
                    if (boxes_overlap_strict(query, boxes_[static_cast<std::size_t>(id)], eps)) {
                        return true;
                    }
                }
            }
        }
    }
    return false;
}

bool BoxIndex::contains_point_strict(const Vec3& p, double eps) const {
    auto it = cells_.find(CellKey{coord_to_cell(p.x), coord_to_cell(p.y), coord_to_cell(p.z)});
    if (it == cells_.end()) {
        return false;
    }
    for (const int id : it->second) {
        if (point_inside_strict(p, boxes_[static_cast<std::size_t>(id)], eps)) {
            return true;
        }
    }
    return false;
}

}  // namespace cargopack
