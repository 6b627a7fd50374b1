#pragma once

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

#include "cargopack/geometry.hpp"

namespace cargopack {

// Uniform spatial hash over axis-aligned boxes. Boxes are only ever added.
// All queries are const and safe to call from several threads at once.
class BoxIndex {
public:
    struct CellKey {
        std::int64_t ix = 0;
        std::int64_t iy = 0;
        std::int64_t iz = 0;

        bool operator==(const CellKey& other) const { return ix == other.ix && iy == other.iy && iz == other.iz; }
    };

    struct CellKeyHash {
        std::size_t operator()(const CellKey& k) const noexcept {
            std::uint64_t h = static_cast<std::uint64_t>(k.ix) * 0x9E3779B97F4A7C15ULL;
            h ^= static_cast<std::uint64_t>(k.iy) + 0x9E3779B97F4A7C15ULL + (h << 6) + (h >> 2);
            h ^= static_cast<std::uint64_t>(k.iz) + 0x9E3779B97F4A7C15ULL + (h << 6) + (h >> 2);
            return static_cast<std::size_t>(h);
        }
    };

    explicit BoxIndex(double cell_size);

    // Adds a box and returns its id (ids are dense, starting at 0).
    int insert(const Box3& box);

    int size() const { return static_cast<int>(boxes_.size()); }
    const Box3& box(int id) const { return boxes_[static_cast<std::size_t>(id)]; }
    double cell_size() const { return cell_size_; }

    // True if `query` shares positive-volume interior with any stored box.
    bool overlaps_any(const Box3& query, double eps = 0.0) const;

    // True if `p` lies strictly inside any stored box (points on a face do not count).
    bool contains_point_strict(const Vec3& p, double eps = 0.0) const;

private:
    double cell_size_ = 1.0;

    std::unordered_map<CellKey, std::vector<int>, CellKeyHash> cells_;
    std::vector<Box3> boxes_;

    std::int64_t coord_to_cell(double v) const;
};

}  // namespace cargopack
