#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "cargopack/box_index.hpp"
#include "cargopack/candidate_set.hpp"
#include "cargopack/cargo.hpp"
#include "cargopack/item_order.hpp"

namespace cargopack {

// Called after each successful placement with the running placed count and used volume.
// Runs on the packing thread. An exception thrown here propagates out of pack() and the
// partial result is discarded.
using PackObserver = std::function<void(const PlacedItem& placed, std::size_t placed_count, double used_volume)>;

struct PackerOptions {
    CandidateSetOptions candidates{};

    double volume_tolerance = kDefaultVolumeTolerance;

    // Grid step of the exhaustive fallback scan. The Packer constructor rejects a step that
    // would give more than 1e12 grid cells in one horizontal layer.
    double fallback_step = 2.0;

    // Tolerance for bounds and collision checks.
    double eps = 1e-9;

    // Spatial index cell size; <= 0 derives one from the container.
    double index_cell_size = 0.0;

    // OpenMP threads for the fallback scan (0 = runtime default, 1 = serial).
    int threads = 0;

    // Wall-clock budget for one item's fallback scan; <= 0 means exhaustive.
    double fallback_time_limit_sec = 0.0;

    // Log start/progress/done to stderr every N items (0 = silent).
    int log_every = 0;
    std::string log_prefix = "[packer]";
};

struct PackResult {
    std::vector<PlacedItem> placed;
    double used_volume = 0.0;

    // Items neither phase could place, in processing order.
    std::vector<Item> unplaced;

    bool complete() const { return unplaced.empty(); }
};

void validate_options(const PackerOptions& opt);

// One packing job. Not reentrant; pack() may be called once per instance.
class Packer {
public:
    explicit Packer(const Container& container, const PackerOptions& opt = {});

    PackResult pack(const std::vector<Item>& items, const PackObserver& observer = {});

    const Container& container() const { return container_; }
    const PackerOptions& options() const { return opt_; }

    // Feasibility of extents `e` at `p` against the container and everything placed so far.
    bool can_place(const Extents& e, const Vec3& p) const;

private:
    Container container_;
    PackerOptions opt_;
    BoxIndex index_;
    CandidateSet candidates_;
    bool used_ = false;

    struct Choice {
        Vec3 position;
        int orientation = -1;
    };

    bool find_greedy(const Item& item, Choice& out) const;
    bool find_fallback(const Item& item, Choice& out) const;
    bool scan_layer(const Extents& e, double y, double step, Vec3& out) const;
};

// Convenience wrapper around a one-shot Packer.
PackResult pack(
    const Container& container,
    const std::vector<Item>& items,
    const PackObserver& observer = {},
    const PackerOptions& opt = {}
);

}  // namespace cargopack
