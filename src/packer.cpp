#include "cargopack/packer.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <stdexcept>

#include "cargopack/logging.hpp"
#include "cargopack/orientation.hpp"

#if defined(_OPENMP)
#include <omp.h>
#endif

namespace cargopack {
namespace {

// Below this many grid cells per layer the scan stays serial.
constexpr std::int64_t kParallelMinCells = 512;

constexpr double kCellsPerLongestSide = 8.0;

// Upper bound on fallback grid cells in one y-layer. Also keeps nx * nz well inside int64.
constexpr double kMaxFallbackLayerCells = 1e12;

Container checked_container(const Container& c) {
    validate_container(c);
    return c;
}

PackerOptions checked_options(const Container& c, const PackerOptions& opt) {
    validate_options(opt);
    const double layer_cells =
        (std::floor(c.width / opt.fallback_step) + 1.0) * (std::floor(c.depth / opt.fallback_step) + 1.0);
    if (!(layer_cells <= kMaxFallbackLayerCells)) {
        throw std::invalid_argument("Packer: fallback_step is too small for the container (grid layer too large)");
    }
    return opt;
}

double resolve_cell_size(const Container& c, const PackerOptions& opt) {
    if (opt.index_cell_size > 0.0) {
        return opt.index_cell_size;
    }
    const double longest = std::max({c.width, c.height, c.depth});
    return std::max(1.0, longest / kCellsPerLongestSide);
}

#if defined(_OPENMP)
int omp_threads(int requested) {
    return (requested > 0) ? requested : omp_get_max_threads();
}
#endif

}  // namespace

void validate_options(const PackerOptions& opt) {
    if (!(opt.fallback_step > 0.0) || !std::isfinite(opt.fallback_step)) {
        throw std::invalid_argument("validate_options: fallback_step must be finite and > 0");
    }
    if (!(opt.eps >= 0.0)) {
        throw std::invalid_argument("validate_options: eps must be >= 0");
    }
    if (!(opt.volume_tolerance >= 0.0)) {
        throw std::invalid_argument("validate_options: volume_tolerance must be >= 0");
    }
    if (!std::isfinite(opt.index_cell_size)) {
        throw std::invalid_argument("validate_options: index_cell_size must be finite");
    }
    if (opt.threads < 0) {
        throw std::invalid_argument("validate_options: threads must be >= 0");
    }
    if (opt.log_every < 0) {
        throw std::invalid_argument("validate_options: log_every must be >= 0");
    }
    if (!(opt.candidates.gap >= 0.0)) {
        throw std::invalid_argument("validate_options: candidates.gap must be >= 0");
    }
    if (!(opt.candidates.order_tolerance >= 0.0) || !(opt.candidates.dedupe_tolerance >= 0.0) ||
        !(opt.candidates.consume_tolerance >= 0.0)) {
        throw std::invalid_argument("validate_options: candidate tolerances must be >= 0");
    }
}

Packer::Packer(const Container& container, const PackerOptions& opt)
    : container_(checked_container(container)),
      opt_(checked_options(container_, opt)),
      index_(resolve_cell_size(container_, opt_)),
      candidates_(container_, opt_.candidates) {}

bool Packer::can_place(const Extents& e, const Vec3& p) const {
    const double eps = opt_.eps;
    if (p.x < -eps || p.y < -eps || p.z < -eps) {
        return false;
    }
    if (p.x + e.dx > container_.width + eps || p.y + e.dy > container_.height + eps ||
        p.z + e.dz > container_.depth + eps) {
        return false;
    }
    return !index_.overlaps_any(box_at(p, e), eps);
}

bool Packer::find_greedy(const Item& item, Choice& out) const {
    const Orientations orients = item_orientations(item.dims);
    for (const auto& p : candidates_.points()) {
        for (int k = 0; k < kOrientationCount; ++k) {
            if (can_place(orients[static_cast<std::size_t>(k)], p)) {
                out.position = p;
                out.orientation = k;
                return true;
            }
        }
    }
    return false;
}

bool Packer::scan_layer(const Extents& e, double y, double step, Vec3& out) const {
    const double eps = opt_.eps;
    const std::int64_t nx = static_cast<std::int64_t>(std::floor((container_.width - e.dx + eps) / step)) + 1;
    const std::int64_t nz = static_cast<std::int64_t>(std::floor((container_.depth - e.dz + eps) / step)) + 1;
    if (nx <= 0 || nz <= 0) {
        return false;
    }
    const std::int64_t total = nx * nz;

    // Linear index ix * nz + iz follows the canonical x-then-z scan order, so the minimum
    // feasible index is the serial first hit regardless of how work is split.
    std::int64_t best = total;
#if defined(_OPENMP)
    const int threads = omp_threads(opt_.threads);
#pragma omp parallel for if (threads > 1 && total >= kParallelMinCells) num_threads(threads) \
    reduction(min : best) schedule(static)
    for (std::int64_t idx = 0; idx < total; ++idx) {
        if (idx >= best) {
            continue;
        }
        const Vec3 p{static_cast<double>(idx / nz) * step, y, static_cast<double>(idx % nz) * step};
        if (can_place(e, p)) {
            best = idx;
        }
    }
#else
    for (std::int64_t idx = 0; idx < total; ++idx) {
        const Vec3 p{static_cast<double>(idx / nz) * step, y, static_cast<double>(idx % nz) * step};
        if (can_place(e, p)) {
            best = idx;
            break;
        }
    }
#endif

    if (best >= total) {
        return false;
    }
    out = Vec3{static_cast<double>(best / nz) * step, y, static_cast<double>(best % nz) * step};
    return true;
}

bool Packer::find_fallback(const Item& item, Choice& out) const {
    const Orientations orients = item_orientations(item.dims);
    const double step = opt_.fallback_step;
    const auto time_start = std::chrono::steady_clock::now();

    for (int k = 0; k < kOrientationCount; ++k) {
        const Extents& e = orients[static_cast<std::size_t>(k)];
        if (!fits_container(e, container_, opt_.eps)) {
            continue;
        }
        const double y_max = container_.height - e.dy;
        for (std::int64_t iy = 0;; ++iy) {
            const double y = static_cast<double>(iy) * step;
            if (y > y_max + opt_.eps) {
                break;
            }
            if (opt_.fallback_time_limit_sec > 0.0) {
                const auto now = std::chrono::steady_clock::now();
                const double elapsed =
                    std::chrono::duration_cast<std::chrono::duration<double>>(now - time_start).count();
                if (elapsed >= opt_.fallback_time_limit_sec) {
                    if (opt_.log_every > 0) {
                        std::lock_guard<std::mutex> lk(log_mutex());
                        std::cerr << opt_.log_prefix << " fallback time limit hit for item " << item.id
                                  << " after " << elapsed << "s\n";
                    }
                    return false;
                }
            }
            Vec3 p;
            if (scan_layer(e, y, step, p)) {
                out.position = p;
                out.orientation = k;
                return true;
            }
        }
    }
    return false;
}

PackResult Packer::pack(const std::vector<Item>& items, const PackObserver& observer) {
    if (used_) {
        throw std::logic_error("Packer::pack: a Packer instance packs exactly one job");
    }
    used_ = true;
    validate_items(items);

    const std::vector<Item> ordered = order_items(items, opt_.volume_tolerance);

    PackResult out;
    out.placed.reserve(ordered.size());

    if (opt_.log_every > 0) {
        std::lock_guard<std::mutex> lk(log_mutex());
        std::cerr << opt_.log_prefix << " start items=" << ordered.size() << " container=" << container_.width << "x"
                  << container_.height << "x" << container_.depth << " gap=" << opt_.candidates.gap
                  << " step=" << opt_.fallback_step << "\n";
    }

    for (std::size_t i = 0; i < ordered.size(); ++i) {
        const Item& item = ordered[i];

        Choice choice;
        PlacementPhase phase = PlacementPhase::kGreedy;
        if (!find_greedy(item, choice)) {
            phase = PlacementPhase::kFallback;
            if (!find_fallback(item, choice)) {
                out.unplaced.push_back(item);
                if (opt_.log_every > 0) {
                    std::lock_guard<std::mutex> lk(log_mutex());
                    std::cerr << opt_.log_prefix << " unplaced item=" << item.id << " dims=" << item.dims.length
                              << "x" << item.dims.width << "x" << item.dims.height << "\n";
                }
                continue;
            }
        }

        PlacedItem placed;
        placed.item = item;
        placed.extents = item_orientations(item.dims)[static_cast<std::size_t>(choice.orientation)];
        placed.orientation = choice.orientation;
        placed.position = choice.position;
        placed.phase = phase;
        placed.stability = (std::abs(choice.position.y) <= opt_.eps) ? kFloorStability : kStackedStability;

        index_.insert(placed.box());
        out.used_volume += placed.extents.volume();
        candidates_.on_placed(placed.position, placed.extents, index_);
        out.placed.push_back(placed);

        if (observer) {
            observer(out.placed.back(), out.placed.size(), out.used_volume);
        }

        if (opt_.log_every > 0 && ((i + 1) % static_cast<std::size_t>(opt_.log_every)) == 0) {
            std::lock_guard<std::mutex> lk(log_mutex());
            std::cerr << opt_.log_prefix << " i=" << (i + 1) << "/" << ordered.size()
                      << " placed=" << out.placed.size() << " candidates=" << candidates_.size()
                      << " used_volume=" << out.used_volume << "\n";
        }
    }

    if (opt_.log_every > 0) {
        std::lock_guard<std::mutex> lk(log_mutex());
        std::cerr << opt_.log_prefix << " done placed=" << out.placed.size() << "/" << ordered.size()
                  << " used_volume=" << out.used_volume << "\n";
    }

    return out;
}

PackResult pack(
    const Container& container,
    const std::vector<Item>& items,
    const PackObserver& observer,
    const PackerOptions& opt
) {
    Packer packer(container, opt);
    return packer.pack(items, observer);
}

}  // namespace cargopack
