#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include "cargopack/catalog.hpp"
#include "cargopack/cli_parse.hpp"
#include "cargopack/geometry.hpp"
#include "cargopack/packer.hpp"

namespace {

struct Args {
    std::uint64_t seed = 0;
    int samples = 10;
    int max_per_type = 8;
    double eps = 1e-9;
};

Args parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--seed") {
            args.seed = cargopack::parse_u64(cargopack::require_arg(i, argc, argv, a));
        } else if (a == "--samples") {
            args.samples = cargopack::parse_int(cargopack::require_arg(i, argc, argv, a));
        } else if (a == "--max-per-type") {
            args.max_per_type = cargopack::parse_int(cargopack::require_arg(i, argc, argv, a));
        } else if (a == "--eps") {
            args.eps = cargopack::parse_double(cargopack::require_arg(i, argc, argv, a));
        } else if (a == "-h" || a == "--help") {
            std::cout << "Usage: pack_sanity [--seed N] [--samples N] [--max-per-type N] [--eps E]\n";
            std::exit(0);
        } else {
            throw std::runtime_error("unknown arg: " + a);
        }
    }
    return args;
}

// Brute-force check of the packing invariants; returns an empty string when they hold.
std::string check_result(const cargopack::Container& c, const cargopack::PackResult& r, std::size_t n_items, double eps) {
    if (r.placed.size() + r.unplaced.size() != n_items) {
        return "placed + unplaced != items";
    }
    double vol = 0.0;
    for (std::size_t i = 0; i < r.placed.size(); ++i) {
        const cargopack::Box3 a = r.placed[i].box();
        if (a.min.x < -eps || a.min.y < -eps || a.min.z < -eps || a.max.x > c.width + eps ||
            a.max.y > c.height + eps || a.max.z > c.depth + eps) {
            return "item " + std::to_string(r.placed[i].item.id) + " out of bounds";
        }
        for (std::size_t j = i + 1; j < r.placed.size(); ++j) {
            if (cargopack::boxes_overlap_strict(a, r.placed[j].box(), eps)) {
                return "items " + std::to_string(r.placed[i].item.id) + " and " +
                       std::to_string(r.placed[j].item.id) + " overlap";
            }
        }
        vol += r.placed[i].extents.volume();
    }
    if (std::abs(vol - r.used_volume) > 1e-6 * std::max(1.0, vol)) {
        return "used_volume mismatch";
    }
    return {};
}

}  // namespace

int main(int argc, char** argv) {
    try {
        const auto args = parse_args(argc, argv);

        std::mt19937_64 rng(args.seed);
        std::uniform_int_distribution<int> count_dist(0, std::max(0, args.max_per_type));

        for (const auto& truck : cargopack::trucks()) {
            std::size_t placed_total = 0;
            std::size_t items_total = 0;
            for (int s = 0; s < args.samples; ++s) {
                cargopack::TypeCounts counts;
                for (const auto& type : cargopack::box_types()) {
                    counts[type.key] = count_dist(rng);
                }
                const auto items = cargopack::generate_items(counts, rng());
                const auto result = cargopack::pack(truck.container, items);

                const std::string err = check_result(truck.container, result, items.size(), args.eps);
                if (!err.empty()) {
                    std::cerr << "[FAIL] truck=" << truck.key << " sample=" << s << ": " << err << "\n";
                    return 1;
                }
                placed_total += result.placed.size();
                items_total += items.size();
            }
            std::cout << "[OK] truck=" << truck.key << " samples=" << args.samples << " placed=" << placed_total
                      << "/" << items_total << "\n";
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
