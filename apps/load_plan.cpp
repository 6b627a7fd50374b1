#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "cargopack/catalog.hpp"
#include "cargopack/cli_parse.hpp"
#include "cargopack/load_report.hpp"
#include "cargopack/manifest_csv.hpp"
#include "cargopack/pacing.hpp"
#include "cargopack/packer.hpp"

namespace {

struct Args {
    std::string truck = "medium";
    std::string container;
    std::string manifest;
    std::string counts;
    std::string out;
    std::uint64_t seed = 1;
    double gap = 0.5;
    double step = 2.0;
    bool diagonals = true;
    double volume_tol = cargopack::kDefaultVolumeTolerance;
    int threads = 0;
    double time_limit = 0.0;
    int log_every = 0;
    int pace_ms = 0;
    bool check_capacity = false;
};

void print_usage() {
    std::cout << "Usage: load_plan (--manifest items.csv | --counts type=N,...) [--truck small|medium|large|xl]\n"
              << "                 [--container W,H,D] [--seed N] [--gap g] [--step s] [--no-diagonals]\n"
              << "                 [--volume-tol v] [--threads N] [--time-limit sec] [--log-every N]\n"
              << "                 [--pace-ms N] [--check-capacity] [--out placements.csv]\n";
}

Args parse_args(int argc, char** argv) {
    using cargopack::parse_double;
    using cargopack::parse_int;
    using cargopack::require_arg;

    Args args;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--truck") {
            args.truck = require_arg(i, argc, argv, a);
        } else if (a == "--container") {
            args.container = require_arg(i, argc, argv, a);
        } else if (a == "--manifest") {
            args.manifest = require_arg(i, argc, argv, a);
        } else if (a == "--counts") {
            args.counts = require_arg(i, argc, argv, a);
        } else if (a == "--out") {
            args.out = require_arg(i, argc, argv, a);
        } else if (a == "--seed") {
            args.seed = cargopack::parse_u64(require_arg(i, argc, argv, a));
        } else if (a == "--gap") {
            args.gap = parse_double(require_arg(i, argc, argv, a));
        } else if (a == "--step") {
            args.step = parse_double(require_arg(i, argc, argv, a));
        } else if (a == "--no-diagonals") {
            args.diagonals = false;
        } else if (a == "--volume-tol") {
            args.volume_tol = parse_double(require_arg(i, argc, argv, a));
        } else if (a == "--threads") {
            args.threads = parse_int(require_arg(i, argc, argv, a));
        } else if (a == "--time-limit") {
            args.time_limit = parse_double(require_arg(i, argc, argv, a));
        } else if (a == "--log-every") {
            args.log_every = parse_int(require_arg(i, argc, argv, a));
        } else if (a == "--pace-ms") {
            args.pace_ms = parse_int(require_arg(i, argc, argv, a));
        } else if (a == "--check-capacity") {
            args.check_capacity = true;
        } else if (a == "-h" || a == "--help") {
            print_usage();
            std::exit(0);
        } else {
            throw std::runtime_error("unknown arg: " + a);
        }
    }
    if (args.manifest.empty() == args.counts.empty()) {
        throw std::runtime_error("exactly one of --manifest or --counts is required");
    }
    return args;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        const auto args = parse_args(argc, argv);

        const cargopack::Container container = args.container.empty()
                                                   ? cargopack::find_truck(args.truck).container
                                                   : cargopack::parse_container(args.container);

        std::vector<cargopack::Item> items;
        if (!args.manifest.empty()) {
            std::ifstream in(args.manifest);
            if (!in) {
                throw std::runtime_error("failed to open manifest: " + args.manifest);
            }
            items = cargopack::read_manifest_csv(in);
        } else {
            const auto counts = cargopack::parse_counts(args.counts);
            if (args.check_capacity) {
                const auto est = cargopack::estimate_capacity(counts, container);
                if (!est.fits) {
                    std::cerr << "error: too many boxes (estimated usage " << std::fixed << std::setprecision(0)
                              << est.usage_pct << "% of usable volume); reduce quantity or pick a larger truck\n";
                    return 2;
                }
            }
            items = cargopack::generate_items(counts, args.seed);
        }

        cargopack::PackerOptions opt;
        opt.candidates.gap = args.gap;
        opt.candidates.diagonal_candidates = args.diagonals;
        opt.fallback_step = args.step;
        opt.volume_tolerance = args.volume_tol;
        opt.threads = args.threads;
        opt.fallback_time_limit_sec = args.time_limit;
        opt.log_every = args.log_every;

        cargopack::PackObserver observer;
        if (args.pace_ms > 0) {
            observer = cargopack::paced_observer(
                [](const cargopack::PlacedItem& p, std::size_t count, double used_volume) {
                    std::cerr << "[load] #" << count << " id=" << p.item.id << " at (" << p.position.x << ","
                              << p.position.y << "," << p.position.z << ") used_volume=" << used_volume << "\n";
                },
                std::chrono::milliseconds(args.pace_ms));
        }

        const auto result = cargopack::pack(container, items, observer, opt);
        const auto report = cargopack::load_report(container, items.size(), result);

        if (!args.out.empty()) {
            std::ofstream out(args.out);
            if (!out) {
                throw std::runtime_error("failed to open output: " + args.out);
            }
            cargopack::write_placements_csv(out, result.placed);
        }

        std::cout << std::setprecision(17);
        std::cout << "{\n";
        std::cout << "  \"container\": {\"w\": " << container.width << ", \"h\": " << container.height
                  << ", \"d\": " << container.depth << "},\n";
        std::cout << "  \"items\": " << report.item_count << ",\n";
        std::cout << "  \"placed\": " << report.placed_count << ",\n";
        std::cout << "  \"greedy\": " << report.greedy_count << ",\n";
        std::cout << "  \"fallback\": " << report.fallback_count << ",\n";
        std::cout << "  \"used_volume\": " << report.used_volume << ",\n";
        std::cout << "  \"utilization_pct\": " << report.utilization_pct << ",\n";
        std::cout << "  \"avg_stability\": " << report.avg_stability << ",\n";
        std::cout << "  \"total_weight\": " << report.total_weight << ",\n";
        std::cout << "  \"status\": \"" << cargopack::status_line(report) << "\",\n";
        std::cout << "  \"unplaced\": [";
        for (std::size_t i = 0; i < result.unplaced.size(); ++i) {
            std::cout << (i ? ", " : "") << result.unplaced[i].id;
        }
        std::cout << "]\n";
        std::cout << "}\n";

        return report.all_loaded ? 0 : 3;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
