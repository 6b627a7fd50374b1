#pragma once

#include <cstddef>
#include <string>

#include "cargopack/cargo.hpp"
#include "cargopack/packer.hpp"

namespace cargopack {

struct LoadReport {
    std::size_t item_count = 0;
    std::size_t placed_count = 0;
    std::size_t greedy_count = 0;
    std::size_t fallback_count = 0;
    double used_volume = 0.0;
    double container_volume = 0.0;
    double utilization_pct = 0.0;
    double avg_stability = 0.0;
    double total_weight = 0.0;
    bool all_loaded = true;
};

LoadReport load_report(const Container& container, std::size_t item_count, const PackResult& result);

// "All N boxes loaded" or "P/N loaded".
std::string status_line(const LoadReport& report);

}  // namespace cargopack
