#include "cargopack/load_report.hpp"

#include <sstream>

namespace cargopack {

LoadReport load_report(const Container& container, std::size_t item_count, const PackResult& result) {
    LoadReport r;
    r.item_count = item_count;
    r.placed_count = result.placed.size();
    r.used_volume = result.used_volume;
    r.container_volume = container.volume();
    r.utilization_pct = (r.container_volume > 0.0) ? (r.used_volume / r.container_volume * 100.0) : 0.0;

    double stability_sum = 0.0;
    for (const auto& p : result.placed) {
        stability_sum += p.stability;
        r.total_weight += p.item.weight;
        if (p.phase == PlacementPhase::kFallback) {
            r.fallback_count++;
        } else {
            r.greedy_count++;
        }
    }
    r.avg_stability = result.placed.empty() ? 0.0 : stability_sum / static_cast<double>(result.placed.size());
    r.all_loaded = r.placed_count == r.item_count;
    return r;
}

std::string status_line(const LoadReport& report) {
    std::ostringstream oss;
    if (report.all_loaded) {
        oss << "All " << report.placed_count << " boxes loaded";
    } else {
        oss << report.placed_count << "/" << report.item_count << " loaded";
    }
    return oss.str();
}

}  // namespace cargopack
