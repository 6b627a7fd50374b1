#include "cargopack/cargo.hpp"

#include <cmath>
#include <string>

namespace cargopack {
namespace {

bool positive_finite(double v) {
    return std::isfinite(v) && v > 0.0;
}

std::string item_label(const Item& item) {
    return "item " + std::to_string(item.id);
}

}  // namespace

void validate_container(const Container& c) {
    if (!positive_finite(c.width) || !positive_finite(c.height) || !positive_finite(c.depth)) {
        throw InvalidContainer("validate_container: container extents must be finite and > 0");
    }
}

void validate_items(const std::vector<Item>& items) {
    for (const auto& item : items) {
        if (!positive_finite(item.dims.length) || !positive_finite(item.dims.width) ||
            !positive_finite(item.dims.height)) {
            throw InvalidItem("validate_items: " + item_label(item) + " has a non-positive extent");
        }
        if (!std::isfinite(item.weight) || item.weight < 0.0) {
            throw InvalidItem("validate_items: " + item_label(item) + " has a negative weight");
        }
    }
}

const char* phase_name(PlacementPhase phase) {
    switch (phase) {
        case PlacementPhase::kGreedy:
            return "greedy";
        case PlacementPhase::kFallback:
            return "fallback";
    }
    return "unknown";
}

}  // namespace cargopack
