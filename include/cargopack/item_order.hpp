#pragma once

#include <vector>

#include "cargopack/cargo.hpp"

namespace cargopack {

constexpr double kDefaultVolumeTolerance = 10.0;

// Processing-order comparator: non-fragile first, then larger volume (volumes within
// `volume_tolerance` are tied), then heavier.
bool item_precedes(const Item& a, const Item& b, double volume_tolerance = kDefaultVolumeTolerance);

// Returns `items` in packing order. Stable: items with equal keys keep their input order.
std::vector<Item> order_items(std::vector<Item> items, double volume_tolerance = kDefaultVolumeTolerance);

}  // namespace cargopack
