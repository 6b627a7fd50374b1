#include "cargopack/item_order.hpp"

#include <cmath>
#include <utility>

#include "cargopack/stable_order.hpp"

namespace cargopack {

bool item_precedes(const Item& a, const Item& b, double volume_tolerance) {
    if (a.fragile != b.fragile) {
        return !a.fragile;
    }
    const double va = a.dims.volume();
    const double vb = b.dims.volume();
    if (std::abs(va - vb) > volume_tolerance) {
        return va > vb;
    }
    return a.weight > b.weight;
}

std::vector<Item> order_items(std::vector<Item> items, double volume_tolerance) {
    stable_insertion_sort(items, [volume_tolerance](const Item& a, const Item& b) {
        return item_precedes(a, b, volume_tolerance);
    });
    return items;
}

}  // namespace cargopack
