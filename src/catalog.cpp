#include "cargopack/catalog.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>

namespace cargopack {
namespace {

std::vector<BoxType> make_box_types() {
    std::vector<BoxType> out;

    BoxType electronics;
    electronics.key = "electronics";
    electronics.name = "Electronics";
    electronics.code = 0;
    electronics.color = "#a855f7";
    electronics.length = Range{12, 18, 15};
    electronics.width = Range{10, 15, 12};
    electronics.height = Range{8, 12, 10};
    electronics.weight = Range{2, 8, 5};
    electronics.fragile = true;
    out.push_back(electronics);

    BoxType standard;
    standard.key = "standard";
    standard.name = "Standard Parcel";
    standard.code = 1;
    standard.color = "#22c55e";
    standard.length = Range{20, 30, 25};
    standard.width = Range{15, 25, 20};
    standard.height = Range{12, 18, 15};
    standard.weight = Range{5, 20, 12.5};
    out.push_back(standard);

    BoxType appliance;
    appliance.key = "appliance";
    appliance.name = "Appliance";
    appliance.code = 2;
    appliance.color = "#3b82f6";
    appliance.length = Range{35, 45, 40};
    appliance.width = Range{30, 40, 35};
    appliance.height = Range{40, 50, 45};
    appliance.weight = Range{15, 40, 27.5};
    out.push_back(appliance);

    BoxType furniture;
    furniture.key = "furniture";
    furniture.name = "Furniture";
    furniture.code = 3;
    furniture.color = "#f59e0b";
    furniture.length = Range{50, 60, 55};
    furniture.width = Range{20, 30, 25};
    furniture.height = Range{15, 22, 18};
    furniture.weight = Range{10, 30, 20};
    out.push_back(furniture);

    BoxType industrial;
    industrial.key = "industrial";
    industrial.name = "Industrial";
    industrial.code = 4;
    industrial.color = "#ef4444";
    industrial.length = Range{25, 35, 30};
    industrial.width = Range{25, 35, 30};
    industrial.height = Range{20, 30, 25};
    industrial.weight = Range{50, 100, 75};
    out.push_back(industrial);

    return out;
}

std::vector<TruckSpec> make_trucks() {
    return {
        TruckSpec{"small", "Small Van", Container{60, 50, 40}},
        TruckSpec{"medium", "Medium Truck", Container{100, 70, 55}},
        TruckSpec{"large", "Large Semi", Container{140, 85, 65}},
        TruckSpec{"xl", "XL Container", Container{180, 100, 80}},
    };
}

double draw(std::mt19937_64& rng, const Range& r) {
    std::uniform_real_distribution<double> uni(r.min, r.max);
    return uni(rng);
}

}  // namespace

const std::vector<BoxType>& box_types() {
    static const std::vector<BoxType> types = make_box_types();
    return types;
}

const std::vector<TruckSpec>& trucks() {
    static const std::vector<TruckSpec> all = make_trucks();
    return all;
}

const BoxType& find_box_type(const std::string& key) {
    for (const auto& t : box_types()) {
        if (t.key == key) {
            return t;
        }
    }
    throw std::invalid_argument("find_box_type: unknown box type: " + key);
}

const TruckSpec& find_truck(const std::string& key) {
    for (const auto& t : trucks()) {
        if (t.key == key) {
            return t;
        }
    }
    throw std::invalid_argument("find_truck: unknown truck: " + key);
}

std::vector<Item> generate_items(const TypeCounts& counts, std::uint64_t seed) {
    for (const auto& kv : counts) {
        find_box_type(kv.first);
        if (kv.second < 0) {
            throw std::invalid_argument("generate_items: negative count for " + kv.first);
        }
    }

    std::mt19937_64 rng(seed);
    std::vector<Item> out;
    int id = 0;
    for (const auto& type : box_types()) {
        auto it = counts.find(type.key);
        if (it == counts.end()) {
            continue;
        }
        for (int i = 0; i < it->second; ++i) {
            Item item;
            item.id = id++;
            item.category = type.key;
            item.color = type.color;
            item.fragile = type.fragile;
            item.dims.length = std::round(draw(rng, type.length));
            item.dims.width = std::round(draw(rng, type.width));
            item.dims.height = std::round(draw(rng, type.height));
            item.weight = draw(rng, type.weight);
            out.push_back(item);
        }
    }
    return out;
}

TypeCounts max_counts(const Container& container) {
    validate_container(container);
    const double usable = container.volume() * kPackingEfficiency;

    TypeCounts out;
    for (const auto& type : box_types()) {
        const double by_volume = std::floor(usable / type.avg_volume());
        const double by_layer = std::floor(container.width / type.length.min) *
                                std::floor(container.depth / type.width.min) *
                                std::floor(container.height / type.height.min);
        const double n = std::min(by_volume, by_layer);
        out[type.key] = static_cast<int>(std::clamp(n, 1.0, static_cast<double>(kMaxCountPerType)));
    }
    return out;
}

CapacityEstimate estimate_capacity(const TypeCounts& counts, const Container& container) {
    validate_container(container);

    CapacityEstimate est;
    for (const auto& kv : counts) {
        est.total_volume += find_box_type(kv.first).avg_volume() * static_cast<double>(kv.second);
    }
    est.usable_volume = container.volume() * kPackingEfficiency;
    est.usage_pct = est.total_volume / est.usable_volume * 100.0;
    est.fits = est.total_volume <= est.usable_volume;
    return est;
}

}  // namespace cargopack
