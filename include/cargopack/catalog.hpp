#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "cargopack/cargo.hpp"

namespace cargopack {

struct Range {
    double min = 0.0;
    double max = 0.0;
    double avg = 0.0;
};

struct BoxType {
    std::string key;
    std::string name;
    int code = 0;
    std::string color;
    Range length;
    Range width;
    Range height;
    Range weight;
    bool fragile = false;

    double avg_volume() const { return length.avg * width.avg * height.avg; }
};

struct TruckSpec {
    std::string key;
    std::string name;
    Container container;
};

// Fraction of a container's volume assumed reachable by a heuristic load.
constexpr double kPackingEfficiency = 0.55;
constexpr int kMaxCountPerType = 50;

const std::vector<BoxType>& box_types();
const std::vector<TruckSpec>& trucks();

// Lookups by key; throw std::invalid_argument for unknown keys.
const BoxType& find_box_type(const std::string& key);
const TruckSpec& find_truck(const std::string& key);

using TypeCounts = std::map<std::string, int>;

// Random manifest: per type (catalog order), `count` items with integer dimensions and real weights.
// Ids are sequential from 0. Same seed, same manifest.
std::vector<Item> generate_items(const TypeCounts& counts, std::uint64_t seed);

// Per-type upper bound on item counts offered for `container`.
TypeCounts max_counts(const Container& container);

struct CapacityEstimate {
    double total_volume = 0.0;
    double usable_volume = 0.0;
    double usage_pct = 0.0;
    bool fits = true;
};

// Average-volume estimate of whether `counts` can fit into `container`.
CapacityEstimate estimate_capacity(const TypeCounts& counts, const Container& container);

}  // namespace cargopack
