#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "cargopack/geometry.hpp"

namespace cargopack {

struct Dimensions {
    double length = 0.0;
    double width = 0.0;
    double height = 0.0;

    double volume() const { return length * width * height; }
};

struct Item {
    int id = 0;
    Dimensions dims;
    double weight = 0.0;
    bool fragile = false;

    // Carried through unchanged.
    std::string category;
    std::string color;
};

// Container extents: width along x, height along y (stacking axis), depth along z.
struct Container {
    double width = 0.0;
    double height = 0.0;
    double depth = 0.0;

    double volume() const { return width * height * depth; }
};

enum class PlacementPhase {
    kGreedy = 0,
    kFallback = 1,
};

constexpr double kFloorStability = 1.0;
constexpr double kStackedStability = 0.85;

struct PlacedItem {
    Item item;
    Extents extents;
    int orientation = 0;
    Vec3 position;
    PlacementPhase phase = PlacementPhase::kGreedy;
    double stability = kFloorStability;

    Box3 box() const { return box_at(position, extents); }
};

class InvalidContainer : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

class InvalidItem : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Throws InvalidContainer unless every extent is finite and > 0.
void validate_container(const Container& c);

// Throws InvalidItem on the first item with a non-positive extent, a negative weight or a non-finite value.
void validate_items(const std::vector<Item>& items);

const char* phase_name(PlacementPhase phase);

}  // namespace cargopack
