#pragma once

#include <istream>
#include <ostream>
#include <vector>

#include "cargopack/cargo.hpp"

namespace cargopack {

// Columns: id,category,length,width,height,weight,fragile,color (header optional).
std::vector<Item> read_manifest_csv(std::istream& in);
void write_manifest_csv(std::ostream& out, const std::vector<Item>& items);

// Columns: seq,id,category,dx,dy,dz,weight,x,y,z,orientation,phase,stability.
void write_placements_csv(std::ostream& out, const std::vector<PlacedItem>& placed, int precision = 6);

}  // namespace cargopack
