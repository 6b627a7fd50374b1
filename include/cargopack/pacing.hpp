#pragma once

#include <chrono>

#include "cargopack/packer.hpp"

namespace cargopack {

// Wraps `inner` so each notification is followed by a `delay` sleep (staggered delivery for animated viewers).
// A zero delay returns `inner` unchanged.
PackObserver paced_observer(PackObserver inner, std::chrono::milliseconds delay);

}  // namespace cargopack
