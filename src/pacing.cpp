#include "cargopack/pacing.hpp"

#include <thread>
#include <utility>

namespace cargopack {

PackObserver paced_observer(PackObserver inner, std::chrono::milliseconds delay) {
    if (delay.count() <= 0) {
        return inner;
    }
    return [inner = std::move(inner), delay](const PlacedItem& placed, std::size_t placed_count, double used_volume) {
        if (inner) {
            inner(placed, placed_count, used_volume);
        }
        std::this_thread::sleep_for(delay);
    };
}

}  // namespace cargopack
