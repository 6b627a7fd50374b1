#pragma once

#include <mutex>

namespace cargopack {

// Global mutex to keep stderr logs from concurrent jobs readable (one line at a time).
inline std::mutex& log_mutex() {
    static std::mutex mu;
    return mu;
}

}  // namespace cargopack
