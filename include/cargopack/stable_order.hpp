#pragma once

#include <cstddef>
#include <utility>
#include <vector>

namespace cargopack {

// Stable insertion sort that never walks past the front of the range.
// Safe with tolerance-based comparators that are not strict weak orderings (std::sort is not).
// Near-sorted input costs O(n + inversions).
template <class T, class Less>
void stable_insertion_sort(std::vector<T>& v, Less less) {
    for (std::size_t i = 1; i < v.size(); ++i) {
        if (!less(v[i], v[i - 1])) {
            continue;
        }
        T tmp = std::move(v[i]);
        std::size_t j = i;
        while (j > 0 && less(tmp, v[j - 1])) {
            v[j] = std::move(v[j - 1]);
            --j;
        }
        v[j] = std::move(tmp);
    }
}

}  // namespace cargopack
