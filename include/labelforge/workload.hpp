#pragma once
#include <vector>
#include <cstddef>
#include <algorithm>
#include <stdexcept>

namespace lf {

// Contiguous shards of ceil(N/M) items; shards past the end come back empty
// so every rank in [0, M) has an entry.
template<typename T>
std::vector<std::vector<T>> partition_list(const std::vector<T>& items, int m) {
    if (m < 1) throw std::invalid_argument("partition_list: worker count must be >= 1");
    const size_t n = items.size();
    const size_t chunk = (n + size_t(m) - 1) / size_t(m);
    std::vector<std::vector<T>> shards((size_t(m)));
    for (size_t r=0; r<shards.size(); ++r) {
        size_t b = std::min(n, r*chunk), e = std::min(n, b + chunk);
        shards[r].assign(items.begin() + b, items.begin() + e);
    }
    return shards;
}

} // namespace lf
