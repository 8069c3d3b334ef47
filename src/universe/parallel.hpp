#pragma once
/**
 * @file  parallel.hpp
 * @brief Block-partitioned parallel loop over an index range.
 *
 * `[0, n)` is cut into at most `workers` contiguous blocks and `fn(begin,
 * end)` runs once per block on its own thread. The call returns after every
 * block has finished. With one worker (or one item) `fn` runs inline.
 */

#include <algorithm>
#include <cstddef>
#include <thread>
#include <vector>

namespace relsim::detail {

[[nodiscard]] inline unsigned resolve_worker_count(unsigned requested) noexcept {
    if (requested != 0) return requested;
    const unsigned hc = std::thread::hardware_concurrency();
    return hc == 0 ? 1u : hc;
}

template <typename Fn>
void parallel_for(std::size_t n, unsigned workers, Fn&& fn) {
    if (n == 0) return;
    if (workers <= 1 || n == 1) {
        fn(std::size_t{0}, n);
        return;
    }

    const std::size_t blocks = std::min<std::size_t>(workers, n);
    const std::size_t block  = (n + blocks - 1) / blocks;

    std::vector<std::thread> threads;
    threads.reserve(blocks);
    for (std::size_t begin = 0; begin < n; begin += block) {
        const std::size_t end = std::min(n, begin + block);
        threads.emplace_back([&fn, begin, end] { fn(begin, end); });
    }
    for (auto& t : threads) t.join();
}

} // namespace relsim::detail
