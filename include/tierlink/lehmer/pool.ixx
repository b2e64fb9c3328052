module;

#include <bit>
#include <cstddef>
#include <cstdint>
#include <vector>

export module tierlink.lehmer.pool;

// ──────────────────────────────────────────────────────────────────────────────
// lehmer.pool: the "not yet placed" set of {0..n-1} as a Fenwick tree over
// presence bits: rank-of-element, select k-th element and erase are O(log n).
// ──────────────────────────────────────────────────────────────────────────────

export namespace tierlink::lehmer {

class OrderStatisticPool {
public:
    explicit OrderStatisticPool(std::size_t n)
        : tree_(n + 1, 0), present_(n, 1), universe_(n), remaining_(n),
          top_step_(n ? std::bit_floor(n) : 0) {
        // Linear build of a tree whose leaves are all 1.
        for (std::size_t i = 1; i <= n; ++i) {
            tree_[i] += 1;
            const std::size_t parent = i + lowbit(i);
            if (parent <= n) tree_[parent] += tree_[i];
        }
    }

    [[nodiscard]] std::size_t universe() const noexcept { return universe_; }
    [[nodiscard]] std::size_t size() const noexcept { return remaining_; }
    [[nodiscard]] bool empty() const noexcept { return remaining_ == 0; }

    [[nodiscard]] bool contains(std::size_t v) const noexcept {
        return v < universe_ && present_[v] != 0;
    }

    // Number of elements still in the pool that are smaller than v.
    [[nodiscard]] std::size_t count_less(std::size_t v) const noexcept {
        std::size_t sum = 0;
        for (std::size_t i = (v < universe_ ? v : universe_); i > 0; i -= lowbit(i)) sum += tree_[i];
        return sum;
    }

    // k-th smallest remaining element (0-based). Requires k < size().
    [[nodiscard]] std::size_t select(std::size_t k) const noexcept {
        std::size_t pos = 0;
        std::size_t target = k + 1;
        for (std::size_t step = top_step_; step != 0; step >>= 1) {
            const std::size_t next = pos + step;
            if (next <= universe_ && tree_[next] < target) {
                pos = next;
                target -= tree_[next];
            }
        }
        return pos; // 1-based slot pos+1 holds element pos
    }

    // Removes v; returns false if it was not present.
    bool erase(std::size_t v) noexcept {
        if (!contains(v)) return false;
        present_[v] = 0;
        for (std::size_t i = v + 1; i <= universe_; i += lowbit(i)) tree_[i] -= 1;
        --remaining_;
        return true;
    }

private:
    static constexpr std::size_t lowbit(std::size_t i) noexcept { return i & (~i + 1); }

    std::vector<std::uint32_t> tree_;     // 1-based partial sums
    std::vector<std::uint8_t>  present_;
    std::size_t universe_{0};
    std::size_t remaining_{0};
    std::size_t top_step_{0};
};

} // namespace tierlink::lehmer
