module;

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

export module tierlink.lehmer;

import tierlink.types;        // Index, Permutation, Digits, ErrorCode
import tierlink.errors;       // CodecError, ResultEx, Ok/Err
import tierlink.config;       // constants::MAX_ITEMS
import tierlink.biguint;      // BigUint
import tierlink.lehmer.pool;  // OrderStatisticPool

// ──────────────────────────────────────────────────────────────────────────────
// lehmer: permutation ↔ Lehmer digits ↔ factorial-base rank
//
//   digit[i] = #{ unused elements smaller than perm[i] },  digit[i] ∈ [0, n-1-i]
//   rank     = Σ digit[i] · (n-1-i)!                        rank ∈ [0, n!)
// ──────────────────────────────────────────────────────────────────────────────

namespace tierlink::lehmer::detail {

inline constexpr const char* COMPONENT = "lehmer";
inline constexpr std::uint64_t LIMB_MAX = 0xFFFFFFFFu;

inline bool item_count_ok(std::size_t n) noexcept {
    return n >= 1 && n <= constants::MAX_ITEMS;
}

} // namespace tierlink::lehmer::detail

export namespace tierlink::lehmer {

// Checks that perm holds each of 0..n-1 exactly once, 1 <= n <= MAX_ITEMS.
[[nodiscard]] inline std::optional<CodecError> validate_permutation(std::span<const Index> perm) {
    const std::size_t n = perm.size();
    if (n == 0) {
        return make_validation_error(ErrorCode::INVALID_ITEM_COUNT,
            "Permutation cannot be empty", detail::COMPONENT, "validate_permutation");
    }
    if (n > constants::MAX_ITEMS) {
        return make_validation_error(ErrorCode::INVALID_ITEM_COUNT,
            "N too large for this header encoding (max 65535), got " + std::to_string(n),
            detail::COMPONENT, "validate_permutation");
    }
    std::vector<std::uint8_t> seen(n, 0);
    for (const Index v : perm) {
        if (v < 0 || static_cast<std::size_t>(v) >= n) {
            return make_validation_error(ErrorCode::INVALID_PERMUTATION,
                "Invalid element in permutation: " + std::to_string(v),
                detail::COMPONENT, "validate_permutation");
        }
        if (seen[static_cast<std::size_t>(v)]) {
            return make_validation_error(ErrorCode::INVALID_PERMUTATION,
                "Duplicate element in permutation: " + std::to_string(v),
                detail::COMPONENT, "validate_permutation");
        }
        seen[static_cast<std::size_t>(v)] = 1;
    }
    return std::nullopt;
}

[[nodiscard]] inline ResultEx<Digits> digits_from_permutation(std::span<const Index> perm) {
    if (auto err = validate_permutation(perm)) return Err<Digits>(std::move(*err));

    const std::size_t n = perm.size();
    OrderStatisticPool pool(n);
    Digits digits(n);
    for (std::size_t i = 0; i < n; ++i) {
        const auto p = static_cast<std::size_t>(perm[i]);
        digits[i] = static_cast<std::uint32_t>(pool.count_less(p));
        pool.erase(p);
    }
    return Ok(std::move(digits));
}

// Horner form of Σ digit[i]·(n-1-i)!: rank = rank·(n-i) + digit[i]. Consecutive
// radices are folded into one multiplier while the product fits a limb, so the
// big-integer pass runs once per group instead of once per digit.
[[nodiscard]] inline ResultEx<BigUint> rank_from_digits(std::span<const std::uint32_t> digits) {
    const std::size_t n = digits.size();
    if (n > constants::MAX_ITEMS) {
        return Err<BigUint>(make_validation_error(ErrorCode::INVALID_ITEM_COUNT,
            "Too many digits: " + std::to_string(n), detail::COMPONENT, "rank_from_digits"));
    }
    BigUint rank;
    std::uint64_t mul = 1;   // product of the radices in the pending group
    std::uint64_t acc = 0;   // group value, always < mul
    for (std::size_t i = 0; i < n; ++i) {
        const std::size_t radix = n - i;
        if (digits[i] >= radix) {
            return Err<BigUint>(make_format_error(ErrorCode::INVALID_DIGITS,
                "Digit " + std::to_string(digits[i]) + " at position " + std::to_string(i) +
                " exceeds radix " + std::to_string(radix),
                detail::COMPONENT, "rank_from_digits"));
        }
        if (mul * radix > detail::LIMB_MAX) {
            rank.mul_add_small(static_cast<BigUint::Limb>(mul), static_cast<BigUint::Limb>(acc));
            mul = 1;
            acc = 0;
        }
        mul *= radix;
        acc = acc * radix + digits[i];
    }
    rank.mul_add_small(static_cast<BigUint::Limb>(mul), static_cast<BigUint::Limb>(acc));
    return Ok(std::move(rank));
}

[[nodiscard]] inline ResultEx<Digits> digits_from_rank(const BigUint& rank, std::size_t n) {
    if (!detail::item_count_ok(n)) {
        return Err<Digits>(make_validation_error(ErrorCode::INVALID_ITEM_COUNT,
            "N must be an integer in [1, 65535], got " + std::to_string(n),
            detail::COMPONENT, "digits_from_rank"));
    }
    // digit[n-i] = x mod i, x /= i for i = 1..n. A run of radices i..j-1 whose
    // product fits a limb is peeled with one big division, then split up in
    // 64-bit arithmetic.
    Digits digits(n);
    BigUint x = rank;
    for (std::size_t i = 1; i <= n;) {
        std::uint64_t group = 1;
        std::size_t j = i;
        while (j <= n && group * j <= detail::LIMB_MAX) group *= j++;

        std::uint64_t r = x.divmod_small(static_cast<BigUint::Limb>(group));
        for (std::size_t k = i; k < j; ++k) {
            digits[n - k] = static_cast<std::uint32_t>(r % k);
            r /= k;
        }
        i = j;
    }
    if (!x.is_zero()) {
        return Err<Digits>(make_format_error(ErrorCode::RANK_OUT_OF_RANGE,
            "Rank out of range for N=" + std::to_string(n),
            detail::COMPONENT, "digits_from_rank"));
    }
    return Ok(std::move(digits));
}

[[nodiscard]] inline ResultEx<Permutation> permutation_from_digits(std::span<const std::uint32_t> digits) {
    const std::size_t n = digits.size();
    if (!detail::item_count_ok(n)) {
        return Err<Permutation>(make_validation_error(ErrorCode::INVALID_ITEM_COUNT,
            "N must be an integer in [1, 65535], got " + std::to_string(n),
            detail::COMPONENT, "permutation_from_digits"));
    }
    OrderStatisticPool pool(n);
    Permutation perm(n);
    for (std::size_t i = 0; i < n; ++i) {
        if (digits[i] >= pool.size()) {
            return Err<Permutation>(make_format_error(ErrorCode::INVALID_DIGITS,
                "Digit " + std::to_string(digits[i]) + " at position " + std::to_string(i) +
                " exceeds remaining pool of " + std::to_string(pool.size()),
                detail::COMPONENT, "permutation_from_digits"));
        }
        const std::size_t v = pool.select(digits[i]);
        pool.erase(v);
        perm[i] = static_cast<Index>(v);
    }
    return Ok(std::move(perm));
}

// ---------------------------------------------------------------------------
// Convenience: whole pipeline in one call
// ---------------------------------------------------------------------------
[[nodiscard]] inline ResultEx<BigUint> rank_permutation(std::span<const Index> perm) {
    auto digits = digits_from_permutation(perm);
    if (!digits) return Err<BigUint>(std::move(digits).error());
    return rank_from_digits(*digits);
}

[[nodiscard]] inline ResultEx<Permutation> unrank_permutation(const BigUint& rank, std::size_t n) {
    auto digits = digits_from_rank(rank, n);
    if (!digits) return Err<Permutation>(std::move(digits).error());
    return permutation_from_digits(*digits);
}

[[nodiscard]] inline BigUint factorial(std::uint32_t n) {
    BigUint f(1);
    for (std::uint32_t i = 2; i <= n; ++i) f.mul_add_small(i, 0);
    return f;
}

} // namespace tierlink::lehmer
