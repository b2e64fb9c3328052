module;

#include <algorithm>
#include <bit>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

export module tierlink.biguint;

import tierlink.types; // Byte, Bytes, BytesView

// ──────────────────────────────────────────────────────────────────────────────
// biguint: exact unbounded non-negative integer for permutation ranks
//   • 32-bit limbs, little-endian limb order, 64-bit intermediates
//   • Only the operations ranking needs: x*m + a, divmod by a small divisor
//   • Minimal big-endian byte serialization (zero → single 0x00)
// ──────────────────────────────────────────────────────────────────────────────

export namespace tierlink {

class BigUint {
public:
    using Limb = std::uint32_t;

    BigUint() = default;

    explicit BigUint(std::uint64_t v) {
        while (v != 0) {
            limbs_.push_back(static_cast<Limb>(v));
            v >>= 32;
        }
    }

    [[nodiscard]] bool is_zero() const noexcept { return limbs_.empty(); }
    [[nodiscard]] std::size_t limb_count() const noexcept { return limbs_.size(); }

    [[nodiscard]] std::size_t bit_length() const noexcept {
        if (limbs_.empty()) return 0;
        return (limbs_.size() - 1) * 32 + static_cast<std::size_t>(std::bit_width(limbs_.back()));
    }

    // Value as u64 when it fits.
    [[nodiscard]] std::optional<std::uint64_t> to_u64() const noexcept {
        if (limbs_.size() > 2) return std::nullopt;
        std::uint64_t v = 0;
        for (std::size_t i = limbs_.size(); i-- > 0;) v = (v << 32) | limbs_[i];
        return v;
    }

    // *this = *this * mul + add
    void mul_add_small(Limb mul, Limb add) {
        std::uint64_t carry = add;
        for (auto& limb : limbs_) {
            const std::uint64_t t = std::uint64_t(limb) * mul + carry;
            limb  = static_cast<Limb>(t);
            carry = t >> 32;
        }
        if (carry != 0) limbs_.push_back(static_cast<Limb>(carry));
        trim();
    }

    // *this = *this / divisor; returns *this % divisor.
    Limb divmod_small(Limb divisor) {
        if (divisor == 0) throw std::domain_error("BigUint::divmod_small: division by zero");
        std::uint64_t rem = 0;
        for (std::size_t i = limbs_.size(); i-- > 0;) {
            const std::uint64_t cur = (rem << 32) | limbs_[i];
            limbs_[i] = static_cast<Limb>(cur / divisor);
            rem = cur % divisor;
        }
        trim();
        return static_cast<Limb>(rem);
    }

    // ---------------------------------------------------------------------------
    // Byte serialization (big-endian)
    // ---------------------------------------------------------------------------
    [[nodiscard]] Bytes to_bytes_be() const {
        if (limbs_.empty()) return Bytes{0};
        Bytes out;
        out.reserve(limbs_.size() * 4);
        const Limb top = limbs_.back();
        int shift = 24;
        while (shift > 0 && ((top >> shift) & 0xFF) == 0) shift -= 8;
        for (; shift >= 0; shift -= 8) out.push_back(static_cast<Byte>((top >> shift) & 0xFF));
        for (std::size_t i = limbs_.size() - 1; i-- > 0;) {
            const Limb l = limbs_[i];
            out.push_back(static_cast<Byte>(l >> 24));
            out.push_back(static_cast<Byte>(l >> 16));
            out.push_back(static_cast<Byte>(l >> 8));
            out.push_back(static_cast<Byte>(l));
        }
        return out;
    }

    // Any length, including empty (→ 0) and leading zero bytes.
    [[nodiscard]] static BigUint from_bytes_be(BytesView src) {
        BigUint r;
        r.limbs_.assign((src.size() + 3) / 4, 0);
        for (std::size_t i = 0; i < src.size(); ++i) {
            const Byte b = src[src.size() - 1 - i];
            r.limbs_[i / 4] |= Limb(b) << (8 * (i % 4));
        }
        r.trim();
        return r;
    }

    [[nodiscard]] std::string to_decimal_string() const {
        if (limbs_.empty()) return "0";
        constexpr Limb CHUNK = 1'000'000'000u;
        BigUint tmp = *this;
        std::vector<Limb> chunks;
        while (!tmp.is_zero()) chunks.push_back(tmp.divmod_small(CHUNK));
        std::string out = std::to_string(chunks.back());
        for (std::size_t i = chunks.size() - 1; i-- > 0;) {
            std::string part = std::to_string(chunks[i]);
            out.append(9 - part.size(), '0').append(part);
        }
        return out;
    }

    // ---------------------------------------------------------------------------
    // Comparison
    // ---------------------------------------------------------------------------
    friend bool operator==(const BigUint&, const BigUint&) = default;

    friend std::strong_ordering operator<=>(const BigUint& a, const BigUint& b) noexcept {
        if (a.limbs_.size() != b.limbs_.size()) return a.limbs_.size() <=> b.limbs_.size();
        for (std::size_t i = a.limbs_.size(); i-- > 0;) {
            if (a.limbs_[i] != b.limbs_[i]) return a.limbs_[i] <=> b.limbs_[i];
        }
        return std::strong_ordering::equal;
    }

private:
    void trim() noexcept {
        while (!limbs_.empty() && limbs_.back() == 0) limbs_.pop_back();
    }

    std::vector<Limb> limbs_; // normalized: no high zero limbs; zero is empty
};

} // namespace tierlink
