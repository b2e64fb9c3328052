module; // ===== Global Module Fragment =====
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

export module tierlink.codec;

import tierlink.types;      // TierState, DecodedPermutation, ErrorCode
import tierlink.errors;     // CodecError, ResultEx
import tierlink.config;     // CodecConfig, FORMAT_VERSION, constants
import tierlink.bytes;      // u16 big-endian
import tierlink.biguint;    // BigUint
import tierlink.base64url;  // b64url::encode/decode
import tierlink.lehmer;     // rank / unrank

// ──────────────────────────────────────────────────────────────────────────────
// codec: three ordered tiers over N items ↔ URL-fragment text
//
//   bytes    = [ver:u8][k1:u16 BE][k2:u16 BE][rank: minimal BE, >= 1 byte]
//   fragment = [marker] base64url(bytes), no padding
//
// N is never stored; both ends must agree on it.
// ──────────────────────────────────────────────────────────────────────────────

namespace tierlink::codec::detail {

inline constexpr const char* COMPONENT = "codec";

enum class Tier : std::uint8_t { NONE, VERY, SOMEWHAT, NOT };

inline constexpr const char* tier_name(Tier t) noexcept {
    switch (t) {
        case Tier::VERY:     return "very";
        case Tier::SOMEWHAT: return "somewhat";
        case Tier::NOT:      return "not";
        case Tier::NONE:     break;
    }
    return "none";
}

inline std::optional<CodecError> check_item_count(std::size_t n, std::size_t max_items, const char* op) {
    if (n == 0 || n > constants::MAX_ITEMS) {
        return make_validation_error(ErrorCode::INVALID_ITEM_COUNT,
            "N must be an integer in [1, 65535], got " + std::to_string(n), COMPONENT, op);
    }
    if (n > max_items) {
        return make_validation_error(ErrorCode::INVALID_ITEM_COUNT,
            "N=" + std::to_string(n) + " exceeds configured limit " + std::to_string(max_items),
            COMPONENT, op);
    }
    return std::nullopt;
}

// Records each index of one tier in owner[], failing on range or repeats.
inline std::optional<CodecError> claim_tier(std::span<const Index> list, Tier tier,
                                            std::vector<Tier>& owner, Permutation& out) {
    const auto n = static_cast<Index>(owner.size());
    for (const Index idx : list) {
        if (idx < 0 || idx >= n) {
            return make_validation_error(ErrorCode::INDEX_OUT_OF_RANGE,
                "Index " + std::to_string(idx) + " in '" + tier_name(tier) +
                "' out of range [0, " + std::to_string(n) + ")",
                COMPONENT, "canonicalize_to_permutation");
        }
        Tier& slot = owner[static_cast<std::size_t>(idx)];
        if (slot != Tier::NONE) {
            std::string msg = "Duplicate index " + std::to_string(idx) + " in '" + tier_name(tier) + "'";
            if (slot != tier) msg += std::string(" (already listed in '") + tier_name(slot) + "')";
            return make_validation_error(ErrorCode::DUPLICATE_INDEX, std::move(msg),
                COMPONENT, "canonicalize_to_permutation");
        }
        slot = tier;
        out.push_back(idx);
    }
    return std::nullopt;
}

inline bool has_marker(std::string_view s, char marker) noexcept {
    return !s.empty() && s.front() == marker;
}

} // namespace tierlink::codec::detail

export namespace tierlink::codec {

// ============================================================================
// Options
// ============================================================================
struct EncodeOptions {
    bool        with_marker = true;
    char        marker      = constants::FRAGMENT_MARKER;
    std::size_t max_items   = constants::MAX_ITEMS;
};

struct DecodeOptions {
    char        marker            = constants::FRAGMENT_MARKER;  // stripped when present
    bool        accept_padding    = true;
    bool        strict_rank_bytes = false;
    std::size_t max_items         = constants::MAX_ITEMS;
};

[[nodiscard]] inline ResultEx<EncodeOptions> encode_options_from(const CodecConfig& cfg) {
    if (!validate_configuration(cfg)) {
        return Err<EncodeOptions>(make_config_error(
            "Invalid codec configuration", detail::COMPONENT, "encode_options_from"));
    }
    EncodeOptions o;
    o.with_marker = cfg.fragment.with_marker;
    o.marker      = cfg.fragment.marker;
    o.max_items   = cfg.limits.max_items;
    return Ok(o);
}

[[nodiscard]] inline ResultEx<DecodeOptions> decode_options_from(const CodecConfig& cfg) {
    if (!validate_configuration(cfg)) {
        return Err<DecodeOptions>(make_config_error(
            "Invalid codec configuration", detail::COMPONENT, "decode_options_from"));
    }
    DecodeOptions o;
    o.marker            = cfg.fragment.marker;
    o.accept_padding    = cfg.fragment.accept_padding;
    o.strict_rank_bytes = cfg.fragment.strict_rank_bytes;
    o.max_items         = cfg.limits.max_items;
    return Ok(o);
}

// ============================================================================
// Low-level: permutation ↔ bytes
// ============================================================================

// very ⧺ somewhat ⧺ not_ ⧺ (unlisted indices, ascending).
[[nodiscard]] inline ResultEx<DecodedPermutation>
canonicalize_to_permutation(const TierState& state, std::size_t n) {
    if (auto err = detail::check_item_count(n, constants::MAX_ITEMS, "canonicalize_to_permutation")) {
        return Err<DecodedPermutation>(std::move(*err));
    }

    std::vector<detail::Tier> owner(n, detail::Tier::NONE);
    DecodedPermutation out;
    out.perm.reserve(n);

    if (auto err = detail::claim_tier(state.very, detail::Tier::VERY, owner, out.perm))
        return Err<DecodedPermutation>(std::move(*err));
    out.k1 = out.perm.size();

    if (auto err = detail::claim_tier(state.somewhat, detail::Tier::SOMEWHAT, owner, out.perm))
        return Err<DecodedPermutation>(std::move(*err));
    out.k2 = out.perm.size() - out.k1;

    if (auto err = detail::claim_tier(state.not_, detail::Tier::NOT, owner, out.perm))
        return Err<DecodedPermutation>(std::move(*err));

    for (std::size_t i = 0; i < n; ++i) {
        if (owner[i] == detail::Tier::NONE) out.perm.push_back(static_cast<Index>(i));
    }
    return Ok(std::move(out));
}

[[nodiscard]] inline ResultEx<Bytes>
encode_permutation_to_bytes(std::span<const Index> perm, std::size_t k1, std::size_t k2) {
    if (auto err = lehmer::validate_permutation(perm)) return Err<Bytes>(std::move(*err));

    const std::size_t n = perm.size();
    if (k1 > n || k2 > n - k1) {
        return Err<Bytes>(make_validation_error(ErrorCode::INVALID_CUT_POINTS,
            "Invalid cut points k1=" + std::to_string(k1) + ", k2=" + std::to_string(k2) +
            " for N=" + std::to_string(n),
            detail::COMPONENT, "encode_permutation_to_bytes"));
    }

    auto rank = lehmer::rank_permutation(perm);
    if (!rank) return Err<Bytes>(std::move(rank).error());
    const Bytes rank_bytes = rank->to_bytes_be();

    Bytes out;
    out.reserve(constants::HEADER_SIZE + rank_bytes.size());
    out.push_back(FORMAT_VERSION);
    for (const std::size_t cut : {k1, k2}) {
        auto r = bytes::append_u16(out, static_cast<std::int64_t>(cut));
        if (!r) {
            return Err<Bytes>(make_validation_error(ErrorCode::VALUE_OUT_OF_RANGE,
                r.error(), detail::COMPONENT, "encode_permutation_to_bytes"));
        }
    }
    out.insert(out.end(), rank_bytes.begin(), rank_bytes.end());
    return Ok(std::move(out));
}

[[nodiscard]] inline ResultEx<DecodedPermutation>
decode_bytes_to_permutation(BytesView data, std::size_t n, const DecodeOptions& opts = {}) {
    constexpr const char* OP = "decode_bytes_to_permutation";
    if (auto err = detail::check_item_count(n, opts.max_items, OP)) {
        return Err<DecodedPermutation>(std::move(*err));
    }
    if (data.size() < constants::HEADER_SIZE) {
        return Err<DecodedPermutation>(make_format_error(ErrorCode::FRAGMENT_TOO_SHORT,
            "Fragment too short: " + std::to_string(data.size()) + " bytes, header needs " +
            std::to_string(constants::HEADER_SIZE),
            detail::COMPONENT, OP));
    }
    if (data[0] != FORMAT_VERSION) {
        return Err<DecodedPermutation>(make_format_error(ErrorCode::UNSUPPORTED_VERSION,
            "Unsupported version " + std::to_string(data[0]), detail::COMPONENT, OP));
    }

    auto k1 = bytes::decode_u16(data, 1);
    auto k2 = bytes::decode_u16(data, 1 + constants::CUT_FIELD_SIZE);
    if (!k1 || !k2) {
        return Err<DecodedPermutation>(make_internal_error(ErrorCode::INTERNAL_ERROR,
            !k1 ? k1.error() : k2.error(), detail::COMPONENT, OP));
    }
    if (std::size_t{*k1} + std::size_t{*k2} > n) {
        return Err<DecodedPermutation>(make_format_error(ErrorCode::INVALID_CUT_POINTS,
            "Invalid cut points k1=" + std::to_string(*k1) + ", k2=" + std::to_string(*k2) +
            " for N=" + std::to_string(n),
            detail::COMPONENT, OP));
    }

    const BytesView rank_bytes = data.subspan(constants::HEADER_SIZE);
    if (opts.strict_rank_bytes &&
        (rank_bytes.empty() || (rank_bytes.size() > 1 && rank_bytes[0] == 0))) {
        return Err<DecodedPermutation>(make_format_error(ErrorCode::MALFORMED_FRAGMENT,
            "Rank bytes are not minimal", detail::COMPONENT, OP));
    }

    auto perm = lehmer::unrank_permutation(BigUint::from_bytes_be(rank_bytes), n);
    if (!perm) return Err<DecodedPermutation>(std::move(perm).error());

    if (auto err = lehmer::validate_permutation(*perm)) {
        return Err<DecodedPermutation>(std::move(*err));
    }

    DecodedPermutation out;
    out.perm = std::move(*perm);
    out.k1 = *k1;
    out.k2 = *k2;
    return Ok(std::move(out));
}

[[nodiscard]] inline ResultEx<DecodedPermutation>
decode_fragment_to_permutation(std::string_view fragment, std::size_t n, const DecodeOptions& opts = {}) {
    if (detail::has_marker(fragment, opts.marker)) fragment.remove_prefix(1);

    b64url::DecodeOptions b64opts;
    b64opts.accept_padding = opts.accept_padding;
    auto raw = b64url::decode(fragment, b64opts);
    if (!raw) {
        return Err<DecodedPermutation>(make_format_error(ErrorCode::MALFORMED_FRAGMENT,
            "Malformed fragment: " + raw.error(),
            detail::COMPONENT, "decode_fragment_to_permutation"));
    }
    return decode_bytes_to_permutation(*raw, n, opts);
}

// Fails with INVALID_CUT_POINTS when k1 + k2 exceeds the permutation length.
[[nodiscard]] inline ResultEx<TierState> split_permutation(const DecodedPermutation& d) {
    const std::size_t n = d.perm.size();
    if (d.k1 > n || d.k2 > n - d.k1) {
        return Err<TierState>(make_validation_error(ErrorCode::INVALID_CUT_POINTS,
            "Invalid cut points k1=" + std::to_string(d.k1) + ", k2=" + std::to_string(d.k2) +
            " for N=" + std::to_string(n),
            detail::COMPONENT, "split_permutation"));
    }
    const auto first = d.perm.begin();
    const auto k1 = static_cast<std::ptrdiff_t>(d.k1);
    const auto k12 = static_cast<std::ptrdiff_t>(d.k1 + d.k2);
    TierState s;
    s.very.assign(first, first + k1);
    s.somewhat.assign(first + k1, first + k12);
    s.not_.assign(first + k12, d.perm.end());
    return Ok(std::move(s));
}

// ============================================================================
// Tier state ↔ fragment
// ============================================================================

[[nodiscard]] inline ResultEx<std::string>
encode_tier_state(const TierState& state, std::size_t n, const EncodeOptions& opts = {}) {
    if (auto err = detail::check_item_count(n, opts.max_items, "encode_tier_state")) {
        return Err<std::string>(std::move(*err));
    }
    auto canon = canonicalize_to_permutation(state, n);
    if (!canon) return Err<std::string>(std::move(canon).error());

    auto data = encode_permutation_to_bytes(canon->perm, canon->k1, canon->k2);
    if (!data) return Err<std::string>(std::move(data).error());

    std::string payload = b64url::encode(*data);
    if (!opts.with_marker) return Ok(std::move(payload));

    std::string out;
    out.reserve(payload.size() + 1);
    out.push_back(opts.marker);
    out.append(payload);
    return Ok(std::move(out));
}

[[nodiscard]] inline ResultEx<TierState>
decode_tier_state(std::string_view fragment, std::size_t n, const DecodeOptions& opts = {}) {
    auto decoded = decode_fragment_to_permutation(fragment, n, opts);
    if (!decoded) return Err<TierState>(std::move(decoded).error());
    return split_permutation(*decoded);
}

// Config-driven overloads.
[[nodiscard]] inline ResultEx<std::string>
encode_tier_state(const TierState& state, std::size_t n, const CodecConfig& cfg) {
    auto opts = encode_options_from(cfg);
    if (!opts) return Err<std::string>(std::move(opts).error());
    return encode_tier_state(state, n, *opts);
}

[[nodiscard]] inline ResultEx<TierState>
decode_tier_state(std::string_view fragment, std::size_t n, const CodecConfig& cfg) {
    auto opts = decode_options_from(cfg);
    if (!opts) return Err<TierState>(std::move(opts).error());
    return decode_tier_state(fragment, n, *opts);
}

} // namespace tierlink::codec
