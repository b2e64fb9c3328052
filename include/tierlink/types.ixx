module; // ===== Global Module Fragment =====
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

export module tierlink.types;
export import tierlink.expected;

export namespace tierlink {

// ============================================================================
// Basic byte types
// ============================================================================
using Byte      = std::uint8_t;
using Bytes     = std::vector<Byte>;
using BytesView = std::span<const Byte>;

template<class T>
using Result = tierlink::expected<T, std::string>;

// ============================================================================
// Index types
// ============================================================================
// Item indices are signed so that negative caller input can be rejected
// instead of wrapping around.
using Index       = std::int64_t;
using Permutation = std::vector<Index>;
using Digits      = std::vector<std::uint32_t>;

// Three ordered tiers of dataset indices. Anything not listed belongs to the
// implicit remainder, which encoding folds into not_ in ascending order.
struct TierState {
    std::vector<Index> very;
    std::vector<Index> somewhat;
    std::vector<Index> not_;

    bool operator==(const TierState&) const = default;
};

// Concatenated very ⧺ somewhat ⧺ not plus the two cut sizes.
struct DecodedPermutation {
    Permutation perm;
    std::size_t k1{0};
    std::size_t k2{0};

    bool operator==(const DecodedPermutation&) const = default;
};

// ============================================================================
// Error codes
// ============================================================================
enum class ErrorCode : std::int32_t {
    SUCCESS = 0,

    // Caller input
    INVALID_ITEM_COUNT  = 100,
    INDEX_OUT_OF_RANGE  = 101,
    DUPLICATE_INDEX     = 102,
    INVALID_CUT_POINTS  = 103,
    INVALID_PERMUTATION = 104,
    VALUE_OUT_OF_RANGE  = 105,
    CATEGORY_NOT_FOUND  = 106,

    // Untrusted fragment data
    MALFORMED_FRAGMENT  = 200,
    FRAGMENT_TOO_SHORT  = 201,
    UNSUPPORTED_VERSION = 202,
    RANK_OUT_OF_RANGE   = 203,
    INVALID_DIGITS      = 204,

    // Library
    INTERNAL_ERROR = 400,
    CONFIG_ERROR   = 401
};

[[nodiscard]] inline constexpr std::string_view to_string(ErrorCode c) noexcept {
    switch (c) {
        case ErrorCode::SUCCESS:             return "SUCCESS";
        case ErrorCode::INVALID_ITEM_COUNT:  return "INVALID_ITEM_COUNT";
        case ErrorCode::INDEX_OUT_OF_RANGE:  return "INDEX_OUT_OF_RANGE";
        case ErrorCode::DUPLICATE_INDEX:     return "DUPLICATE_INDEX";
        case ErrorCode::INVALID_CUT_POINTS:  return "INVALID_CUT_POINTS";
        case ErrorCode::INVALID_PERMUTATION: return "INVALID_PERMUTATION";
        case ErrorCode::VALUE_OUT_OF_RANGE:  return "VALUE_OUT_OF_RANGE";
        case ErrorCode::CATEGORY_NOT_FOUND:  return "CATEGORY_NOT_FOUND";
        case ErrorCode::MALFORMED_FRAGMENT:  return "MALFORMED_FRAGMENT";
        case ErrorCode::FRAGMENT_TOO_SHORT:  return "FRAGMENT_TOO_SHORT";
        case ErrorCode::UNSUPPORTED_VERSION: return "UNSUPPORTED_VERSION";
        case ErrorCode::RANK_OUT_OF_RANGE:   return "RANK_OUT_OF_RANGE";
        case ErrorCode::INVALID_DIGITS:      return "INVALID_DIGITS";
        case ErrorCode::INTERNAL_ERROR:      return "INTERNAL_ERROR";
        case ErrorCode::CONFIG_ERROR:        return "CONFIG_ERROR";
    }
    return "UNKNOWN";
}

} // namespace tierlink
