module;

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

export module tierlink.category;

import tierlink.types;
import tierlink.errors;
import tierlink.biguint;
import tierlink.base64url;
import tierlink.lehmer;

// ──────────────────────────────────────────────────────────────────────────────
// category: a reordering of named categories as base64url(rank bytes)
//
// The header is implied (cut points are always zero and N is the size of the
// canonical list), so only the minimal big-endian rank is written. The
// canonical order itself encodes to the empty string.
// ──────────────────────────────────────────────────────────────────────────────

namespace tierlink::category::detail {
inline constexpr const char* COMPONENT = "category";
}

export namespace tierlink::category {

// Distinct names in order of first appearance.
[[nodiscard]] inline std::vector<std::string>
canonical_category_order(std::span<const std::string> categories) {
    std::unordered_set<std::string_view> seen;
    std::vector<std::string> order;
    for (const auto& c : categories) {
        if (seen.insert(c).second) order.push_back(c);
    }
    return order;
}

[[nodiscard]] inline ResultEx<std::string>
encode_category_order(std::span<const std::string> order, std::span<const std::string> canonical) {
    if (order.empty() || order.size() != canonical.size()) return Ok(std::string{});

    bool same = true;
    for (std::size_t i = 0; i < order.size() && same; ++i) same = order[i] == canonical[i];
    if (same) return Ok(std::string{});

    std::unordered_map<std::string_view, Index> position;
    position.reserve(canonical.size());
    for (std::size_t i = 0; i < canonical.size(); ++i) {
        position.emplace(canonical[i], static_cast<Index>(i));
    }

    Permutation perm;
    perm.reserve(order.size());
    for (const auto& name : order) {
        const auto it = position.find(name);
        if (it == position.end()) {
            return Err<std::string>(make_validation_error(ErrorCode::CATEGORY_NOT_FOUND,
                "Category " + name + " not found in canonical order",
                detail::COMPONENT, "encode_category_order"));
        }
        perm.push_back(it->second);
    }

    auto rank = lehmer::rank_permutation(perm);
    if (!rank) return Err<std::string>(std::move(rank).error());
    return Ok(b64url::encode(rank->to_bytes_be()));
}

[[nodiscard]] inline ResultEx<std::vector<std::string>>
decode_category_order(std::string_view fragment, std::span<const std::string> canonical) {
    using Names = std::vector<std::string>;
    if (fragment.empty() || canonical.empty()) return Ok(Names(canonical.begin(), canonical.end()));

    auto raw = b64url::decode(fragment);
    if (!raw) {
        return Err<Names>(make_format_error(ErrorCode::MALFORMED_FRAGMENT,
            "Malformed category fragment: " + raw.error(),
            detail::COMPONENT, "decode_category_order"));
    }

    auto perm = lehmer::unrank_permutation(BigUint::from_bytes_be(*raw), canonical.size());
    if (!perm) return Err<Names>(std::move(perm).error());

    Names out;
    out.reserve(perm->size());
    for (const Index i : *perm) out.push_back(canonical[static_cast<std::size_t>(i)]);
    return Ok(std::move(out));
}

} // namespace tierlink::category
