module; // ===== Global Module Fragment =====
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string_view>

export module tierlink.config;

// =============================
// Internal (not exported)
// =============================
namespace tierlink::detail {

template <class T>
constexpr T clamp(T v, T lo, T hi) { return std::min(hi, std::max(lo, v)); }

// Characters that may never act as a fragment marker: the URL-safe base64
// alphabet and the padding character.
constexpr bool is_payload_char(char c) noexcept {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
         (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '=';
}

} // namespace tierlink::detail

// =============================
// Public API (exported)
// =============================
export namespace tierlink {

// ============================================================================
// Library version
// ============================================================================
namespace version {
  inline constexpr std::uint32_t MAJOR = 1;
  inline constexpr std::uint32_t MINOR = 0;
  inline constexpr std::uint32_t PATCH = 0;

  inline constexpr std::string_view NAME           = "tierlink";
  inline constexpr std::string_view VERSION_STRING = "1.0.0";
}

// Version byte written at offset 0 of every fragment. Decoders reject any
// other value; bump only together with a format change.
inline constexpr std::uint8_t FORMAT_VERSION = 1;

// ============================================================================
// Format constants and safe limits
// ============================================================================
namespace constants {
  inline constexpr std::size_t HEADER_SIZE    = 5;      // version + k1 + k2
  inline constexpr std::size_t CUT_FIELD_SIZE = 2;      // u16 big-endian
  inline constexpr std::size_t MAX_ITEMS      = 65535;  // 16-bit size fields
  inline constexpr char        FRAGMENT_MARKER = '#';

  static_assert(HEADER_SIZE == 1 + 2 * CUT_FIELD_SIZE, "header layout");
}

// ============================================================================
// High-level configuration object
// ============================================================================
struct FragmentOptions {
  bool with_marker       = true;                       // prefix output with marker
  char marker            = constants::FRAGMENT_MARKER;
  bool accept_padding    = true;                       // tolerate trailing '=' on decode
  bool strict_rank_bytes = false;                      // reject non-minimal rank bytes
  constexpr bool operator==(const FragmentOptions&) const = default;
};

struct Limits {
  std::size_t max_items = constants::MAX_ITEMS;
  constexpr bool operator==(const Limits&) const = default;
};

struct CodecConfig {
  FragmentOptions fragment{};
  Limits          limits{};
  constexpr bool operator==(const CodecConfig&) const = default;
};

// ============================================================================
// Factory presets
// ============================================================================
[[nodiscard]] inline CodecConfig get_configuration_defaults() {
  return CodecConfig{};
}

// Only accepts what this library itself would emit.
[[nodiscard]] inline CodecConfig get_strict_config() {
  CodecConfig cfg = get_configuration_defaults();
  cfg.fragment.accept_padding    = false;
  cfg.fragment.strict_rank_bytes = true;
  return cfg;
}

// Bare payload for embedding inside a larger fragment.
[[nodiscard]] inline CodecConfig get_compact_config() {
  CodecConfig cfg = get_configuration_defaults();
  cfg.fragment.with_marker = false;
  return cfg;
}

// ============================================================================
// Normalization: clamp limits
// ============================================================================
inline void normalize(CodecConfig& cfg) {
  cfg.limits.max_items = detail::clamp<std::size_t>(cfg.limits.max_items, 1, constants::MAX_ITEMS);
}

[[nodiscard]] inline CodecConfig make_defaults() { auto c = get_configuration_defaults(); normalize(c); return c; }
[[nodiscard]] inline CodecConfig make_strict()   { auto c = get_strict_config();         normalize(c); return c; }
[[nodiscard]] inline CodecConfig make_compact()  { auto c = get_compact_config();        normalize(c); return c; }

// ============================================================================
// Validation & version helpers
// ============================================================================
[[nodiscard]] inline constexpr std::string_view get_version_string() noexcept {
  return version::VERSION_STRING;
}
[[nodiscard]] inline constexpr std::string_view get_library_name() noexcept {
  return version::NAME;
}

[[nodiscard]] inline bool validate_configuration(const CodecConfig& cfg) noexcept {
  if (cfg.limits.max_items == 0)                   return false;
  if (cfg.limits.max_items > constants::MAX_ITEMS) return false;
  if (detail::is_payload_char(cfg.fragment.marker)) return false;
  return true;
}

} // namespace tierlink
