module;

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

export module tierlink.bytes;

import tierlink.types; // Byte, Bytes, BytesView, Result

// ──────────────────────────────────────────────────────────────────────────────
// bytes: fixed-width big-endian integers for the fragment header
// ──────────────────────────────────────────────────────────────────────────────

export namespace tierlink::bytes {

  inline constexpr std::int64_t U16_MAX = 0xFFFF;

  [[nodiscard]] inline Result<std::array<Byte, 2>> encode_u16(std::int64_t n) {
    if (n < 0 || n > U16_MAX) {
      return tierlink::unexpected<std::string>(
          "[Range] u16 out of range: " + std::to_string(n));
    }
    const auto v = static_cast<std::uint16_t>(n);
    return std::array<Byte, 2>{ static_cast<Byte>((v >> 8) & 0xFF),
                                static_cast<Byte>(v & 0xFF) };
  }

  [[nodiscard]] inline Result<std::uint16_t> decode_u16(BytesView src, std::size_t offset = 0) {
    if (offset > src.size() || src.size() - offset < 2) {
      return tierlink::unexpected<std::string>(
          "[Truncated] need 2 bytes at offset " + std::to_string(offset));
    }
    return static_cast<std::uint16_t>((std::uint16_t(src[offset]) << 8) | src[offset + 1]);
  }

  // Appends n as u16 big-endian; fails without touching out when out of range.
  [[nodiscard]] inline Result<void> append_u16(Bytes& out, std::int64_t n) {
    auto be = encode_u16(n);
    if (!be) return tierlink::unexpected<std::string>(be.error());
    out.insert(out.end(), be->begin(), be->end());
    return {};
  }

} // namespace tierlink::bytes
