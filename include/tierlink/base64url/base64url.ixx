module; // ─────────────────────────────────────────────────────────────────────
// Global module fragment: standard headers (not exported)
// ─────────────────────────────────────────────────────────────────────────────
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

// ─────────────────────────────────────────────────────────────────────────────
export module tierlink.base64url;

import tierlink.types; // Byte, Bytes, BytesView, Result

// ─────────────────────────────────────────────────────────────────────────────
// base64url: RFC 4648 §5 alphabet for URL fragments
//   • Encode never pads
//   • Decode is strict about the alphabet ('+', '/', whitespace rejected)
//   • Optional trailing '=' accepted when consistent with the length
//   • Rejects length % 4 == 1 (dangling sextet)
// ─────────────────────────────────────────────────────────────────────────────

// ------------------------------ Internals (not exported) ---------------------
namespace tierlink::b64url::detail {

  inline constexpr char ALPH_URL[] =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

  // Decoding table (256 entries):
  //  0..63 → valid sextet, 0x80 → invalid, 0x40 → padding '='
  struct DecTable {
    unsigned char t[256]{};
    constexpr DecTable(const char* alphabet) : t{} {
      for (auto& v : t) v = 0x80;
      for (int i = 0; i < 64; ++i)
        t[ static_cast<unsigned char>(alphabet[i]) ] = static_cast<unsigned char>(i);
      t[ static_cast<unsigned char>('=') ] = 0x40;
    }
  };

  inline constexpr DecTable DEC_URL{ALPH_URL};

  // Encoded length without padding: 1→2, 2→3 chars for leftovers.
  inline constexpr std::size_t enc_len_unpadded(std::size_t n) noexcept {
    const std::size_t full = (n / 3) * 4;
    const std::size_t rem  = n % 3;
    return full + (rem == 0 ? 0 : rem + 1);
  }

  inline std::size_t encode_scalar(const Byte* in, std::size_t len, char* out) noexcept {
    std::size_t i = 0, o = 0;
    while (i + 3 <= len) {
      const unsigned v = (unsigned(in[i]) << 16) | (unsigned(in[i + 1]) << 8) | unsigned(in[i + 2]);
      out[o++] = ALPH_URL[(v >> 18) & 0x3F];
      out[o++] = ALPH_URL[(v >> 12) & 0x3F];
      out[o++] = ALPH_URL[(v >>  6) & 0x3F];
      out[o++] = ALPH_URL[(v >>  0) & 0x3F];
      i += 3;
    }
    const std::size_t rem = len - i;
    if (rem == 1) {
      const unsigned v = unsigned(in[i]) << 16;
      out[o++] = ALPH_URL[(v >> 18) & 0x3F];
      out[o++] = ALPH_URL[(v >> 12) & 0x3F];
    } else if (rem == 2) {
      const unsigned v = (unsigned(in[i]) << 16) | (unsigned(in[i + 1]) << 8);
      out[o++] = ALPH_URL[(v >> 18) & 0x3F];
      out[o++] = ALPH_URL[(v >> 12) & 0x3F];
      out[o++] = ALPH_URL[(v >>  6) & 0x3F];
    }
    return o;
  }

} // namespace tierlink::b64url::detail

// ------------------------------- Public API (export) -------------------------
export namespace tierlink::b64url {

  struct DecodeOptions {
    bool accept_padding { true };
  };

  [[nodiscard]] inline std::size_t encoded_length(std::size_t input_len) noexcept {
    return detail::enc_len_unpadded(input_len);
  }

  // ---------------------------------------------------------------------------
  // Encode (one-shot)
  // ---------------------------------------------------------------------------
  [[nodiscard]] inline std::string encode(BytesView src) {
    std::string out;
    out.resize(encoded_length(src.size()));
    const std::size_t written = detail::encode_scalar(src.data(), src.size(), out.data());
    out.resize(written);
    return out;
  }

  // ---------------------------------------------------------------------------
  // Decode (one-shot)
  // ---------------------------------------------------------------------------
  [[nodiscard]] inline std::size_t decoded_maxlen(std::string_view s) noexcept {
    return (s.size() / 4) * 3 + (s.size() % 4 ? 2 : 0);
  }

  [[nodiscard]] inline Result<Bytes> decode(std::string_view s, const DecodeOptions& opt = {}) {
    const unsigned char* t = detail::DEC_URL.t;

    Bytes out;
    out.reserve(decoded_maxlen(s));
    std::uint32_t acc = 0;
    int bits = 0;
    std::size_t pad_count = 0;

    for (unsigned char c : s) {
      const unsigned char d = t[c];
      if (d == 0x80) {
        if (c == '+' || c == '/')
          return tierlink::unexpected<std::string>("[Invalid] standard alphabet character in base64url");
        return tierlink::unexpected<std::string>("[Invalid] char");
      }
      if (d == 0x40) {
        if (!opt.accept_padding) return tierlink::unexpected<std::string>("[Invalid] padding not allowed");
        ++pad_count;
        continue;
      }
      if (pad_count > 0) return tierlink::unexpected<std::string>("[Invalid] data after '='");

      acc = (acc << 6) | d;
      bits += 6;
      if (bits >= 8) {
        bits -= 8;
        out.push_back(static_cast<Byte>((acc >> bits) & 0xFF));
      }
    }

    if (bits == 6) {
      return tierlink::unexpected<std::string>("[Invalid] dangling Base64 sextet (length % 4 == 1)");
    }
    if (pad_count > 0) {
      if (pad_count > 2) return tierlink::unexpected<std::string>("[Invalid] too much padding");
      const int expected_bits = (pad_count == 1) ? 2 : 4;
      if (bits != expected_bits) return tierlink::unexpected<std::string>("[Invalid] inconsistent padding");
    }

    return out;
  }

  // ---------------------------------------------------------------------------
  // Minimal self-test (RFC 4648 §10 vectors, URL alphabet, unpadded)
  // ---------------------------------------------------------------------------
  [[nodiscard]] inline tierlink::expected<void, std::string>
  selftest_minimal() {
    struct Vec { const char* plain; const char* url_b64; };
    static constexpr Vec V[] = {
      {"", ""},
      {"f", "Zg"},
      {"fo", "Zm8"},
      {"foo", "Zm9v"},
      {"foob", "Zm9vYg"},
      {"fooba", "Zm9vYmE"},
      {"foobar", "Zm9vYmFy"}
    };

    for (auto& v : V) {
      const std::size_t n = std::strlen(v.plain);
      const BytesView plain{ reinterpret_cast<const Byte*>(v.plain), n };
      if (encode(plain) != std::string(v.url_b64))
        return tierlink::unexpected<std::string>("url encode mismatch");

      auto d = decode(v.url_b64);
      if (!d) return tierlink::unexpected<std::string>(d.error());
      if (std::string(reinterpret_cast<const char*>(d->data()), d->size()) != std::string(v.plain))
        return tierlink::unexpected<std::string>("url decode mismatch");
    }

    // Alphabet substitution: 0xFB 0xFF → "-_8" ('+' and '/' in the standard alphabet)
    {
      const Byte raw[] = {0xFB, 0xFF};
      if (encode(BytesView{raw, 2}) != "-_8")
        return tierlink::unexpected<std::string>("url alphabet substitution mismatch");
    }
    // Must reject the standard alphabet
    {
      auto d = decode("+/8");
      if (d) return tierlink::unexpected<std::string>("base64url decode accepted '+'/'/'");
    }

    return {};
  }

} // namespace tierlink::b64url
