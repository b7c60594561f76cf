#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace gitsaga {

// Raw 20-byte SHA-1 digest (binary, not hex)
using oid = std::array<std::uint8_t, 20>;

/**
 * Compute SHA-1 of arbitrary bytes.
 * Used to fingerprint downloaded and captured snapshot archives so a
 * partially applied snapshot can be matched to the exact payload in the logs.
 */
oid sha1(std::span<const std::uint8_t> data);

// Convenience overload for string-like input (no copy).
inline oid sha1(std::string_view s) {
  return sha1(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()), s.size()));
}

/** Convert binary oid to 40-char lowercase hex. */
std::string to_hex(const oid &id);

/** sha1 + to_hex in one call. */
inline std::string sha1_hex(std::span<const std::uint8_t> data) { return to_hex(sha1(data)); }

} // namespace gitsaga
