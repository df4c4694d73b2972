#ifndef DIGEST_HPP
#define DIGEST_HPP

#include <array>
#include <cstddef>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

/**
 * @brief Fixed-size content fingerprint (SHA-256 width)
 *
 * Holds the raw 32 bytes produced by an IHashCalculator. Digests compare by
 * value and order lexicographically by byte, so they can be used as keys in
 * ordered containers.
 *
 * @see IHashCalculator
 */
struct Digest {
  static constexpr std::size_t SIZE = 32;

  std::array<unsigned char, SIZE> bytes{};

  bool operator==(const Digest &other) const { return bytes == other.bytes; }
  bool operator!=(const Digest &other) const { return !(*this == other); }
  bool operator<(const Digest &other) const { return bytes < other.bytes; }

  /**
   * @brief Lowercase hex rendering, always 64 characters
   */
  std::string toHex() const {
    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < SIZE; i++) {
      ss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return ss.str();
  }

  /**
   * @brief Parses a 64 character hex string (either case)
   * @return The digest, or std::nullopt on a wrong length or non-hex digit
   */
  static std::optional<Digest> fromHex(std::string_view hex) {
    if (hex.size() != SIZE * 2) {
      return std::nullopt;
    }

    auto hexval = [](char c) -> int {
      if ('0' <= c && c <= '9') return c - '0';
      if ('a' <= c && c <= 'f') return c - 'a' + 10;
      if ('A' <= c && c <= 'F') return c - 'A' + 10;
      return -1;
    };

    Digest digest;
    for (std::size_t i = 0; i < SIZE; ++i) {
      int hi = hexval(hex[2 * i]);
      int lo = hexval(hex[2 * i + 1]);
      if (hi < 0 || lo < 0) {
        return std::nullopt;
      }
      digest.bytes[i] = static_cast<unsigned char>((hi << 4) | lo);
    }
    return digest;
  }
};

#endif // DIGEST_HPP
