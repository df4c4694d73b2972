#ifndef SHA256_HPP
#define SHA256_HPP

#include "ihashcalculator.hpp"

#include <cstdint>
#include <string_view>

/**
 * @brief SHA-256 file digests backed by OpenSSL's EVP interface
 *
 * Files are streamed from disk in 1 MiB chunks. In fast mode only the first
 * and the last chunk of a file larger than one chunk are hashed, which is far
 * cheaper on big files but no longer a digest of the whole content: two files
 * that differ only in the middle hash equal. Fast digests are therefore only
 * good for finding duplicate candidates.
 *
 * @note Inherits from IHashCalculator interface
 * @note Stateless apart from the mode flag; safe for concurrent use
 */
class Sha256 : public IHashCalculator {
public:
  static constexpr std::uint64_t CHUNK_SIZE = 1024 * 1024;

  explicit Sha256(bool fast = false) : m_fast(fast) {}

  /**
   * @brief Digests the content of @p filePath
   * @throws IndexError (Io) if the file cannot be opened or read
   */
  Digest calculateHash(const std::filesystem::path &filePath) const override;

  /**
   * @brief Digests an in-memory buffer
   */
  static Digest hashBytes(std::string_view data);

  bool isFast() const { return m_fast; }

private:
  bool m_fast;
};

#endif // SHA256_HPP
