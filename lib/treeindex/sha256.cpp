/**
 * @file sha256.cpp
 * @brief Streaming SHA-256 over files using OpenSSL EVP
 */

#include "sha256.hpp"
#include "indexerror.hpp"

#include <openssl/evp.h>

#include <cerrno>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <vector>

namespace {

using EvpContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

EvpContext newContext() {
  EvpContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("SHA-256 initialisation failed");
  }
  return ctx;
}

void update(EVP_MD_CTX *ctx, const void *data, std::size_t len) {
  if (EVP_DigestUpdate(ctx, data, len) != 1) {
    throw std::runtime_error("SHA-256 update failed");
  }
}

Digest finish(EVP_MD_CTX *ctx) {
  Digest digest;
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx, digest.bytes.data(), &len) != 1 ||
      len != Digest::SIZE) {
    throw std::runtime_error("SHA-256 finalisation failed");
  }
  return digest;
}

// Returns the number of bytes read; a short count means end of file.
std::size_t readChunk(std::ifstream &file, std::vector<char> &buffer,
                      const std::filesystem::path &filePath) {
  errno = 0;
  file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
  if (file.bad()) {
    throw IndexError::io(filePath, lastErrorCode());
  }
  return static_cast<std::size_t>(file.gcount());
}

} // namespace

Digest Sha256::calculateHash(const std::filesystem::path &filePath) const {
  errno = 0;
  std::ifstream file(filePath, std::ios::binary);
  if (!file) {
    throw IndexError::io(filePath, lastErrorCode());
  }

  EvpContext ctx = newContext();
  std::vector<char> buffer(CHUNK_SIZE);

  std::size_t n = readChunk(file, buffer, filePath);
  update(ctx.get(), buffer.data(), n);

  if (m_fast && n == buffer.size()) {
    std::error_code ec;
    std::uintmax_t size = std::filesystem::file_size(filePath, ec);
    if (ec) {
      throw IndexError::io(filePath, ec);
    }
    // the last chunk may overlap the first one for files under 2 MiB
    if (size > CHUNK_SIZE) {
      errno = 0;
      file.seekg(static_cast<std::streamoff>(size - CHUNK_SIZE));
      if (!file) {
        throw IndexError::io(filePath, lastErrorCode());
      }
      n = readChunk(file, buffer, filePath);
      update(ctx.get(), buffer.data(), n);
    }
    return finish(ctx.get());
  }

  while (n == buffer.size()) {
    n = readChunk(file, buffer, filePath);
    update(ctx.get(), buffer.data(), n);
  }
  return finish(ctx.get());
}

Digest Sha256::hashBytes(std::string_view data) {
  EvpContext ctx = newContext();
  update(ctx.get(), data.data(), data.size());
  return finish(ctx.get());
}
