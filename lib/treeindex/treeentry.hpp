#ifndef TREE_ENTRY_HPP
#define TREE_ENTRY_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

#include "digest.hpp"

class TreeEntry {
public:
  using TimePoint = std::chrono::system_clock::time_point;

private:
  std::string m_relativePath;
  Digest m_digest;
  std::uint64_t m_size;
  TimePoint m_modified;

public:
  TreeEntry(std::string relativePath, const Digest &digest, std::uint64_t size,
            TimePoint modified)
      : m_relativePath(std::move(relativePath)), m_digest(digest), m_size(size),
        m_modified(modified) {}

  // '/' separated, relative to the indexed root
  const std::string &getRelativePath() const { return m_relativePath; }
  const Digest &getDigest() const { return m_digest; }
  std::uint64_t getSize() const { return m_size; }
  TimePoint getModifiedTime() const { return m_modified; }

  bool isEmpty() const { return m_size == 0; }
};

#endif // TREE_ENTRY_HPP
