/**
 * @file treeindex.hpp
 * @brief Snapshot of a directory tree keyed by relative path
 */

#ifndef TREE_INDEX_HPP
#define TREE_INDEX_HPP

#include <algorithm>
#include <cstdint>
#include <map>
#include <string>

#include "treeentry.hpp"

/**
 * @class TreeIndex
 * @brief Read-only mapping from relative path to TreeEntry
 *
 * A TreeIndex is produced by one TreeIndexer::buildIndex() call and never
 * changes afterwards. It holds exactly one entry per regular file found in
 * the scanned tree; keys use '/' as separator on every platform and iterate
 * in lexicographic order.
 *
 * @see TreeIndexer
 * @see TreeEntry
 */
class TreeIndex {
public:
  using Map = std::map<std::string, TreeEntry>;
  using const_iterator = Map::const_iterator;

  TreeIndex() = default;
  explicit TreeIndex(Map entries) : m_entries(std::move(entries)) {}

  /**
   * @brief Looks up an entry by relative path
   * @return Pointer to the entry, or nullptr if the path is not indexed
   */
  const TreeEntry *find(const std::string &relativePath) const {
    auto it = m_entries.find(relativePath);
    return it == m_entries.end() ? nullptr : &it->second;
  }

  bool contains(const std::string &relativePath) const {
    return m_entries.count(relativePath) != 0;
  }

  std::size_t size() const { return m_entries.size(); }
  bool empty() const { return m_entries.empty(); }

  const_iterator begin() const { return m_entries.begin(); }
  const_iterator end() const { return m_entries.end(); }

  const Map &entries() const { return m_entries; }

  /**
   * @brief Size of the largest indexed file, 0 for an empty index
   */
  std::uint64_t maxFileSize() const {
    std::uint64_t max = 0;
    for (const auto &[path, entry] : m_entries) {
      max = std::max(max, entry.getSize());
    }
    return max;
  }

  std::uint64_t totalBytes() const {
    std::uint64_t total = 0;
    for (const auto &[path, entry] : m_entries) {
      total += entry.getSize();
    }
    return total;
  }

private:
  Map m_entries;
};

#endif // TREE_INDEX_HPP
