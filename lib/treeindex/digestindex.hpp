/**
 * @file digestindex.hpp
 * @brief Index keyed by file content, one record per distinct content
 */

#ifndef DIGEST_INDEX_HPP
#define DIGEST_INDEX_HPP

#include <cstdint>
#include <filesystem>
#include <map>
#include <ostream>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "ihashcalculator.hpp"
#include "indexlisting.hpp"
#include "treeindex.hpp"

/**
 * @brief One distinct file content and every path holding it
 */
struct DigestRecord {
  Digest digest;
  std::uint64_t size = 0;
  std::string path;               ///< first path seen with this content
  std::vector<std::string> dupes; ///< further paths, in insertion order

  /** @brief Bytes freed by keeping only @ref path */
  std::uint64_t wastedSpace() const { return size * dupes.size(); }
};

/**
 * @class DigestIndex
 * @brief Mapping from (digest, size) to the files with that content
 *
 * The size is part of the key because a fast-mode digest only covers the
 * ends of large files: files of different length never share a record.
 * Records iterate ordered by digest, then size.
 *
 * Written as text by writeDigestIndex(): the record's listing line followed
 * by one "- <path>" line per duplicate. readListing() parses that format
 * back, and fromListing() rebuilds the index from the records.
 *
 * @see TreeIndex
 * @see readListing()
 */
class DigestIndex {
public:
  using Key = std::pair<Digest, std::uint64_t>;
  using Map = std::map<Key, DigestRecord>;
  using const_iterator = Map::const_iterator;

  DigestIndex() = default;

  /**
   * @brief Groups a scanned tree by content
   *
   * Entries are visited in path order, so each record's path is the
   * lexicographically smallest one.
   *
   * @param withDupes Keep further paths as dupes; otherwise only the first
   *                  path of each content is recorded
   */
  static DigestIndex fromTreeIndex(const TreeIndex &index, bool withDupes);

  /**
   * @brief Rebuilds an index from parsed listing records
   *
   * Accepts both plain listings and written digest indexes. A later record
   * whose content is already present becomes a dupe of it.
   */
  static DigestIndex fromListing(const std::vector<ListingRecord> &records,
                                 bool withDupes);

  /**
   * @brief Records @p path as holding the given content
   *
   * Creates a record if the content is new. Otherwise @p path is appended to
   * the record's dupes when @p withDupes is set and dropped when it is not.
   */
  void add(const Digest &digest, std::uint64_t size, const std::string &path,
           bool withDupes);

  /**
   * @brief Inserts a complete record
   * @return false if a record with the same content already exists
   */
  bool insert(DigestRecord record);

  const DigestRecord *find(const Digest &digest, std::uint64_t size) const {
    auto it = m_records.find({digest, size});
    return it == m_records.end() ? nullptr : &it->second;
  }

  std::size_t size() const { return m_records.size(); }
  bool empty() const { return m_records.empty(); }

  const_iterator begin() const { return m_records.begin(); }
  const_iterator end() const { return m_records.end(); }

  /** @brief Number of dupe paths over all records */
  std::size_t countDupes() const;

  /** @brief Bytes freed by keeping one path per record */
  std::uint64_t wastedSpace() const;

  /** @brief Size of the largest recorded content, 0 for an empty index */
  std::uint64_t maxFileSize() const;

  /** @brief Copy without the records of zero-length content */
  DigestIndex withoutEmptyFiles() const;

  /**
   * @brief Parent directories of every dupe path, sorted
   *
   * A dupe at the top level yields ".".
   */
  std::set<std::string> duplicateDirectories() const;

private:
  Map m_records;
};

/**
 * @brief Writes every record in key order, dupes below their record
 */
void writeDigestIndex(std::ostream &out, const DigestIndex &index);

/**
 * @brief Looks up the contents of @p needle in @p haystack
 *
 * For each needle record found in the haystack, the result holds the needle
 * record with every haystack path of that content as dupes. The needle's
 * own path is never listed as its dupe, and a record without any other path
 * is left out.
 */
DigestIndex findInHaystack(const DigestIndex &needle,
                           const DigestIndex &haystack);

/**
 * @brief Verifies duplicate candidates by digesting them again
 *
 * Paths are resolved against @p root. Each record's path is digested with
 * @p calculator and becomes a record of the result under its new digest and
 * current size. A dupe is kept only if it still has the same size and
 * digests equal to it; dupes that vanished or changed are dropped.
 *
 * @throws IndexError Io if a record's own path, or a dupe of matching size,
 *         cannot be read
 */
DigestIndex confirmDuplicates(const DigestIndex &candidates,
                              const std::filesystem::path &root,
                              const IHashCalculator &calculator);

#endif // DIGEST_INDEX_HPP
