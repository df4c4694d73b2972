/**
 * @file indexlisting.hpp
 * @brief Line-oriented text rendering of a TreeIndex
 *
 * A listing has one line per file:
 *
 *     <64 hex digits> <size in bytes> <relative path>
 *
 * The path is everything after the second space, so it may contain spaces.
 * A digest index (see DigestIndex) writes further files with the same
 * content below their first file as
 *
 *     - <relative path>
 *
 * Listings are a display format for the command line tool; they are not a
 * versioned on-disk index format.
 */

#ifndef INDEXLISTING_HPP
#define INDEXLISTING_HPP

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

#include "treeindex.hpp"

/**
 * @brief One parsed listing line
 */
struct ListingRecord {
  Digest digest;
  std::uint64_t size = 0;
  std::string path;
  bool duplicate = false; ///< read from a "- <path>" line
};

/**
 * @brief Writes @p index in key order
 */
void writeListing(std::ostream &out, const TreeIndex &index);

/**
 * @brief Parses a listing, skipping blank lines
 *
 * A "- <path>" line yields a record with the digest and size of the record
 * before it and ListingRecord::duplicate set.
 *
 * @throws IndexError InvalidFormat on the first malformed line, naming its
 *         line number
 * @throws IndexError Io if the stream fails for another reason than EOF
 */
std::vector<ListingRecord> readListing(std::istream &in);

#endif // INDEXLISTING_HPP
