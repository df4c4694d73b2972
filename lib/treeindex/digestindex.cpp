/**
 * @file digestindex.cpp
 * @brief Construction, queries and text output of DigestIndex
 */

#include "digestindex.hpp"
#include "indexerror.hpp"

#include <algorithm>

namespace fs = std::filesystem;

DigestIndex DigestIndex::fromTreeIndex(const TreeIndex &index,
                                       bool withDupes) {
  DigestIndex result;
  for (const auto &[path, entry] : index) {
    result.add(entry.getDigest(), entry.getSize(), path, withDupes);
  }
  return result;
}

DigestIndex DigestIndex::fromListing(const std::vector<ListingRecord> &records,
                                     bool withDupes) {
  DigestIndex result;
  for (const auto &record : records) {
    result.add(record.digest, record.size, record.path, withDupes);
  }
  return result;
}

void DigestIndex::add(const Digest &digest, std::uint64_t size,
                      const std::string &path, bool withDupes) {
  auto it = m_records.find({digest, size});
  if (it == m_records.end()) {
    DigestRecord record;
    record.digest = digest;
    record.size = size;
    record.path = path;
    m_records.emplace(Key(digest, size), std::move(record));
  } else if (withDupes) {
    it->second.dupes.push_back(path);
  }
}

bool DigestIndex::insert(DigestRecord record) {
  Key key(record.digest, record.size);
  return m_records.emplace(std::move(key), std::move(record)).second;
}

std::size_t DigestIndex::countDupes() const {
  std::size_t count = 0;
  for (const auto &[key, record] : m_records) {
    count += record.dupes.size();
  }
  return count;
}

std::uint64_t DigestIndex::wastedSpace() const {
  std::uint64_t total = 0;
  for (const auto &[key, record] : m_records) {
    total += record.wastedSpace();
  }
  return total;
}

std::uint64_t DigestIndex::maxFileSize() const {
  std::uint64_t max = 0;
  for (const auto &[key, record] : m_records) {
    max = std::max(max, record.size);
  }
  return max;
}

DigestIndex DigestIndex::withoutEmptyFiles() const {
  DigestIndex result;
  for (const auto &[key, record] : m_records) {
    if (record.size > 0) {
      result.m_records.emplace(key, record);
    }
  }
  return result;
}

std::set<std::string> DigestIndex::duplicateDirectories() const {
  std::set<std::string> dirs;
  for (const auto &[key, record] : m_records) {
    for (const auto &dupe : record.dupes) {
      std::string parent = fs::path(dupe).parent_path().generic_string();
      dirs.insert(parent.empty() ? "." : parent);
    }
  }
  return dirs;
}

void writeDigestIndex(std::ostream &out, const DigestIndex &index) {
  for (const auto &[key, record] : index) {
    out << record.digest.toHex() << ' ' << record.size << ' ' << record.path
        << '\n';
    for (const auto &dupe : record.dupes) {
      out << "- " << dupe << '\n';
    }
  }
}

DigestIndex findInHaystack(const DigestIndex &needle,
                           const DigestIndex &haystack) {
  DigestIndex found;
  for (const auto &[key, wanted] : needle) {
    const DigestRecord *match = haystack.find(key.first, key.second);
    if (match == nullptr) {
      continue;
    }

    DigestRecord record = wanted;
    record.dupes.clear();
    if (match->path != wanted.path) {
      record.dupes.push_back(match->path);
    }
    for (const auto &dupe : match->dupes) {
      if (dupe != wanted.path) {
        record.dupes.push_back(dupe);
      }
    }

    if (!record.dupes.empty()) {
      found.insert(std::move(record));
    }
  }
  return found;
}

/**
 * @brief Re-digests every record and keeps the dupes that still match
 *
 * Dupes are only digested when their size equals the record's current size,
 * so changed files are rejected without reading them.
 */
DigestIndex confirmDuplicates(const DigestIndex &candidates,
                              const fs::path &root,
                              const IHashCalculator &calculator) {
  DigestIndex confirmed;
  for (const auto &[key, candidate] : candidates) {
    fs::path location = root / candidate.path;

    std::error_code ec;
    std::uint64_t size = fs::file_size(location, ec);
    if (ec) {
      throw IndexError::io(location, ec);
    }
    Digest digest = calculator.calculateHash(location);
    confirmed.add(digest, size, candidate.path, true);

    for (const auto &dupe : candidate.dupes) {
      fs::path dupe_location = root / dupe;
      std::uint64_t dupe_size = fs::file_size(dupe_location, ec);
      if (ec || dupe_size != size) {
        continue; // vanished or changed
      }
      if (calculator.calculateHash(dupe_location) == digest) {
        confirmed.add(digest, size, dupe, true);
      }
    }
  }
  return confirmed;
}
