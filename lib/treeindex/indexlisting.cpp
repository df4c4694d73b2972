#include "indexlisting.hpp"
#include "indexerror.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

void writeListing(std::ostream &out, const TreeIndex &index) {
  for (const auto &[path, entry] : index) {
    out << entry.getDigest().toHex() << ' ' << entry.getSize() << ' ' << path
        << '\n';
  }
}

std::vector<ListingRecord> readListing(std::istream &in) {
  std::vector<ListingRecord> records;
  std::string line;
  int line_count = 0;

  while (std::getline(in, line)) {
    line_count++;
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      continue;
    }

    auto fail = [line_count](const std::string &what) {
      return IndexError::invalidFormat(what + " on line " +
                                       std::to_string(line_count));
    };

    // "- <path>": another file with the content of the previous record
    if (line[0] == '-' && (line.size() == 1 || line[1] == ' ')) {
      if (records.empty()) {
        throw fail("duplicate before any digest");
      }
      ListingRecord record = records.back();
      record.path = line.size() > 2 ? line.substr(2) : std::string();
      if (record.path.empty()) {
        throw fail("missing path");
      }
      record.duplicate = true;
      records.push_back(std::move(record));
      continue;
    }

    std::size_t first = line.find(' ');
    if (first == std::string::npos) {
      throw fail("missing digest");
    }
    auto digest = Digest::fromHex(std::string_view(line).substr(0, first));
    if (!digest) {
      throw fail("invalid digest");
    }

    std::size_t second = line.find(' ', first + 1);
    if (second == std::string::npos) {
      throw fail("missing size");
    }
    std::string size_text = line.substr(first + 1, second - first - 1);
    if (size_text.empty() ||
        !std::all_of(size_text.begin(), size_text.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
      throw fail("invalid size");
    }

    ListingRecord record;
    record.digest = *digest;
    try {
      record.size = std::stoull(size_text);
    } catch (const std::out_of_range &) {
      throw fail("size out of range");
    }

    record.path = line.substr(second + 1);
    if (record.path.empty()) {
      throw fail("missing path");
    }
    records.push_back(std::move(record));
  }

  if (in.bad()) {
    throw IndexError::io({}, lastErrorCode());
  }
  return records;
}
