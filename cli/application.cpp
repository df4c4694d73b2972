#include "application.hpp"

#include <algorithm>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <set>
#include <string>
#include <vector>

#include "digestindex.hpp"
#include "duplicatefinder.hpp"
#include "fileorstdio.hpp"
#include "indexerror.hpp"
#include "indexlisting.hpp"
#include "logger.hpp"
#include "sha256.hpp"
#include "treeindexer.hpp"
#include "utils.hpp"

int Application::run(const CliOptions &options) {
  switch (options.command) {
  case Command::List:
    listTree(options);
    break;
  case Command::Index:
    writeIndex(options);
    break;
  case Command::Dupes:
    showDuplicates(options);
    break;
  case Command::Size:
    showSavedSpace(options);
    break;
  case Command::Match:
    matchListing(options);
    break;
  case Command::Confirm:
    confirmIndex(options);
    break;
  case Command::Zeroes:
    dropZeroes(options);
    break;
  case Command::Find:
    findInIndex(options);
    break;
  case Command::ListDirs:
    listDuplicateDirectories(options);
    break;
  case Command::Echo:
    echo(options);
    break;
  case Command::Help:
    std::cout << usageText();
    break;
  }
  return 0;
}

int Application::execute(const CliOptions &options) {
  try {
    return run(options);
  } catch (const IndexError &e) {
    LOG_DEBUG << "failed with " << indexErrorKindToString(e.kind());
    LOG_ERROR << e.what();
  } catch (const std::exception &e) {
    LOG_FATAL << e.what();
  }
  return EXIT_FAILURE;
}

std::filesystem::path Application::rootOf(const CliOptions &options) {
  if (options.root) {
    return *options.root;
  }
  try {
    return std::filesystem::current_path();
  } catch (const std::filesystem::filesystem_error &e) {
    throw IndexError::fromFilesystemError(e);
  }
}

DigestIndex Application::loadIndex(const std::optional<std::filesystem::path> &input,
                                   bool withDupes) {
  InputSource in = InputSource::open(input);
  LOG_DEBUG << "reading index from " << in.name();
  DigestIndex index = DigestIndex::fromListing(readListing(in.stream()), withDupes);
  LOG_INFO << "loaded " << index.size() << " items with " << index.countDupes()
           << " dupes";
  return index;
}

void Application::saveIndex(const CliOptions &options, const DigestIndex &index) {
  OutputSink out = OutputSink::open(options.output);
  LOG_DEBUG << "writing index to " << out.name();
  writeDigestIndex(out.stream(), index);
  out.finish();
}

TreeIndex Application::indexTree(const CliOptions &options,
                                 std::uint64_t maxSize) const {
  std::filesystem::path root = rootOf(options);

  IndexerOptions indexer_options = options.indexer;
  indexer_options.maxSize = std::min(indexer_options.maxSize, maxSize);

  Sha256 hasher(options.fast);
  TreeIndexer indexer(hasher, indexer_options);

  LOG_DEBUG << "[SCAN] " << root.string() << (options.fast ? " (fast)" : "")
            << " with " << indexer_options.jobs << " job(s)";
  TreeIndex index = indexer.buildIndex(
      root, [](int count) { LOG_TRACE << "[DGST] " << count << " files"; });
  LOG_INFO << "indexed " << index.size() << " files, " << index.totalBytes()
           << " bytes";
  return index;
}

void Application::listTree(const CliOptions &options) {
  TreeIndex index = indexTree(options, options.indexer.maxSize);

  OutputSink out = OutputSink::open(options.output);
  LOG_DEBUG << "writing listing to " << out.name();
  writeListing(out.stream(), index);
  out.finish();
}

void Application::writeIndex(const CliOptions &options) {
  TreeIndex index = indexTree(options, options.indexer.maxSize);
  saveIndex(options, DigestIndex::fromTreeIndex(index, options.withDupes));
}

void Application::showDuplicates(const CliOptions &options) {
  TreeIndex index = indexTree(options, options.indexer.maxSize);
  auto groups = DuplicateFinder::findDuplicates(index);
  LOG_INFO << groups.size() << " duplicate groups found";

  OutputSink out = OutputSink::open(options.output);
  for (const auto &group : groups) {
    out.stream() << group.digest.toHex() << ' ' << group.size << '\n';
    for (const auto &path : group.paths) {
      out.stream() << "  " << path << '\n';
    }
  }
  out.finish();
}

void Application::showSavedSpace(const CliOptions &options) {
  std::uint64_t saved = 0;
  if (options.fromIndex) {
    DigestIndex index = loadIndex(options.input, true);
    for (const auto &[key, record] : index) {
      LOG_TRACE << record.wastedSpace() << " saved " << record.path;
    }
    saved = index.wastedSpace();
  } else {
    TreeIndex index = indexTree(options, options.indexer.maxSize);
    auto groups = DuplicateFinder::findDuplicates(index);
    for (const auto &group : groups) {
      LOG_TRACE << group.wastedSpace << " saved " << group.paths.front();
    }
    saved = DuplicateFinder::calculateWastedSpace(groups);
  }

  OutputSink out = OutputSink::open(options.output);
  out.stream() << "Total saved " << formatSavedSize(saved) << '\n';
  out.finish();
}

void Application::matchListing(const CliOptions &options) {
  DigestIndex listed = loadIndex(options.input, true);

  TreeIndex index;
  if (!listed.empty()) {
    // files larger than every listed one cannot match
    index = indexTree(options, listed.maxFileSize());
  }

  OutputSink out = OutputSink::open(options.output);
  int matches = 0;
  for (const auto &[path, entry] : index) {
    const DigestRecord *record = listed.find(entry.getDigest(), entry.getSize());
    if (record == nullptr) {
      continue;
    }
    out.stream() << record->path << ' ' << path << '\n';
    for (const auto &dupe : record->dupes) {
      out.stream() << dupe << ' ' << path << '\n';
    }
    matches++;
  }
  LOG_INFO << matches << " matching files found";
  out.finish();
}

void Application::confirmIndex(const CliOptions &options) {
  DigestIndex candidates = loadIndex(options.input, true);

  Sha256 hasher;
  DigestIndex confirmed = confirmDuplicates(candidates, rootOf(options), hasher);
  LOG_INFO << "confirmed " << confirmed.countDupes() << " of "
           << candidates.countDupes() << " dupes";

  saveIndex(options, confirmed);
}

void Application::dropZeroes(const CliOptions &options) {
  DigestIndex index = loadIndex(options.input, true);
  DigestIndex kept = index.withoutEmptyFiles();
  LOG_DEBUG << "removed " << index.size() - kept.size()
            << " zero length records";
  saveIndex(options, kept);
}

void Application::findInIndex(const CliOptions &options) {
  DigestIndex needle = loadIndex(options.input, false);
  DigestIndex haystack = loadIndex(options.haystack, true);

  DigestIndex found = findInHaystack(needle, haystack);
  LOG_INFO << found.size() << " needle files found in the haystack";
  saveIndex(options, found);
}

void Application::listDuplicateDirectories(const CliOptions &options) {
  DigestIndex index = loadIndex(options.input, true);
  std::set<std::string> dirs = index.duplicateDirectories();
  LOG_DEBUG << "found " << dirs.size() << " directories holding dupes";

  OutputSink out = OutputSink::open(options.output);
  for (const auto &dir : dirs) {
    out.stream() << dir << '\n';
  }
  out.finish();
}

void Application::echo(const CliOptions &options) {
  InputSource in = InputSource::open(options.input);
  OutputSink out = OutputSink::open(options.output);
  LOG_DEBUG << "echoing " << in.name() << " to " << out.name();

  std::vector<char> buffer(64 * 1024);
  while (in.stream().read(buffer.data(),
                          static_cast<std::streamsize>(buffer.size())) ||
         in.stream().gcount() > 0) {
    out.stream().write(buffer.data(), in.stream().gcount());
  }
  if (in.stream().bad()) {
    throw IndexError::io(in.isStandardStream() ? std::filesystem::path()
                                               : std::filesystem::path(in.name()),
                         lastErrorCode());
  }
  out.finish();
}
