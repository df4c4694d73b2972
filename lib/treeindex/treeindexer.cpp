/**
 * @file treeindexer.cpp
 * @brief Implementation of the directory walk and digest index construction
 */

#include "treeindexer.hpp"
#include "indexerror.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <deque>
#include <exception>
#include <future>
#include <mutex>

#include <sys/stat.h>

namespace fs = std::filesystem;

namespace {

bool isWithin(const fs::path &root, const fs::path &target) {
  fs::path rel = target.lexically_relative(root);
  return !rel.empty() && *rel.begin() != "..";
}

TreeEntry::TimePoint toTimePoint(const struct timespec &ts) {
  auto since_epoch = std::chrono::seconds(ts.tv_sec) +
                     std::chrono::nanoseconds(ts.tv_nsec);
  return TreeEntry::TimePoint(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(
          since_epoch));
}

} // namespace

/**
 * @brief Walks a directory tree and builds its digest index
 *
 * Runs in two phases. The walk collects every regular file (after applying
 * the symlink policy) and sorts the candidates by relative path. The hashing
 * phase then digests the candidates either sequentially or, when
 * IndexerOptions::jobs is above one, on a bounded set of workers.
 *
 * @param root The directory to index
 * @param progress Optional callback receiving the number of files digested
 *
 * @return TreeIndex with one entry per regular file
 *
 * @see collectFiles()
 * @see processFile()
 */
TreeIndex TreeIndexer::buildIndex(const fs::path &root,
                                  ProgressCallback progress) const {
  fs::path resolved = resolveRoot(root);
  std::vector<Candidate> files = collectFiles(resolved);

  std::vector<std::optional<TreeEntry>> results =
      m_options.jobs > 1 ? hashParallel(files, progress)
                         : hashSequential(files, progress);

  TreeIndex::Map entries;
  for (auto &result : results) {
    if (result) {
      std::string key = result->getRelativePath();
      entries.emplace(std::move(key), std::move(*result));
    }
  }
  return TreeIndex(std::move(entries));
}

fs::path TreeIndexer::resolveRoot(const fs::path &root) const {
  if (root.empty()) {
    throw IndexError::notFound(root);
  }

  std::error_code ec;
  fs::path absolute = fs::absolute(root, ec);
  if (ec) {
    throw IndexError::io(root, ec);
  }

  fs::file_status status = fs::status(absolute, ec);
  if (status.type() == fs::file_type::not_found) {
    throw IndexError::notFound(absolute);
  }
  if (ec) {
    throw IndexError::io(absolute, ec);
  }
  if (!fs::is_directory(status)) {
    throw IndexError::notADirectory(absolute);
  }

  fs::path canonical = fs::canonical(absolute, ec);
  if (ec) {
    throw IndexError::io(absolute, ec);
  }
  return canonical;
}

/**
 * @brief Collects the regular files of a tree in sorted order
 *
 * Breadth-first walk with a work queue of directories. Children of each
 * directory are visited by name so that listing errors surface in a stable
 * order. Directories are queued, regular files become candidates, symlinks
 * go through resolveLink() unless the policy is Skip, and everything else
 * (fifos, sockets, devices) is ignored.
 */
std::vector<TreeIndexer::Candidate>
TreeIndexer::collectFiles(const fs::path &root) const {
  std::vector<Candidate> files;
  std::deque<fs::path> queue;
  queue.push_back(root);

  while (!queue.empty()) {
    fs::path dir = queue.front();
    queue.pop_front();

    std::error_code ec;
    std::vector<fs::directory_entry> children;
    fs::directory_iterator it(dir, ec);
    if (ec) {
      throw IndexError::io(dir, ec);
    }
    for (fs::directory_iterator end; it != end;) {
      children.push_back(*it);
      it.increment(ec);
      if (ec) {
        throw IndexError::io(dir, ec);
      }
    }

    std::sort(children.begin(), children.end(),
              [](const fs::directory_entry &a, const fs::directory_entry &b) {
                return a.path().filename() < b.path().filename();
              });

    for (const auto &entry : children) {
      fs::file_status link_status = entry.symlink_status(ec);
      if (ec) {
        throw IndexError::io(entry.path(), ec);
      }

      std::string relative = entry.path().lexically_relative(root).generic_string();

      if (fs::is_symlink(link_status)) {
        if (m_options.symlinks == SymlinkPolicy::Skip) {
          continue;
        }
        if (auto target = resolveLink(entry.path(), root)) {
          files.push_back({relative, entry.path(), *target});
        }
      } else if (fs::is_directory(link_status)) {
        queue.push_back(entry.path());
      } else if (fs::is_regular_file(link_status)) {
        files.push_back({relative, entry.path(), entry.path()});
      }
    }
  }

  std::sort(files.begin(), files.end(),
            [](const Candidate &a, const Candidate &b) {
              return a.relativePath < b.relativePath;
            });
  return files;
}

std::optional<fs::path> TreeIndexer::resolveLink(const fs::path &link,
                                                 const fs::path &root) const {
  std::error_code ec;
  fs::path target = fs::canonical(link, ec);
  if (ec) {
    return std::nullopt; // dangling or looping
  }
  if (!isWithin(root, target)) {
    return std::nullopt;
  }
  fs::file_status status = fs::status(target, ec);
  if (ec || !fs::is_regular_file(status)) {
    return std::nullopt;
  }
  return target;
}

std::optional<TreeEntry> TreeIndexer::processFile(const Candidate &file) const {
  struct stat st;
  errno = 0;
  if (::stat(file.contentPath.c_str(), &st) != 0) {
    throw IndexError::io(file.location, lastErrorCode());
  }

  auto size = static_cast<std::uint64_t>(st.st_size);
  if (size > m_options.maxSize) {
    return std::nullopt;
  }

  Digest digest = hashCalculator.calculateHash(file.contentPath);
  return TreeEntry(file.relativePath, digest, size, toTimePoint(st.st_mtim));
}

std::vector<std::optional<TreeEntry>>
TreeIndexer::hashSequential(const std::vector<Candidate> &files,
                            const ProgressCallback &progress) const {
  std::vector<std::optional<TreeEntry>> results;
  results.reserve(files.size());
  int count = 0;

  for (const auto &file : files) {
    results.push_back(processFile(file));

    if (progress && ++count % 100 == 0) { // Update every 100 files
      progress(count);
    }
  }

  if (progress) {
    progress(static_cast<int>(files.size()));
  }
  return results;
}

/**
 * @brief Digests candidates on up to IndexerOptions::jobs workers
 *
 * Workers claim candidates in sorted order from a shared cursor and write
 * into their own result slot. Once any candidate fails no new candidates are
 * claimed. Every candidate before a failing one has already been claimed
 * and is finished by its worker, so the error rethrown (the lowest failing
 * index) is the same one the sequential walk would report.
 */
std::vector<std::optional<TreeEntry>>
TreeIndexer::hashParallel(const std::vector<Candidate> &files,
                          const ProgressCallback &progress) const {
  std::vector<std::optional<TreeEntry>> results(files.size());
  std::vector<std::exception_ptr> errors(files.size());

  std::atomic<std::size_t> next{0};
  std::atomic<bool> failed{false};
  int count = 0; // guarded by progress_mutex
  std::mutex progress_mutex;

  auto worker = [&]() {
    while (!failed.load()) {
      std::size_t i = next.fetch_add(1);
      if (i >= files.size()) {
        return;
      }
      try {
        results[i] = processFile(files[i]);
      } catch (...) {
        errors[i] = std::current_exception();
        failed.store(true);
        return;
      }
      if (progress) {
        std::lock_guard<std::mutex> lock(progress_mutex);
        if (++count % 100 == 0) {
          progress(count);
        }
      }
    }
  };

  std::size_t workers = std::min<std::size_t>(m_options.jobs, files.size());
  std::vector<std::future<void>> futures;
  futures.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    futures.push_back(std::async(std::launch::async, worker));
  }
  for (auto &future : futures) {
    future.get();
  }

  for (const auto &error : errors) {
    if (error) {
      std::rethrow_exception(error);
    }
  }

  if (progress) {
    progress(static_cast<int>(files.size()));
  }
  return results;
}
