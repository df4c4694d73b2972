/**
 * @file treeindexer.hpp
 * @brief Directory walking and digest index construction
 *
 * This header defines the TreeIndexer class which walks a directory tree,
 * digests every regular file and collects the results into a TreeIndex.
 */

#ifndef TREEINDEXER_HPP
#define TREEINDEXER_HPP

#include <cstdint>
#include <filesystem>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include "ihashcalculator.hpp"
#include "treeindex.hpp"

/**
 * @brief How the walk treats symbolic links
 */
enum class SymlinkPolicy {
  /**
   * A link whose fully resolved target is a regular file inside the root is
   * indexed under the link's own path with the target's content. Links to
   * directories are never traversed. Links resolving outside the root, and
   * links that cannot be resolved at all (dangling, loops), are skipped.
   */
  WithinRoot,
  /** Every symbolic link is ignored. */
  Skip
};

/**
 * @brief Tuning knobs for TreeIndexer
 */
struct IndexerOptions {
  SymlinkPolicy symlinks = SymlinkPolicy::WithinRoot;

  /** Files larger than this are left out of the index. */
  std::uint64_t maxSize = std::numeric_limits<std::uint64_t>::max();

  /** Number of files hashed concurrently; 0 and 1 both mean sequential. */
  unsigned jobs = 1;
};

/**
 * @class TreeIndexer
 * @brief Builds a TreeIndex for a directory tree
 *
 * TreeIndexer resolves the root to an absolute canonical path, walks it
 * breadth first with each directory's children sorted by name, and digests
 * every regular file with the injected IHashCalculator. Size and modification
 * time come from the file's metadata.
 *
 * Key properties:
 * - Read-only: the tree is never modified
 * - Deterministic: candidates are sorted by relative path before hashing
 * - Fail-fast: the first error aborts the walk, no partial index is returned
 * - The result is identical for every value of IndexerOptions::jobs
 *
 * TreeIndexer does not log; progress is reported through the optional
 * callback only.
 *
 * @see TreeIndex
 * @see IHashCalculator
 * @see SymlinkPolicy
 */
class TreeIndexer {
private:
  /** @brief Hash calculator used for computing file digests */
  const IHashCalculator &hashCalculator;

  IndexerOptions m_options;

  /**
   * @brief A regular file found by the walk, not yet digested
   */
  struct Candidate {
    /** @brief Key in the resulting index, '/' separated */
    std::string relativePath;
    /** @brief Path as encountered under the root; named in errors */
    std::filesystem::path location;
    /** @brief File whose content is read (the target for a symlink) */
    std::filesystem::path contentPath;
  };

public:
  /**
   * @brief Callback function type for progress notifications
   *
   * Function signature: void(int count)
   * - count: Number of files digested so far
   *
   * Invoked every 100 files and once at the end. With more than one job the
   * callback is called from worker threads, serialized by a mutex; counts
   * still arrive in increasing order.
   */
  using ProgressCallback = std::function<void(int count)>;

  /**
   * @brief Constructs a TreeIndexer with the specified hash calculator
   *
   * @param calculator Reference to hash calculator implementation (e.g., Sha256)
   * @param options Symlink policy, size limit and parallelism
   *
   * @note The calculator reference must remain valid for the lifetime of the
   *       TreeIndexer object
   */
  explicit TreeIndexer(const IHashCalculator &calculator,
                       IndexerOptions options = IndexerOptions())
      : hashCalculator(calculator), m_options(options) {}

  /**
   * @brief Walks @p root and returns one entry per regular file
   *
   * @param root Directory to index; relative paths are resolved against the
   *             current working directory
   * @param progress Optional callback for progress updates (default: nullptr)
   *
   * @return TreeIndex keyed by path relative to @p root
   *
   * @throws IndexError NotFound if @p root is empty or does not exist
   * @throws IndexError NotADirectory if @p root is not a directory
   * @throws IndexError Io on the first directory listing, metadata or read
   *         failure, naming the offending path
   */
  TreeIndex buildIndex(const std::filesystem::path &root,
                       ProgressCallback progress = nullptr) const;

  const IndexerOptions &options() const { return m_options; }

private:
  std::filesystem::path resolveRoot(const std::filesystem::path &root) const;

  /**
   * @brief Lists every regular file under @p root, sorted by relative path
   *
   * Applies the symlink policy. Directory listing failures throw IndexError.
   */
  std::vector<Candidate> collectFiles(const std::filesystem::path &root) const;

  /**
   * @brief Resolves a symlink under the WithinRoot policy
   * @return The canonical target if it is a regular file inside @p root
   */
  std::optional<std::filesystem::path>
  resolveLink(const std::filesystem::path &link,
              const std::filesystem::path &root) const;

  /**
   * @brief Reads metadata and digests one file
   * @return std::nullopt if the file exceeds IndexerOptions::maxSize
   */
  std::optional<TreeEntry> processFile(const Candidate &file) const;

  std::vector<std::optional<TreeEntry>>
  hashSequential(const std::vector<Candidate> &files,
                 const ProgressCallback &progress) const;

  std::vector<std::optional<TreeEntry>>
  hashParallel(const std::vector<Candidate> &files,
               const ProgressCallback &progress) const;
};

#endif // TREEINDEXER_HPP
