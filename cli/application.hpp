#ifndef TREETOOL_APPLICATION_HPP
#define TREETOOL_APPLICATION_HPP

#include <cstdint>
#include <filesystem>
#include <optional>

#include "digestindex.hpp"
#include "options.hpp"
#include "treeindex.hpp"

/**
 * @class Application
 * @brief High-level entrypoint for indexing a tree and reporting on it.
 *
 * Application turns parsed CliOptions into one command:
 *  - list:     index the root and write its listing.
 *  - index:    index the root and write its DigestIndex, dupes included
 *              with --dupes.
 *  - dupes:    index the root and write every group of identical files, a
 *              header line "<digest> <size>" followed by one indented path
 *              per file.
 *  - size:     write the space removing duplicates would reclaim ("Total
 *              saved <n> <unit>"), from a scan of the root or from an index.
 *  - match:    read a listing or index, index the root skipping files
 *              larger than the largest listed one, and write "<listed path>
 *              <matching path>" for every file whose content is listed.
 *  - confirm:  re-digest an index's files under the root with full SHA-256
 *              and write the index of the dupes that still match.
 *  - zeroes:   write an index without its zero-length records.
 *  - find:     write the needle index's records found in the haystack
 *              index, with the haystack's paths as dupes.
 *  - listdirs: write the directories holding dupes, one per line.
 *  - echo:     copy input to output.
 *
 * Input and output go through InputSource / OutputSink, so every file
 * argument may also be the standard stream. Progress and decisions are
 * logged through Logger; the command's result is the only thing written to
 * the output.
 *
 * Error handling
 *  - run() lets IndexError and any other exception propagate.
 *  - execute() logs them at error severity (fatal for anything that is not
 *    an IndexError) and returns EXIT_FAILURE.
 *
 * @see TreeIndexer
 * @see DuplicateFinder
 * @see writeListing()
 */
class Application {
public:
  /**
   * @brief Runs the selected command
   * @return Process exit status for a successful run (0)
   */
  int run(const CliOptions &options);

  /**
   * @brief Runs the selected command, logging a failure instead of throwing
   * @return 0 on success, EXIT_FAILURE after a logged error
   */
  int execute(const CliOptions &options);

private:
  /**
   * @brief The root to scan, the current directory if none was given
   * @throws IndexError if the current directory cannot be determined
   */
  static std::filesystem::path rootOf(const CliOptions &options);

  static DigestIndex loadIndex(const std::optional<std::filesystem::path> &input,
                               bool withDupes);
  static void saveIndex(const CliOptions &options, const DigestIndex &index);

  TreeIndex indexTree(const CliOptions &options, std::uint64_t maxSize) const;

  void listTree(const CliOptions &options);
  void writeIndex(const CliOptions &options);
  void showDuplicates(const CliOptions &options);
  void showSavedSpace(const CliOptions &options);
  void matchListing(const CliOptions &options);
  void confirmIndex(const CliOptions &options);
  void dropZeroes(const CliOptions &options);
  void findInIndex(const CliOptions &options);
  void listDuplicateDirectories(const CliOptions &options);
  void echo(const CliOptions &options);
};

#endif // TREETOOL_APPLICATION_HPP
