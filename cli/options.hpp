/**
 * @file options.hpp
 * @brief Command line parsing for treetool
 */

#ifndef TREETOOL_OPTIONS_HPP
#define TREETOOL_OPTIONS_HPP

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

#include "treeindexer.hpp"

enum class Command {
  Help,
  List,     ///< print the listing of a tree
  Index,    ///< print the digest index of a tree
  Dupes,    ///< print groups of identical files
  Size,     ///< print the space de-duplication would reclaim
  Match,    ///< find files under a root matching a listing
  Confirm,  ///< re-digest the dupes of an index with full SHA-256
  Zeroes,   ///< drop zero-length records from an index
  Find,     ///< look up one index's contents in another
  ListDirs, ///< print the directories holding dupes
  Echo      ///< copy input to output
};

/**
 * @brief Everything the command line configures
 *
 * Absent input/output paths (or "-") select stdin/stdout. An absent root
 * selects the current directory.
 */
struct CliOptions {
  bool quiet = false;
  int verbosity = 0;
  Command command = Command::Help;

  bool fast = false;
  IndexerOptions indexer;

  bool withDupes = false; ///< index: write "- <path>" lines
  bool fromIndex = false; ///< size: read an index instead of scanning

  std::optional<std::filesystem::path> root;
  std::optional<std::filesystem::path> input;
  std::optional<std::filesystem::path> haystack; ///< find: second index
  std::optional<std::filesystem::path> output;
};

/**
 * @brief Invalid command line; the message is shown above the usage text
 */
class UsageError : public std::runtime_error {
public:
  explicit UsageError(const std::string &message)
      : std::runtime_error(message) {}
};

/**
 * @brief Parses argv into CliOptions
 *
 * Global flags (-q, -v) may appear anywhere. -h or --help anywhere yields
 * Command::Help.
 *
 * @throws UsageError on an unknown command or flag, a missing flag value,
 *         a missing required argument or too many arguments
 */
CliOptions parseArguments(int argc, const char *const argv[]);

const char *usageText();

#endif // TREETOOL_OPTIONS_HPP
