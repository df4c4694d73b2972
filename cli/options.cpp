#include "options.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace {

Command parseCommand(const std::string &name) {
  if (name == "list")
    return Command::List;
  if (name == "index")
    return Command::Index;
  if (name == "dupes")
    return Command::Dupes;
  if (name == "size")
    return Command::Size;
  if (name == "match")
    return Command::Match;
  if (name == "confirm")
    return Command::Confirm;
  if (name == "zeroes")
    return Command::Zeroes;
  if (name == "find")
    return Command::Find;
  if (name == "listdirs")
    return Command::ListDirs;
  if (name == "echo")
    return Command::Echo;
  throw UsageError("unknown command: " + name);
}

unsigned parseJobs(const std::string &value) {
  bool digits = !value.empty() &&
                std::all_of(value.begin(), value.end(), [](unsigned char c) {
                  return std::isdigit(c) != 0;
                });
  if (!digits || value.size() > 4) {
    throw UsageError("invalid job count: " + value);
  }
  unsigned jobs = static_cast<unsigned>(std::stoul(value));
  if (jobs == 0) {
    throw UsageError("job count must be at least 1");
  }
  return jobs;
}

// -v, -vv, -vvv ...
bool isVerboseCluster(const std::string &arg) {
  return arg.size() >= 2 && arg[0] == '-' &&
         std::all_of(arg.begin() + 1, arg.end(), [](char c) { return c == 'v'; });
}

// Assigns positional arguments in the order the command expects them
void assignPositionals(CliOptions &options,
                       const std::vector<std::string> &positionals) {
  std::vector<std::optional<std::filesystem::path> *> slots;
  switch (options.command) {
  case Command::Size:
    if (options.fromIndex) {
      slots = {&options.input, &options.output};
      break;
    }
    slots = {&options.root, &options.output};
    break;
  case Command::List:
  case Command::Index:
  case Command::Dupes:
    slots = {&options.root, &options.output};
    break;
  case Command::Match:
  case Command::Confirm:
    slots = {&options.root, &options.input, &options.output};
    if (positionals.empty()) {
      throw UsageError(std::string(options.command == Command::Match
                                       ? "match"
                                       : "confirm") +
                       " requires a root directory");
    }
    break;
  case Command::Zeroes:
  case Command::ListDirs:
    slots = {&options.input, &options.output};
    break;
  case Command::Find:
    slots = {&options.input, &options.haystack, &options.output};
    if (positionals.size() < 2) {
      throw UsageError("find requires a needle and a haystack index");
    }
    break;
  case Command::Echo:
    slots = {&options.input};
    break;
  case Command::Help:
    return;
  }

  if (positionals.size() > slots.size()) {
    throw UsageError("too many arguments");
  }
  for (std::size_t i = 0; i < positionals.size(); ++i) {
    *slots[i] = std::filesystem::path(positionals[i]);
  }
}

} // namespace

CliOptions parseArguments(int argc, const char *const argv[]) {
  CliOptions options;
  std::vector<std::string> positionals;
  bool have_command = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    auto value = [&]() -> std::string {
      if (i + 1 >= argc) {
        throw UsageError("missing value for " + arg);
      }
      return argv[++i];
    };

    if (arg == "-h" || arg == "--help") {
      options.command = Command::Help;
      return options;
    } else if (arg == "-q" || arg == "--quiet") {
      options.quiet = true;
    } else if (arg == "--verbose") {
      options.verbosity++;
    } else if (isVerboseCluster(arg)) {
      options.verbosity += static_cast<int>(arg.size() - 1);
    } else if (arg == "--fast") {
      options.fast = true;
    } else if (arg == "--dupes") {
      options.withDupes = true;
    } else if (arg == "--from-index") {
      options.fromIndex = true;
    } else if (arg == "--skip-symlinks") {
      options.indexer.symlinks = SymlinkPolicy::Skip;
    } else if (arg == "-j" || arg == "--jobs") {
      options.indexer.jobs = parseJobs(value());
    } else if (arg == "-o" || arg == "--output") {
      options.output = std::filesystem::path(value());
    } else if (arg.size() > 1 && arg[0] == '-') {
      throw UsageError("unknown option: " + arg);
    } else if (!have_command) {
      options.command = parseCommand(arg);
      have_command = true;
    } else {
      positionals.push_back(arg);
    }
  }

  if (!have_command) {
    throw UsageError("missing command");
  }
  if (options.output && options.command != Command::Echo) {
    throw UsageError("-o is only valid for echo");
  }
  if (options.withDupes && options.command != Command::Index) {
    throw UsageError("--dupes is only valid for index");
  }
  if (options.fromIndex && options.command != Command::Size) {
    throw UsageError("--from-index is only valid for size");
  }
  assignPositionals(options, positionals);
  return options;
}

const char *usageText() {
  return "usage: treetool [-q|--quiet] [-v|--verbose ...] <command> [options]\n"
         "\n"
         "commands:\n"
         "  list     [root] [output]           list digest, size and path of every file\n"
         "  index    [--dupes] [root] [output] one line per distinct content, with\n"
         "                                     --dupes its other paths as '- <path>'\n"
         "  dupes    [root] [output]           list groups of identical files\n"
         "  size     [root] [output]           total space taken by duplicates\n"
         "  size     --from-index [input] [output]\n"
         "                                     the same total, read from an index\n"
         "  match    <root> [input] [output]   find files under root matching a listing\n"
         "  confirm  <root> [input] [output]   re-digest the dupes of an index in full\n"
         "  zeroes   [input] [output]          drop zero-length files from an index\n"
         "  find     <needle> <haystack> [output]\n"
         "                                     find the needle's files in the haystack\n"
         "  listdirs [input] [output]          directories holding dupes\n"
         "  echo     [-o output] [input]       copy input to output\n"
         "\n"
         "scan options:\n"
         "  --fast            digest only the first and last MiB of large files\n"
         "  --skip-symlinks   ignore every symbolic link\n"
         "  -j, --jobs N      hash N files concurrently\n"
         "\n"
         "paths in an index are relative to the root that was scanned; confirm\n"
         "resolves them against its root.\n"
         "root defaults to the current directory; input and output default to\n"
         "stdin and stdout, '-' also selects the standard stream.\n";
}
