/**
 * @file indexerror.hpp
 * @brief Error type shared by every treeindex operation
 *
 * All failures of the library surface as an IndexError carrying one of a
 * closed set of kinds. Lower-level causes (std::error_code,
 * std::filesystem::filesystem_error) are converted at the library boundary
 * so callers switch on kind() instead of inspecting raw system errors.
 */

#ifndef INDEXERROR_HPP
#define INDEXERROR_HPP

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

class IndexError : public std::runtime_error {
public:
  enum class Kind {
    NotFound,      ///< root path does not exist
    NotADirectory, ///< root path exists but is not a directory
    Io,            ///< any filesystem failure on a specific path
    InvalidFormat  ///< malformed listing input
  };

  IndexError(Kind kind, std::filesystem::path path, std::error_code code,
             const std::string &detail = "");

  static IndexError notFound(const std::filesystem::path &path);
  static IndexError notADirectory(const std::filesystem::path &path);
  static IndexError io(const std::filesystem::path &path, std::error_code code);

  /**
   * @brief Converts a filesystem_error, keeping its first path and code
   */
  static IndexError fromFilesystemError(const std::filesystem::filesystem_error &e);

  /**
   * @brief Parse failure; @p detail names the offending line
   */
  static IndexError invalidFormat(const std::string &detail);

  Kind kind() const { return m_kind; }
  const std::filesystem::path &path() const { return m_path; }
  std::error_code code() const { return m_code; }

private:
  Kind m_kind;
  std::filesystem::path m_path;
  std::error_code m_code;
};

/**
 * @brief Human readable name of an error kind
 */
const char *indexErrorKindToString(IndexError::Kind kind);

/**
 * @brief The calling thread's errno as an error_code
 *
 * Falls back to std::errc::io_error when errno is not set, so a failed
 * stream operation always yields a meaningful code.
 */
std::error_code lastErrorCode();

#endif // INDEXERROR_HPP
