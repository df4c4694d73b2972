/**
 * @file indexerror.cpp
 * @brief Construction and message formatting for IndexError
 */

#include "indexerror.hpp"

#include <cerrno>

namespace {

// "<kind>[: <path>][: <system message>][: <detail>]"
std::string buildMessage(IndexError::Kind kind,
                         const std::filesystem::path &path,
                         std::error_code code, const std::string &detail) {
  std::string message = indexErrorKindToString(kind);
  if (!path.empty()) {
    message += ": " + path.string();
  }
  if (code) {
    message += ": " + code.message();
  }
  if (!detail.empty()) {
    message += ": " + detail;
  }
  return message;
}

} // namespace

IndexError::IndexError(Kind kind, std::filesystem::path path,
                       std::error_code code, const std::string &detail)
    : std::runtime_error(buildMessage(kind, path, code, detail)), m_kind(kind),
      m_path(std::move(path)), m_code(code) {}

IndexError IndexError::notFound(const std::filesystem::path &path) {
  return IndexError(Kind::NotFound, path,
                    std::make_error_code(std::errc::no_such_file_or_directory));
}

IndexError IndexError::notADirectory(const std::filesystem::path &path) {
  return IndexError(Kind::NotADirectory, path,
                    std::make_error_code(std::errc::not_a_directory));
}

IndexError IndexError::io(const std::filesystem::path &path,
                          std::error_code code) {
  return IndexError(Kind::Io, path, code);
}

IndexError
IndexError::fromFilesystemError(const std::filesystem::filesystem_error &e) {
  if (e.code() == std::errc::no_such_file_or_directory) {
    return IndexError(Kind::NotFound, e.path1(), e.code());
  }
  return IndexError(Kind::Io, e.path1(), e.code());
}

IndexError IndexError::invalidFormat(const std::string &detail) {
  return IndexError(Kind::InvalidFormat, {}, {}, detail);
}

const char *indexErrorKindToString(IndexError::Kind kind) {
  switch (kind) {
  case IndexError::Kind::NotFound:
    return "Not found";
  case IndexError::Kind::NotADirectory:
    return "Not a directory";
  case IndexError::Kind::Io:
    return "I/O error";
  case IndexError::Kind::InvalidFormat:
    return "Invalid format";
  default:
    return "Unknown error";
  }
}

std::error_code lastErrorCode() {
  int err = errno;
  if (err == 0) {
    return std::make_error_code(std::errc::io_error);
  }
  return std::error_code(err, std::generic_category());
}
