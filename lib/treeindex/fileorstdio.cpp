#include "fileorstdio.hpp"
#include "indexerror.hpp"

#include <cerrno>
#include <iostream>

bool isStdioPath(const std::optional<std::filesystem::path> &path) {
  return !path || path->empty() || *path == "-";
}

InputSource
InputSource::open(const std::optional<std::filesystem::path> &path) {
  if (isStdioPath(path)) {
    return InputSource(nullptr, "stdin");
  }

  errno = 0;
  auto file = std::make_unique<std::ifstream>(*path, std::ios::binary);
  if (!*file) {
    throw IndexError::io(*path, lastErrorCode());
  }
  return InputSource(std::move(file), path->string());
}

std::istream &InputSource::stream() {
  if (m_file) {
    return *m_file;
  }
  return std::cin;
}

OutputSink OutputSink::open(const std::optional<std::filesystem::path> &path) {
  if (isStdioPath(path)) {
    return OutputSink(nullptr, "stdout");
  }

  errno = 0;
  auto file = std::make_unique<std::ofstream>(
      *path, std::ios::binary | std::ios::trunc);
  if (!*file) {
    throw IndexError::io(*path, lastErrorCode());
  }
  return OutputSink(std::move(file), path->string());
}

std::ostream &OutputSink::stream() {
  if (m_file) {
    return *m_file;
  }
  return std::cout;
}

void OutputSink::finish() {
  errno = 0;
  stream().flush();
  if (!stream()) {
    throw IndexError::io(m_file ? std::filesystem::path(m_name)
                                : std::filesystem::path(),
                         lastErrorCode());
  }
}
