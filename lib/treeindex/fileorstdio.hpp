/**
 * @file fileorstdio.hpp
 * @brief "Named file or standard stream" arguments for command line tools
 *
 * Many commands take an optional input and an optional output argument.
 * When the argument is absent, or is the single character "-", the standard
 * stream is used; otherwise the named file is opened. InputSource and
 * OutputSink hide that choice behind a plain std::istream / std::ostream.
 *
 * Example usage:
 * @code
 * auto in = InputSource::open(input_arg);
 * auto out = OutputSink::open(output_arg);
 * out.stream() << in.stream().rdbuf();
 * out.finish();
 * @endcode
 */

#ifndef FILEORSTDIO_HPP
#define FILEORSTDIO_HPP

#include <filesystem>
#include <fstream>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

/**
 * @brief True when @p path selects the standard stream (absent or "-")
 */
bool isStdioPath(const std::optional<std::filesystem::path> &path);

class InputSource {
public:
  /**
   * @brief Opens the named file in binary mode, or selects stdin
   * @throws IndexError Io if the file cannot be opened
   */
  static InputSource open(const std::optional<std::filesystem::path> &path);

  std::istream &stream();

  /** @brief "stdin" or the file path, for log messages */
  const std::string &name() const { return m_name; }

  bool isStandardStream() const { return !m_file; }

private:
  InputSource(std::unique_ptr<std::ifstream> file, std::string name)
      : m_file(std::move(file)), m_name(std::move(name)) {}

  std::unique_ptr<std::ifstream> m_file;
  std::string m_name;
};

class OutputSink {
public:
  /**
   * @brief Creates or truncates the named file, or selects stdout
   * @throws IndexError Io if the file cannot be created
   */
  static OutputSink open(const std::optional<std::filesystem::path> &path);

  std::ostream &stream();

  /** @brief "stdout" or the file path, for log messages */
  const std::string &name() const { return m_name; }

  bool isStandardStream() const { return !m_file; }

  /**
   * @brief Flushes and reports any write failure
   * @throws IndexError Io if the stream is in a failed state
   */
  void finish();

private:
  OutputSink(std::unique_ptr<std::ofstream> file, std::string name)
      : m_file(std::move(file)), m_name(std::move(name)) {}

  std::unique_ptr<std::ofstream> m_file;
  std::string m_name;
};

#endif // FILEORSTDIO_HPP
