#ifndef IHASHCALCULATOR_HPP
#define IHASHCALCULATOR_HPP

#include <filesystem>

#include "digest.hpp"

/**
 * @brief Computes the digest of a file's content
 *
 * Implementations throw IndexError (kind Io) when the file cannot be opened
 * or read. They must be safe to call concurrently from several threads.
 */
class IHashCalculator {
public:
    virtual Digest calculateHash(const std::filesystem::path& filePath) const = 0;
    virtual ~IHashCalculator() = default;
};

#endif // IHASHCALCULATOR_HPP
