#ifndef DUPLICATEFINDER_HPP
#define DUPLICATEFINDER_HPP

#include "treeindex.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Service for duplicate file detection based on file digests
 *
 * DuplicateFinder identifies duplicate files by grouping the entries of a
 * TreeIndex on their digest and size. Entries with identical digests and
 * sizes are considered duplicates. The class provides functionality to:
 * - Group duplicates by digest for further processing
 * - Calculate the disk space that de-duplication would reclaim
 *
 * @note Zero-byte files are ignored
 * @note With a fast-mode Sha256 the groups are candidates only
 *
 * @see TreeIndex
 * @see DuplicateGroup
 *
 * Example usage:
 * @code
 * TreeIndex index = indexer.buildIndex("/path");
 * auto groups = DuplicateFinder::findDuplicates(index);
 * std::uint64_t wasted = DuplicateFinder::calculateWastedSpace(groups);
 * std::cout << "Wasted space: " << wasted << " bytes\n";
 * @endcode
 */
class DuplicateFinder {
public:
    struct DuplicateGroup {
        Digest digest;
        std::uint64_t size = 0;
        std::vector<std::string> paths;  // relative paths, sorted
        std::uint64_t wastedSpace = 0;   // size * (paths - 1), keep one copy
    };

    /**
     * @brief Find groups of two or more entries sharing a digest and size
     *
     * A fast-mode digest only covers the ends of large files, so entries with
     * equal digests but different sizes are kept apart.
     *
     * @param index Index to analyze
     * @return Duplicate groups ordered by digest, then size
     */
    static std::vector<DuplicateGroup> findDuplicates(const TreeIndex& index) {
        std::map<std::pair<Digest, std::uint64_t>, std::vector<const TreeEntry*>> digestMap;

        // Group by digest and size; the index iterates in path order
        for (const auto& [path, entry] : index) {
            if (!entry.isEmpty()) {
                digestMap[{entry.getDigest(), entry.getSize()}].push_back(&entry);
            }
        }

        std::vector<DuplicateGroup> groups;
        for (const auto& [key, entries] : digestMap) {
            if (entries.size() > 1) {
                DuplicateGroup group;
                group.digest = key.first;
                group.size = key.second;

                for (const auto* entry : entries) {
                    group.paths.push_back(entry->getRelativePath());
                }

                group.wastedSpace = (entries.size() - 1) * group.size;
                groups.push_back(group);
            }
        }

        return groups;
    }

    /**
     * @brief Calculate total wasted space
     */
    static std::uint64_t calculateWastedSpace(const std::vector<DuplicateGroup>& groups) {
        std::uint64_t total = 0;
        for (const auto& group : groups) {
            total += group.wastedSpace;
        }
        return total;
    }
};

#endif // DUPLICATEFINDER_HPP
