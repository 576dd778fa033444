#ifndef FILE_UTILS_HPP
#define FILE_UTILS_HPP

#include <string>

/**
 * @namespace FileUtils
 * @brief Path helpers for locating configuration files and writing output pages.
 */
namespace FileUtils {
    /**
     * @brief Creates @p path and any missing parents.
     * @return true if the directory exists afterwards.
     */
    bool ensureDirectoryExists(const std::string& path);

    /**
     * @brief Creates the directory a file is about to be written into.
     * @return true if there is nothing to create or creation succeeded.
     */
    bool ensureParentDirectoryExists(const std::string& filepath);

    /**
     * @brief Closest directory, starting at the working directory and walking up at most
     * five levels, that holds data/, include/ and src/.
     * @return Absolute, normalised path; the working directory if no such directory exists.
     */
    std::string getProjectRoot();

    /** @brief path1 / path2, normalised. A leading '/' on path2 is ignored. */
    std::string joinPaths(const std::string& path1, const std::string& path2);

    bool fileExists(const std::string& path);
}

#endif
