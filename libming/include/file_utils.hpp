/**
 * @file file_utils.hpp
 * @brief Small filesystem helpers shared by the codec, the PDF writer and cleanup.
 */

#ifndef MING_FILE_UTILS_HPP
#define MING_FILE_UTILS_HPP

#include <cstdio>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ming {

    /**
     * @brief Opens a file using a filesystem path, handling Windows Unicode correctly.
     * @param path The path to the file.
     * @param mode The standard C fopen mode string (e.g., "rb", "wb").
     * @return FILE* pointer or nullptr if open failed.
     */
    FILE *open_file(const std::filesystem::path &path, const char *mode);

    /**
     * @brief Reads a whole file into memory.
     * @throws FilesystemError if the file cannot be opened or read completely.
     */
    std::vector<unsigned char> read_file_bytes(const std::filesystem::path &path);

    /**
     * @brief Writes bytes to @p target through a sibling temporary file.
     *
     * The data is flushed and synced before the temporary file is renamed
     * onto @p target, so a successful return means the file is complete
     * on disk.
     *
     * @throws WriteError on any failure; the temporary file is removed.
     */
    void write_file_durably(const std::filesystem::path &target,
                            std::span<const unsigned char> data);

    /**
     * @brief Deletes one file, logging instead of throwing.
     * @return true if the file no longer exists.
     */
    bool remove_file_logged(const std::filesystem::path &path,
                            std::string_view tag = "file_utils");

    /**
     * @brief Removes every directory of the tree rooted at @p root that is
     * empty, deepest first, @p root included.
     *
     * Directories that still contain anything survive; failures are
     * tolerated silently.
     *
     * @return Number of directories removed.
     */
    std::size_t prune_empty_directories(const std::filesystem::path &root);

    /// ASCII lower-case copy.
    std::string to_lower_copy(std::string s);

    /// True if the name starts with "._" or is ".DS_Store" / "desktop.ini".
    bool is_junk_name(std::string_view file_name);

} // namespace ming

#endif // MING_FILE_UTILS_HPP
