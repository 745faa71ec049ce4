/**
 * @file group_discoverer.hpp
 * @brief Partitions directory trees and ZIP archives into image groups.
 */

#ifndef MING_GROUP_DISCOVERER_HPP
#define MING_GROUP_DISCOVERER_HPP

#include "errors.hpp"
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ming {

/**
 * @brief Kind of a user-supplied input path.
 */
enum class InputKind {
    ZipFile,
    Directory
};

/**
 * @brief A classified input path.
 */
struct InputItem {
    std::filesystem::path path;
    InputKind kind = InputKind::Directory;
};

/**
 * @brief Classifies @p path.
 *
 * A directory is a Directory input; a regular file with a ".zip"
 * extension (any case) is a ZipFile. A regular file without an extension
 * whose content is detected as application/zip is accepted as well.
 *
 * @return std::nullopt for anything else, including missing paths.
 */
[[nodiscard]] std::optional<InputItem> classify_input(const std::filesystem::path& path);

/**
 * @brief Where the images of a group live.
 */
enum class GroupSource {
    Directory, ///< loose files on disk
    Zip        ///< entries of an archive
};

/**
 * @brief Images residing directly in one physical or virtual directory.
 *
 * Never empty. One group becomes one PDF.
 */
struct ImageGroup {
    GroupSource source = GroupSource::Directory;
    std::filesystem::path origin;     ///< Input directory, or the archive for Zip groups
    std::string key;                  ///< Relative directory, '/' separated, "" for the root
    std::vector<std::string> images;  ///< File paths (Directory) or entry names (Zip), sorted
    std::string output_base_name;     ///< PDF name without extension
};

/**
 * @brief Groups and the non-fatal errors met while finding them.
 */
struct DiscoveryResult {
    std::vector<ImageGroup> groups;
    std::vector<ConversionError> errors;

    [[nodiscard]] std::size_t image_count() const noexcept;
};

/**
 * @brief Finds image groups.
 *
 * Directory inputs contribute the groups of every archive found anywhere
 * in the tree first (archives ordered by path), followed by the loose
 * image groups ordered by relative path. Junk files (resource forks,
 * .DS_Store, desktop.ini, __MACOSX/ entries) are ignored.
 *
 * Discovery never throws for per-entry problems: an unreadable archive is
 * one Archive error, an unreadable directory one Filesystem error.
 */
class GroupDiscoverer {
public:
    /// Dispatches on the input kind.
    [[nodiscard]] static DiscoveryResult discover(const InputItem& input);

    /// Groups of a single archive, in order of first occurrence.
    [[nodiscard]] static DiscoveryResult discover_zip(const std::filesystem::path& zip_path);

    /// Archive groups, then loose-image groups of a directory tree.
    [[nodiscard]] static DiscoveryResult discover_directory(const std::filesystem::path& root);

    /// Group key of a ZIP entry name: everything before the last '/'.
    [[nodiscard]] static std::string zip_group_key(const std::string& entry_name);

    /// True for __MACOSX/ entries and resource-fork names.
    [[nodiscard]] static bool is_junk_entry(const std::string& entry_name);
};

} // namespace ming

#endif // MING_GROUP_DISCOVERER_HPP
