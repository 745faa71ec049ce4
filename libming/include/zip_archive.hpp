/**
 * @file zip_archive.hpp
 * @brief Read-only streaming access to ZIP archives (libarchive).
 */

#ifndef MING_ZIP_ARCHIVE_HPP
#define MING_ZIP_ARCHIVE_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <span>
#include <string>
#include <unordered_set>
#include <vector>

namespace ming {

/**
 * @brief One regular-file entry of an archive.
 */
struct ZipEntry {
    std::string name;       ///< Entry path, '/' separated
    std::int64_t size = 0;  ///< Uncompressed size, 0 if unknown
};

/**
 * @brief Streaming view over a ZIP file.
 *
 * Nothing is ever extracted to disk: every call opens the archive, walks
 * its headers once and hands entry contents to the caller as in-memory
 * buffers. Entry names are normalized so that '\' becomes '/'.
 */
class ZipArchive {
public:
    /// Receives the bytes of one requested entry.
    using EntryHandler = std::function<void(const std::string& name, std::span<const unsigned char> data)>;
    /// Receives entries whose data could not be read.
    using EntryErrorHandler = std::function<void(const std::string& name, const std::string& message)>;
    /// Polled before each header; returning true ends the pass early.
    using StopPredicate = std::function<bool()>;

    /// Default cap on the bytes buffered for one entry.
    static constexpr std::size_t kMaxEntrySize = std::size_t{512} << 20;

    /**
     * @param path ZIP file.
     * @param max_entry_size Entries declaring or yielding more bytes than
     * this are reported through the error handler instead of being read.
     */
    explicit ZipArchive(std::filesystem::path path, std::size_t max_entry_size = kMaxEntrySize);

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    /**
     * @brief Lists regular-file entries in archive order.
     * @throws ArchiveError if the archive cannot be opened or its
     * central directory cannot be walked.
     */
    [[nodiscard]] std::vector<ZipEntry> list_entries() const;

    /**
     * @brief Reads the entries named in @p wanted in a single pass.
     *
     * @p on_entry is called in archive order for every wanted entry whose
     * data was read completely. A data error or an oversized entry goes
     * to @p on_error and the pass continues with the next header.
     *
     * @return Number of entries delivered to @p on_entry.
     * @throws ArchiveError if the archive cannot be opened or iterated.
     */
    std::size_t read_entries(const std::unordered_set<std::string>& wanted,
                             const EntryHandler& on_entry,
                             const EntryErrorHandler& on_error,
                             const StopPredicate& stop = {}) const;

    /// Replaces every '\' with '/'.
    static std::string normalize_name(std::string name);

private:
    std::filesystem::path path_;
    std::size_t max_entry_size_;
};

} // namespace ming

#endif // MING_ZIP_ARCHIVE_HPP
