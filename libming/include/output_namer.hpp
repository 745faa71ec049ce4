/**
 * @file output_namer.hpp
 * @brief Collision-free PDF file names inside the output directory.
 */

#ifndef MING_OUTPUT_NAMER_HPP
#define MING_OUTPUT_NAMER_HPP

#include <filesystem>
#include <string>

namespace ming {

/**
 * @brief Picks output paths that never overwrite an existing file.
 *
 * Candidates are probed in order: "{base}.pdf", "{base} (1).pdf",
 * "{base} (2).pdf", ... and the first one that does not exist wins.
 */
class OutputNamer {
public:
    explicit OutputNamer(std::filesystem::path output_dir);

    /**
     * @brief First non-existing candidate for @p base_name.
     *
     * Existence is checked, not reserved: another process creating the
     * same file between resolve() and the write would be overwritten.
     * A run owns its output directory.
     * @throws FilesystemError if a candidate's existence cannot be determined.
     */
    [[nodiscard]] std::filesystem::path resolve(const std::string& base_name) const;

    [[nodiscard]] const std::filesystem::path& output_dir() const noexcept { return output_dir_; }

private:
    std::filesystem::path output_dir_;
};

} // namespace ming

#endif // MING_OUTPUT_NAMER_HPP
