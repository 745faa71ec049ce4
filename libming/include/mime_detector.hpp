/**
 * @file mime_detector.hpp
 * @brief Content-based file type detection.
 */

#ifndef MING_MIME_DETECTOR_HPP
#define MING_MIME_DETECTOR_HPP

#include <filesystem>
#include <span>
#include <string>

namespace ming {

    /**
     * @brief Detects MIME types from file contents.
     *
     * On Linux/macOS this uses libmagic. When libmagic is unavailable (Windows)
     * or cannot load its database, the leading signature bytes of the
     * formats ming cares about (JPEG, PNG, GIF, BMP, ZIP, PDF) are checked
     * instead.
     */
    class MimeDetector {
    public:
        /**
         * @brief Detect the MIME type of an in-memory buffer.
         * @return A MIME string such as "image/png", or an empty string.
         */
        static std::string detect(std::span<const unsigned char> data);

        /**
         * @brief Detect the MIME type of a file.
         * @return A MIME string such as "application/zip", or an empty string.
         */
        static std::string detect(const std::filesystem::path& path);

        /**
         * @brief Signature-only detection, without libmagic.
         * @return A MIME string, or an empty string for unknown data.
         */
        static std::string sniff_signature(std::span<const unsigned char> data);
    };

} // namespace ming

#endif // MING_MIME_DETECTOR_HPP
