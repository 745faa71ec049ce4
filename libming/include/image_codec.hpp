/**
 * @file image_codec.hpp
 * @brief Decodes source images and re-encodes them as RGB JPEG for embedding.
 */

#ifndef MING_IMAGE_CODEC_HPP
#define MING_IMAGE_CODEC_HPP

#include <array>
#include <span>
#include <string_view>
#include <vector>

namespace ming {

/**
 * @brief Source extensions accepted by ming, compared case-insensitively.
 *
 * Used both for directory scans and for filtering ZIP entry names.
 */
inline constexpr std::array<std::string_view, 5> kImageExtensions = {
    ".png", ".jpg", ".jpeg", ".gif", ".bmp"
};

/**
 * @brief True if the last extension of @p name is one of kImageExtensions.
 * @param name A file name, relative path or archive entry name.
 */
[[nodiscard]] bool is_image_path(std::string_view name);

/**
 * @brief Interleaved 8-bit RGB pixels, rows top to bottom.
 */
struct RgbImage {
    int width = 0;
    int height = 0;
    std::vector<unsigned char> pixels; ///< width * height * 3 bytes
};

/**
 * @brief Result of ImageCodec::decode: dimensions plus an embeddable JPEG.
 */
struct DecodedImage {
    int width = 0;                    ///< Pixel width of the source image
    int height = 0;                   ///< Pixel height of the source image
    std::vector<unsigned char> jpeg;  ///< Baseline RGB JPEG stream
};

/**
 * @brief Format dispatch and normalization to RGB JPEG.
 *
 * The real format is sniffed from the bytes (MimeDetector), so an image
 * with a misleading extension still decodes. Every non-RGB pixel format
 * (grayscale, palette, alpha, CMYK, 16-bit) is flattened to 8-bit RGB
 * before re-encoding.
 */
class ImageCodec {
public:
    /// JPEG quality used for embedded pages.
    static constexpr int kJpegQuality = 75;

    /// Largest width or height accepted (libjpeg's own limit).
    static constexpr unsigned kMaxDimension = 65500;

    /**
     * @brief Largest pixel count accepted from any decoder.
     *
     * Checked against the header before pixel buffers are allocated, so a
     * tiny file claiming huge dimensions fails with DecodeError.
     */
    static constexpr unsigned long long kMaxPixels = 178956970ULL;

    /**
     * @brief Decode @p bytes and re-encode them as JPEG.
     * @throws DecodeError on unsupported or corrupt data, or a zero dimension.
     */
    [[nodiscard]] static DecodedImage decode(std::span<const unsigned char> bytes);

    /**
     * @brief Decode @p bytes to RGB without re-encoding.
     * @throws DecodeError on unsupported or corrupt data, or a zero dimension.
     */
    [[nodiscard]] static RgbImage decode_rgb(std::span<const unsigned char> bytes);
};

// --- format back-ends (one translation unit per library) ---

/// libjpeg; grayscale is expanded, CMYK/YCCK converted. @throws DecodeError
RgbImage decode_jpeg_rgb(std::span<const unsigned char> bytes);

/// libpng; 16-bit stripped, palette/gray expanded, alpha dropped. @throws DecodeError
RgbImage decode_png_rgb(std::span<const unsigned char> bytes);

/**
 * @brief stb_image; used for GIF (first frame) and BMP.
 *
 * Uncompressed and BITFIELDS BMPs only: RLE4/RLE8-compressed bitmaps are
 * not supported by stb_image and fail with DecodeError.
 * @throws DecodeError
 */
RgbImage decode_stb_rgb(std::span<const unsigned char> bytes);

/**
 * @brief Rejects dimensions above kMaxDimension or kMaxPixels.
 * @param format Short format name used in the error message.
 * @throws DecodeError
 */
void check_image_size(unsigned long long width, unsigned long long height, const char* format);

/**
 * @brief libjpeg baseline encoder.
 * @param image RGB pixels; must be non-empty and consistent with its size.
 * @param quality 1..100.
 * @throws DecodeError if libjpeg rejects the image.
 */
std::vector<unsigned char> encode_jpeg(const RgbImage& image, int quality = ImageCodec::kJpegQuality);

} // namespace ming

#endif // MING_IMAGE_CODEC_HPP
