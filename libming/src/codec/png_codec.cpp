#include "../../include/image_codec.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <png.h>
#include <cstring>
#include <string>
#include <vector>

namespace {

    /**
     * @brief libpng error handler that throws a C++ exception.
     */
    [[noreturn]] void png_error_fn(png_structp, const png_const_charp msg) {
        throw ming::DecodeError(std::string("libpng: ") + msg);
    }

    /**
     * @brief libpng warning handler.
     */
    void png_warning_fn(png_structp, const png_const_charp msg) {
        ming::Logger::log(ming::LogLevel::Debug, std::string("libpng: ") + msg, "libpng");
    }

    /**
     * @brief In-memory read cursor handed to libpng.
     */
    struct MemoryReader {
        std::span<const unsigned char> data;
        size_t pos = 0;
    };

    void png_read_from_memory(png_structp png, png_bytep out, const png_size_t length) {
        auto* reader = static_cast<MemoryReader*>(png_get_io_ptr(png));
        if (reader->pos + length > reader->data.size()) {
            png_error(png, "read past end of data");
        }
        std::memcpy(out, reader->data.data() + reader->pos, length);
        reader->pos += length;
    }

    /**
     * @brief RAII wrapper for libpng read structs (png_structp, png_infop).
     * Ensures png_destroy_read_struct is called even if exceptions occur.
     */
    struct PngRead {
        png_structp png = nullptr;
        png_infop info = nullptr;

        explicit PngRead() = default;

        ~PngRead() {
            if (png || info) png_destroy_read_struct(&png, &info, nullptr);
        }
    };

} // namespace

namespace ming {

RgbImage decode_png_rgb(const std::span<const unsigned char> bytes) {
    if (bytes.size() < 8 || png_sig_cmp(bytes.data(), 0, 8) != 0) {
        throw DecodeError("Not a PNG stream");
    }

    PngRead rd;
    rd.png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, png_error_fn, png_warning_fn);
    if (!rd.png) throw DecodeError("png_create_read_struct failed");
    rd.info = png_create_info_struct(rd.png);
    if (!rd.info) throw DecodeError("png_create_info_struct failed");

    MemoryReader reader{bytes, 0};
    png_set_read_fn(rd.png, &reader, png_read_from_memory);
    png_set_user_limits(rd.png, ImageCodec::kMaxDimension, ImageCodec::kMaxDimension);
    png_read_info(rd.png, rd.info);

    png_uint_32 width = 0, height = 0;
    int bit_depth = 0, color_type = 0;
    png_get_IHDR(rd.png, rd.info, &width, &height, &bit_depth, &color_type, nullptr, nullptr, nullptr);
    if (width == 0 || height == 0) {
        throw DecodeError("PNG has a zero dimension");
    }
    check_image_size(width, height, "PNG");

    if (bit_depth == 16) png_set_strip_16(rd.png);
    if (color_type == PNG_COLOR_TYPE_PALETTE) png_set_palette_to_rgb(rd.png);
    if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) png_set_expand_gray_1_2_4_to_8(rd.png);
    // palette/gray expansion turns tRNS into an alpha channel
    if ((color_type & PNG_COLOR_MASK_ALPHA) || png_get_valid(rd.png, rd.info, PNG_INFO_tRNS)) {
        png_set_strip_alpha(rd.png);
    }
    if (color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_GRAY_ALPHA) png_set_gray_to_rgb(rd.png);
    png_set_interlace_handling(rd.png);

    png_read_update_info(rd.png, rd.info);
    // now the rows are guaranteed to be rgb8

    const size_t rowbytes = png_get_rowbytes(rd.png, rd.info);
    if (rowbytes != static_cast<size_t>(width) * 3) {
        throw DecodeError("Rowbytes mismatch, expected RGB8");
    }

    RgbImage img;
    img.width = static_cast<int>(width);
    img.height = static_cast<int>(height);
    img.pixels.resize(rowbytes * height);

    std::vector<png_bytep> row_pointers(height);
    for (png_uint_32 y = 0; y < height; ++y) {
        row_pointers[y] = img.pixels.data() + y * rowbytes;
    }
    png_read_image(rd.png, row_pointers.data());
    png_read_end(rd.png, nullptr);

    return img;
}

} // namespace ming
