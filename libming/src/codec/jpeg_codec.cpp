#include "../../include/image_codec.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <cstdio>
#include <cstdlib>
#include <jpeglib.h>
#include <memory>
#include <string>

namespace {

// error manager (jpeg error -> c++ exception)
struct JpegErrorMgr {
    jpeg_error_mgr pub{};
    char msg[JMSG_LENGTH_MAX]{};
};

/**
 * @brief libjpeg error handler that throws a C++ exception.
 */
[[noreturn]] void jpeg_error_exit_throw(const j_common_ptr cinfo) {
    auto *err = reinterpret_cast<JpegErrorMgr *>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->msg);
    throw ming::DecodeError(std::string("libjpeg: ") + err->msg);
}

/**
 * @brief Routes libjpeg warnings (corrupt-but-readable data) to the logger.
 */
void jpeg_output_message_log(const j_common_ptr cinfo) {
    char buffer[JMSG_LENGTH_MAX];
    (*cinfo->err->format_message)(cinfo, buffer);
    ming::Logger::log(ming::LogLevel::Debug, std::string("libjpeg: ") + buffer, "libjpeg");
}

/**
 * @brief Owns a libjpeg decompressor and destroys it on scope exit.
 */
struct JpegDecompress {
    jpeg_decompress_struct cinfo{};
    JpegErrorMgr jerr{};

    JpegDecompress() {
        cinfo.err = jpeg_std_error(&jerr.pub);
        jerr.pub.error_exit = jpeg_error_exit_throw;
        jerr.pub.output_message = jpeg_output_message_log;
        jpeg_create_decompress(&cinfo);
    }
    ~JpegDecompress() { jpeg_destroy_decompress(&cinfo); }

    JpegDecompress(const JpegDecompress&) = delete;
    JpegDecompress& operator=(const JpegDecompress&) = delete;
};

/**
 * @brief Owns a libjpeg compressor and the malloc'ed memory destination.
 */
struct JpegCompress {
    jpeg_compress_struct cinfo{};
    JpegErrorMgr jerr{};
    unsigned char* out = nullptr;
    unsigned long out_size = 0;

    JpegCompress() {
        cinfo.err = jpeg_std_error(&jerr.pub);
        jerr.pub.error_exit = jpeg_error_exit_throw;
        jerr.pub.output_message = jpeg_output_message_log;
        jpeg_create_compress(&cinfo);
    }
    ~JpegCompress() {
        jpeg_destroy_compress(&cinfo);
        std::free(out);
    }

    JpegCompress(const JpegCompress&) = delete;
    JpegCompress& operator=(const JpegCompress&) = delete;
};

} // namespace

namespace ming {

RgbImage decode_jpeg_rgb(const std::span<const unsigned char> bytes) {
    JpegDecompress d;
    jpeg_mem_src(&d.cinfo, const_cast<unsigned char*>(bytes.data()),
                 static_cast<unsigned long>(bytes.size()));

    if (jpeg_read_header(&d.cinfo, TRUE) != JPEG_HEADER_OK) {
        throw DecodeError("Invalid JPEG header");
    }
    check_image_size(d.cinfo.image_width, d.cinfo.image_height, "JPEG");

    const bool cmyk = d.cinfo.jpeg_color_space == JCS_CMYK || d.cinfo.jpeg_color_space == JCS_YCCK;
    if (cmyk) {
        d.cinfo.out_color_space = JCS_CMYK;
    } else if (d.cinfo.jpeg_color_space != JCS_GRAYSCALE) {
        d.cinfo.out_color_space = JCS_RGB;
    }

    jpeg_start_decompress(&d.cinfo);

    RgbImage img;
    img.width = static_cast<int>(d.cinfo.output_width);
    img.height = static_cast<int>(d.cinfo.output_height);
    const int components = d.cinfo.output_components;
    if (img.width <= 0 || img.height <= 0) {
        throw DecodeError("JPEG has a zero dimension");
    }
    if (components != 1 && components != 3 && components != 4) {
        throw DecodeError("Unsupported JPEG component count: " + std::to_string(components));
    }

    img.pixels.resize(static_cast<size_t>(img.width) * img.height * 3);
    std::vector<unsigned char> row(static_cast<size_t>(img.width) * components);
    const bool adobe_inverted = d.cinfo.saw_Adobe_marker;

    while (d.cinfo.output_scanline < d.cinfo.output_height) {
        const auto y = d.cinfo.output_scanline;
        JSAMPROW row_ptr = row.data();
        jpeg_read_scanlines(&d.cinfo, &row_ptr, 1);

        unsigned char* dst = img.pixels.data() + static_cast<size_t>(y) * img.width * 3;
        for (int x = 0; x < img.width; ++x) {
            const unsigned char* src = row.data() + static_cast<size_t>(x) * components;
            if (components == 1) {
                dst[0] = dst[1] = dst[2] = src[0];
            } else if (components == 3) {
                dst[0] = src[0];
                dst[1] = src[1];
                dst[2] = src[2];
            } else {
                // Adobe writes CMYK inverted
                const int c = adobe_inverted ? src[0] : 255 - src[0];
                const int m = adobe_inverted ? src[1] : 255 - src[1];
                const int ye = adobe_inverted ? src[2] : 255 - src[2];
                const int k = adobe_inverted ? src[3] : 255 - src[3];
                dst[0] = static_cast<unsigned char>(c * k / 255);
                dst[1] = static_cast<unsigned char>(m * k / 255);
                dst[2] = static_cast<unsigned char>(ye * k / 255);
            }
            dst += 3;
        }
    }

    jpeg_finish_decompress(&d.cinfo);
    return img;
}

std::vector<unsigned char> encode_jpeg(const RgbImage& image, const int quality) {
    const size_t expected = static_cast<size_t>(image.width) * image.height * 3;
    if (image.width <= 0 || image.height <= 0 || image.pixels.size() != expected) {
        throw DecodeError("encode_jpeg: inconsistent RGB buffer");
    }

    JpegCompress c;
    jpeg_mem_dest(&c.cinfo, &c.out, &c.out_size);

    c.cinfo.image_width = static_cast<JDIMENSION>(image.width);
    c.cinfo.image_height = static_cast<JDIMENSION>(image.height);
    c.cinfo.input_components = 3;
    c.cinfo.in_color_space = JCS_RGB;
    jpeg_set_defaults(&c.cinfo);
    jpeg_set_quality(&c.cinfo, quality, TRUE);

    jpeg_start_compress(&c.cinfo, TRUE);
    const size_t stride = static_cast<size_t>(image.width) * 3;
    while (c.cinfo.next_scanline < c.cinfo.image_height) {
        auto row_ptr = const_cast<JSAMPROW>(image.pixels.data() + c.cinfo.next_scanline * stride);
        jpeg_write_scanlines(&c.cinfo, &row_ptr, 1);
    }
    jpeg_finish_compress(&c.cinfo);

    return {c.out, c.out + c.out_size};
}

} // namespace ming
