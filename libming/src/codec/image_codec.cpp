#include "../../include/image_codec.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/mime_detector.hpp"
#include <algorithm>
#include <string>

namespace ming {

bool is_image_path(const std::string_view name) {
    const auto dot = name.rfind('.');
    if (dot == std::string_view::npos) return false;
    // a dot inside a directory component is not an extension
    const auto slash = name.find_last_of("/\\");
    if (slash != std::string_view::npos && slash > dot) return false;

    const std::string ext = to_lower_copy(std::string(name.substr(dot)));
    return std::ranges::find(kImageExtensions, ext) != kImageExtensions.end();
}

void check_image_size(const unsigned long long width, const unsigned long long height, const char* format) {
    if (width > ImageCodec::kMaxDimension || height > ImageCodec::kMaxDimension ||
        width * height > ImageCodec::kMaxPixels) {
        throw DecodeError(std::string(format) + " dimensions " + std::to_string(width) + "x" +
                          std::to_string(height) + " exceed the decoder limit");
    }
}

RgbImage ImageCodec::decode_rgb(const std::span<const unsigned char> bytes) {
    if (bytes.empty()) {
        throw DecodeError("empty image data");
    }

    const std::string mime = MimeDetector::detect(bytes);
    if (mime == "image/jpeg") {
        return decode_jpeg_rgb(bytes);
    }
    if (mime == "image/png") {
        return decode_png_rgb(bytes);
    }
    if (mime == "image/gif" || mime == "image/bmp" || mime == "image/x-ms-bmp") {
        return decode_stb_rgb(bytes);
    }
    throw DecodeError("unsupported image format" + (mime.empty() ? std::string() : " (" + mime + ")"));
}

DecodedImage ImageCodec::decode(const std::span<const unsigned char> bytes) {
    RgbImage rgb = decode_rgb(bytes);
    if (rgb.width <= 0 || rgb.height <= 0) {
        throw DecodeError("image has a zero dimension");
    }

    DecodedImage out;
    out.width = rgb.width;
    out.height = rgb.height;
    out.jpeg = encode_jpeg(rgb, kJpegQuality);
    return out;
}

} // namespace ming
