#include "../../include/image_codec.hpp"
#include "../../include/errors.hpp"
#include <climits>
#include <memory>
#include <string>

// --- STB Implementation ---
// GIF and BMP only; JPEG and PNG go through libjpeg / libpng
#define STB_IMAGE_IMPLEMENTATION
#define STBI_ONLY_GIF
#define STBI_ONLY_BMP
#define STBI_NO_STDIO
#include <stb/stb_image.h>
// --------------------------

namespace {
    struct StbiDeleter {
        void operator()(stbi_uc* p) const { if (p) stbi_image_free(p); }
    };
    using unique_stbi = std::unique_ptr<stbi_uc, StbiDeleter>;
} // namespace

namespace ming {

RgbImage decode_stb_rgb(const std::span<const unsigned char> bytes) {
    if (bytes.empty() || bytes.size() > static_cast<size_t>(INT_MAX)) {
        throw DecodeError("stb_image: invalid buffer size");
    }

    int width = 0, height = 0, channels = 0;
    if (!stbi_info_from_memory(bytes.data(), static_cast<int>(bytes.size()), &width, &height, &channels)) {
        throw DecodeError(std::string("stb_image: ") + stbi_failure_reason());
    }
    check_image_size(static_cast<unsigned>(width), static_cast<unsigned>(height), "stb_image");

    // request 3 channels: palette and alpha are flattened to rgb
    unique_stbi data(stbi_load_from_memory(bytes.data(), static_cast<int>(bytes.size()),
                                           &width, &height, &channels, 3));
    if (!data) {
        throw DecodeError(std::string("stb_image: ") + stbi_failure_reason());
    }
    if (width <= 0 || height <= 0) {
        throw DecodeError("stb_image: zero dimension");
    }

    RgbImage img;
    img.width = width;
    img.height = height;
    const size_t size = static_cast<size_t>(width) * height * 3;
    img.pixels.assign(data.get(), data.get() + size);
    return img;
}

} // namespace ming
