#include "../libming/include/image_codec.hpp"
#include "../libming/include/errors.hpp"
#include "../libming/include/mime_detector.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace ming;
using namespace ming::test;

namespace {

// the re-encoded stream must itself be a decodable jpeg of the same size
void expect_valid_jpeg(const DecodedImage& img, const int w, const int h) {
    EXPECT_EQ(img.width, w);
    EXPECT_EQ(img.height, h);
    ASSERT_GE(img.jpeg.size(), 4u);
    EXPECT_EQ(img.jpeg[0], 0xFF);
    EXPECT_EQ(img.jpeg[1], 0xD8);
    const RgbImage back = decode_jpeg_rgb(img.jpeg);
    EXPECT_EQ(back.width, w);
    EXPECT_EQ(back.height, h);
}

} // namespace

TEST(ImagePathTest, AcceptsKnownExtensionsCaseInsensitively) {
    EXPECT_TRUE(is_image_path("a.png"));
    EXPECT_TRUE(is_image_path("dir/b.JPG"));
    EXPECT_TRUE(is_image_path("c.Jpeg"));
    EXPECT_TRUE(is_image_path("d.gif"));
    EXPECT_TRUE(is_image_path("e.BMP"));
    EXPECT_FALSE(is_image_path("f.tiff"));
    EXPECT_FALSE(is_image_path("notes.txt"));
    EXPECT_FALSE(is_image_path("png"));
    EXPECT_FALSE(is_image_path("dir.png/readme"));
    EXPECT_FALSE(is_image_path("archive.zip"));
}

TEST(ImageCodecTest, DecodesJpeg) {
    expect_valid_jpeg(ImageCodec::decode(jpeg_bytes(40, 30)), 40, 30);
}

TEST(ImageCodecTest, DecodesPngVariants) {
    expect_valid_jpeg(ImageCodec::decode(png_bytes(16, 8, PngKind::Rgb)), 16, 8);
    expect_valid_jpeg(ImageCodec::decode(png_bytes(16, 8, PngKind::Rgba)), 16, 8);
    expect_valid_jpeg(ImageCodec::decode(png_bytes(9, 7, PngKind::Gray)), 9, 7);
    expect_valid_jpeg(ImageCodec::decode(png_bytes(5, 12, PngKind::Gray16)), 5, 12);
    expect_valid_jpeg(ImageCodec::decode(png_bytes(4, 3, PngKind::PaletteTrns)), 4, 3);
}

TEST(ImageCodecTest, PalettePngWithTransparencyIsFlattenedToRgb) {
    const RgbImage rgb = ImageCodec::decode_rgb(png_bytes(4, 3, PngKind::PaletteTrns));
    EXPECT_EQ(rgb.width, 4);
    EXPECT_EQ(rgb.height, 3);
    ASSERT_EQ(rgb.pixels.size(), 4u * 3u * 3u);
    // first pixel uses palette entry 0 (red), its alpha is dropped
    EXPECT_EQ(rgb.pixels[0], 255);
    EXPECT_EQ(rgb.pixels[1], 0);
    EXPECT_EQ(rgb.pixels[2], 0);
}

TEST(ImageCodecTest, PngIsFlattenedToRgb) {
    const RgbImage rgb = ImageCodec::decode_rgb(png_bytes(4, 3, PngKind::Rgba));
    EXPECT_EQ(rgb.pixels.size(), 4u * 3u * 3u);

    const RgbImage gray = ImageCodec::decode_rgb(png_bytes(4, 3, PngKind::Gray));
    ASSERT_EQ(gray.pixels.size(), 4u * 3u * 3u);
    EXPECT_EQ(gray.pixels[0], gray.pixels[1]);
    EXPECT_EQ(gray.pixels[1], gray.pixels[2]);
}

TEST(ImageCodecTest, DecodesGifAndBmp) {
    expect_valid_jpeg(ImageCodec::decode(gif_bytes()), 1, 1);
    expect_valid_jpeg(ImageCodec::decode(bmp_bytes(7, 5)), 7, 5);
}

TEST(ImageCodecTest, FormatIsSniffedFromContent) {
    EXPECT_EQ(MimeDetector::detect(png_bytes(2, 2)), "image/png");
    EXPECT_EQ(MimeDetector::detect(jpeg_bytes(2, 2)), "image/jpeg");
    EXPECT_EQ(MimeDetector::sniff_signature(gif_bytes()), "image/gif");
    EXPECT_EQ(MimeDetector::sniff_signature(bmp_bytes(2, 2)), "image/bmp");
}

TEST(ImageCodecTest, RejectsGarbageAndEmptyInput) {
    EXPECT_THROW((void)ImageCodec::decode(garbage_bytes()), DecodeError);
    EXPECT_THROW((void)ImageCodec::decode(Bytes{}), DecodeError);
}

TEST(ImageCodecTest, RejectsTruncatedPng) {
    Bytes png = png_bytes(32, 32);
    png.resize(png.size() / 2);
    EXPECT_THROW((void)ImageCodec::decode(png), DecodeError);
}

TEST(ImageCodecTest, RejectsCorruptJpegHeader) {
    Bytes jpeg = jpeg_bytes(16, 16);
    jpeg.resize(20);
    EXPECT_THROW((void)ImageCodec::decode(jpeg), DecodeError);
}

TEST(ImageCodecTest, EncoderRejectsInconsistentBuffer) {
    RgbImage img = make_rgb(4, 4);
    img.pixels.pop_back();
    EXPECT_THROW((void)encode_jpeg(img), DecodeError);
}

TEST(ImageCodecTest, HugePngDimensionsAreRejectedBeforeAllocation) {
    const Bytes png = png_header_only(60000, 60000);
    ASSERT_LT(png.size(), 4096u);
    EXPECT_THROW((void)ImageCodec::decode(png), DecodeError);
}

TEST(ImageCodecTest, HugeJpegDimensionsAreRejectedBeforeAllocation) {
    EXPECT_THROW((void)ImageCodec::decode(jpeg_claiming_size(60000, 60000)), DecodeError);
}

TEST(ImageCodecTest, SizeLimitAcceptsLargeButSaneImages) {
    EXPECT_NO_THROW(check_image_size(8000, 6000, "test"));
    EXPECT_THROW(check_image_size(ImageCodec::kMaxDimension + 1, 1, "test"), DecodeError);
    EXPECT_THROW(check_image_size(20000, 20000, "test"), DecodeError);
}

TEST(ImageCodecTest, RleCompressedBmpIsRejected) {
    EXPECT_THROW((void)ImageCodec::decode(rle8_bmp_bytes(6, 4)), DecodeError);
}
