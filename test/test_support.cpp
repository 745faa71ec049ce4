#include "test_support.hpp"
#include "../libming/include/random_utils.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <png.h>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace ming::test {

TempDir::TempDir()
    : path_(fs::temp_directory_path() / ("ming_test_" + RandomUtils::random_suffix())) {
    fs::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

RgbImage make_rgb(const int width, const int height) {
    RgbImage img;
    img.width = width;
    img.height = height;
    img.pixels.resize(static_cast<size_t>(width) * height * 3);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            unsigned char* p = img.pixels.data() + (static_cast<size_t>(y) * width + x) * 3;
            p[0] = static_cast<unsigned char>(x * 255 / std::max(1, width - 1));
            p[1] = static_cast<unsigned char>(y * 255 / std::max(1, height - 1));
            p[2] = 128;
        }
    }
    return img;
}

Bytes jpeg_bytes(const int width, const int height) {
    return encode_jpeg(make_rgb(width, height), 90);
}

Bytes jpeg_claiming_size(const int width, const int height) {
    Bytes data = jpeg_bytes(8, 8);
    // SOF0: FF C0, length(2), precision(1), height(2), width(2)
    for (size_t i = 0; i + 8 < data.size(); ++i) {
        if (data[i] == 0xFF && data[i + 1] == 0xC0) {
            data[i + 5] = static_cast<unsigned char>((height >> 8) & 0xFF);
            data[i + 6] = static_cast<unsigned char>(height & 0xFF);
            data[i + 7] = static_cast<unsigned char>((width >> 8) & 0xFF);
            data[i + 8] = static_cast<unsigned char>(width & 0xFF);
            return data;
        }
    }
    throw std::runtime_error("jpeg fixture has no SOF0 marker");
}

static void png_write_to_vector(png_structp png, png_bytep data, png_size_t length) {
    auto* out = static_cast<Bytes*>(png_get_io_ptr(png));
    out->insert(out->end(), data, data + length);
}

static void png_flush_noop(png_structp) {}

Bytes png_bytes(const int width, const int height, const PngKind kind) {
    Bytes out;
    png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    png_infop info = png_create_info_struct(png);
    if (!png || !info || setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        throw std::runtime_error("png fixture encoding failed");
    }

    png_set_write_fn(png, &out, png_write_to_vector, png_flush_noop);

    int color_type = PNG_COLOR_TYPE_RGB;
    int bit_depth = 8;
    int channels = 3;
    switch (kind) {
        case PngKind::Rgb: break;
        case PngKind::Rgba: color_type = PNG_COLOR_TYPE_RGB_ALPHA; channels = 4; break;
        case PngKind::Gray: color_type = PNG_COLOR_TYPE_GRAY; channels = 1; break;
        case PngKind::Gray16: color_type = PNG_COLOR_TYPE_GRAY; channels = 1; bit_depth = 16; break;
        case PngKind::PaletteTrns: color_type = PNG_COLOR_TYPE_PALETTE; channels = 1; break;
    }
    png_set_IHDR(png, info, width, height, bit_depth, color_type,
                 PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);

    // 4-entry palette, entry 0 fully transparent and entry 1 half transparent
    png_color palette[4] = {{255, 0, 0}, {0, 255, 0}, {0, 0, 255}, {255, 255, 255}};
    png_byte alpha[2] = {0, 128};
    if (kind == PngKind::PaletteTrns) {
        png_set_PLTE(png, info, palette, 4);
        png_set_tRNS(png, info, alpha, 2, nullptr);
    }
    png_write_info(png, info);

    const size_t bytes_per_sample = bit_depth / 8;
    std::vector<unsigned char> row(static_cast<size_t>(width) * channels * bytes_per_sample);
    for (int y = 0; y < height; ++y) {
        for (size_t i = 0; i < row.size(); ++i) {
            row[i] = kind == PngKind::PaletteTrns ? static_cast<unsigned char>((i + y) % 4)
                                                  : static_cast<unsigned char>((i + y * 7) & 0xFF);
        }
        png_write_row(png, row.data());
    }
    png_write_end(png, nullptr);
    png_destroy_write_struct(&png, &info);
    return out;
}

Bytes png_header_only(const int width, const int height) {
    Bytes out;
    png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    png_infop info = png_create_info_struct(png);
    if (!png || !info || setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        throw std::runtime_error("png fixture encoding failed");
    }

    png_set_write_fn(png, &out, png_write_to_vector, png_flush_noop);
    png_set_IHDR(png, info, width, height, 8, PNG_COLOR_TYPE_RGB,
                 PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png, info);

    // one row, flushed into an IDAT chunk; the stream is left unterminated
    const std::vector<unsigned char> row(static_cast<size_t>(width) * 3, 0);
    png_write_row(png, row.data());
    png_write_flush(png);
    png_destroy_write_struct(&png, &info);
    return out;
}

static void put_le16(Bytes& b, const unsigned v) {
    b.push_back(static_cast<unsigned char>(v & 0xFF));
    b.push_back(static_cast<unsigned char>((v >> 8) & 0xFF));
}

static void put_le32(Bytes& b, const unsigned v) {
    put_le16(b, v & 0xFFFF);
    put_le16(b, (v >> 16) & 0xFFFF);
}

Bytes bmp_bytes(const int width, const int height) {
    const unsigned row_size = (static_cast<unsigned>(width) * 3 + 3) & ~3u;
    const unsigned pixel_bytes = row_size * static_cast<unsigned>(height);

    Bytes b;
    b.push_back('B');
    b.push_back('M');
    put_le32(b, 54 + pixel_bytes);
    put_le32(b, 0);
    put_le32(b, 54);
    // BITMAPINFOHEADER
    put_le32(b, 40);
    put_le32(b, static_cast<unsigned>(width));
    put_le32(b, static_cast<unsigned>(height));
    put_le16(b, 1);
    put_le16(b, 24);
    put_le32(b, 0);
    put_le32(b, pixel_bytes);
    put_le32(b, 2835);
    put_le32(b, 2835);
    put_le32(b, 0);
    put_le32(b, 0);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            b.push_back(static_cast<unsigned char>(x * 10));
            b.push_back(static_cast<unsigned char>(y * 10));
            b.push_back(200);
        }
        for (unsigned pad = static_cast<unsigned>(width) * 3; pad < row_size; ++pad) {
            b.push_back(0);
        }
    }
    return b;
}

Bytes rle8_bmp_bytes(const int width, const int height) {
    // each row: one run covering the width, then end-of-line; end-of-bitmap last
    Bytes pixels;
    for (int y = 0; y < height; ++y) {
        pixels.push_back(static_cast<unsigned char>(width));
        pixels.push_back(static_cast<unsigned char>(y % 2));
        pixels.push_back(0);
        pixels.push_back(0);
    }
    pixels.push_back(0);
    pixels.push_back(1);

    const unsigned palette_bytes = 256 * 4;
    const unsigned offset = 14 + 40 + palette_bytes;
    Bytes b;
    b.push_back('B');
    b.push_back('M');
    put_le32(b, offset + static_cast<unsigned>(pixels.size()));
    put_le32(b, 0);
    put_le32(b, offset);
    put_le32(b, 40);
    put_le32(b, static_cast<unsigned>(width));
    put_le32(b, static_cast<unsigned>(height));
    put_le16(b, 1);
    put_le16(b, 8);
    put_le32(b, 1); // BI_RLE8
    put_le32(b, static_cast<unsigned>(pixels.size()));
    put_le32(b, 2835);
    put_le32(b, 2835);
    put_le32(b, 256);
    put_le32(b, 0);
    for (unsigned i = 0; i < 256; ++i) {
        put_le32(b, i * 0x010101u);
    }
    b.insert(b.end(), pixels.begin(), pixels.end());
    return b;
}

Bytes gif_bytes() {
    return {0x47, 0x49, 0x46, 0x38, 0x39, 0x61, 0x01, 0x00, 0x01, 0x00, 0x80, 0x00, 0x00,
            0xFF, 0xFF, 0xFF, 0x00, 0x00, 0x00, 0x21, 0xF9, 0x04, 0x01, 0x00, 0x00, 0x00,
            0x00, 0x2C, 0x00, 0x00, 0x00, 0x00, 0x01, 0x00, 0x01, 0x00, 0x00, 0x02, 0x02,
            0x44, 0x01, 0x00, 0x3B};
}

Bytes garbage_bytes() {
    const std::string text = "this is not an image, just some text\n";
    return {text.begin(), text.end()};
}

void write_file(const fs::path& path, const Bytes& data) {
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!out) {
        throw std::runtime_error("cannot write fixture " + path.string());
    }
}

void make_zip(const fs::path& path, const std::vector<std::pair<std::string, Bytes>>& entries) {
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }
    archive* a = archive_write_new();
    archive_write_set_format_zip(a);
    if (archive_write_open_filename(a, path.string().c_str()) != ARCHIVE_OK) {
        const std::string msg = archive_error_string(a) ? archive_error_string(a) : "?";
        archive_write_free(a);
        throw std::runtime_error("cannot create zip fixture: " + msg);
    }
    for (const auto& [name, data] : entries) {
        archive_entry* entry = archive_entry_new();
        archive_entry_set_pathname(entry, name.c_str());
        if (name.ends_with('/')) {
            archive_entry_set_filetype(entry, AE_IFDIR);
            archive_entry_set_perm(entry, 0755);
            archive_entry_set_size(entry, 0);
        } else {
            archive_entry_set_filetype(entry, AE_IFREG);
            archive_entry_set_perm(entry, 0644);
            archive_entry_set_size(entry, static_cast<la_int64_t>(data.size()));
        }
        archive_write_header(a, entry);
        if (!data.empty()) {
            archive_write_data(a, data.data(), data.size());
        }
        archive_entry_free(entry);
    }
    archive_write_close(a);
    archive_write_free(a);
}

static std::vector<PdfPage> pages_of(QPDF& pdf) {
    std::vector<PdfPage> pages;
    for (auto& page : QPDFPageDocumentHelper(pdf).getAllPages()) {
        QPDFObjectHandle box = page.getObjectHandle().getKey("/MediaBox");
        PdfPage p;
        p.width = box.getArrayItem(2).getNumericValue() - box.getArrayItem(0).getNumericValue();
        p.height = box.getArrayItem(3).getNumericValue() - box.getArrayItem(1).getNumericValue();
        p.images = page.getImages().size();
        pages.push_back(p);
    }
    return pages;
}

std::vector<PdfPage> read_pdf_pages(const fs::path& path) {
    QPDF pdf;
    pdf.processFile(path.string().c_str());
    return pages_of(pdf);
}

std::vector<PdfPage> read_pdf_pages(const Bytes& bytes) {
    QPDF pdf;
    pdf.processMemoryFile("memory.pdf", reinterpret_cast<const char*>(bytes.data()), bytes.size());
    return pages_of(pdf);
}

std::vector<std::string> list_names(const fs::path& dir) {
    std::vector<std::string> names;
    if (!fs::exists(dir)) return names;
    for (const auto& entry : fs::directory_iterator(dir)) {
        names.push_back(entry.path().filename().string());
    }
    std::ranges::sort(names);
    return names;
}

} // namespace ming::test
