#ifndef _WIN32
#include <magic.h>
#endif
#include "../../include/mime_detector.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <array>
#include <cstdio>
#include <cstring>
#include <initializer_list>
#include <memory>

namespace {

#ifndef _WIN32
struct MagicCloser {
    void operator()(magic_set* m) const { if (m) magic_close(m); }
};
using unique_magic = std::unique_ptr<magic_set, MagicCloser>;

unique_magic open_magic() {
    unique_magic magic(magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR));
    if (!magic) return nullptr;
    if (magic_load(magic.get(), nullptr) != 0) {
        ming::Logger::log(ming::LogLevel::Debug,
                          std::string("magic_load failed: ") + (magic_error(magic.get()) ? magic_error(magic.get()) : "?"),
                          "libmagic");
        return nullptr;
    }
    return magic;
}

// one database per thread; magic_t is not thread-safe
magic_set* thread_magic() {
    thread_local unique_magic magic = open_magic();
    return magic.get();
}
#endif

bool starts_with_bytes(const std::span<const unsigned char> data, const std::initializer_list<unsigned char> sig) {
    if (data.size() < sig.size()) return false;
    return std::memcmp(data.data(), sig.begin(), sig.size()) == 0;
}

} // namespace

std::string ming::MimeDetector::sniff_signature(const std::span<const unsigned char> data) {
    if (starts_with_bytes(data, {0xFF, 0xD8, 0xFF})) return "image/jpeg";
    if (starts_with_bytes(data, {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A})) return "image/png";
    if (starts_with_bytes(data, {'G', 'I', 'F', '8'})) return "image/gif";
    if (starts_with_bytes(data, {'B', 'M'})) return "image/bmp";
    if (starts_with_bytes(data, {'P', 'K', 0x03, 0x04}) ||
        starts_with_bytes(data, {'P', 'K', 0x05, 0x06})) return "application/zip";
    if (starts_with_bytes(data, {'%', 'P', 'D', 'F'})) return "application/pdf";
    return {};
}

std::string ming::MimeDetector::detect(const std::span<const unsigned char> data) {
    if (data.empty()) return {};
#ifndef _WIN32
    if (magic_set* magic = thread_magic()) {
        const char* mime = magic_buffer(magic, data.data(), data.size());
        if (mime && std::strcmp(mime, "application/octet-stream") != 0) {
            return mime;
        }
    }
#endif
    return sniff_signature(data);
}

std::string ming::MimeDetector::detect(const std::filesystem::path& path) {
#ifndef _WIN32
    if (magic_set* magic = thread_magic()) {
        const char* mime = magic_file(magic, path.string().c_str());
        if (mime && std::strcmp(mime, "application/octet-stream") != 0) {
            return mime;
        }
    }
#endif
    std::array<unsigned char, 16> head{};
    FILE* f = open_file(path, "rb");
    if (!f) return {};
    const size_t got = std::fread(head.data(), 1, head.size(), f);
    std::fclose(f);
    return sniff_signature({head.data(), got});
}
