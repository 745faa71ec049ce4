#include "../../include/zip_archive.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <memory>

namespace fs = std::filesystem;

namespace {

constexpr const char* kTag = "zip_archive";

struct ArchiveReadDeleter {
    void operator()(archive* a) const noexcept {
        if (a) {
            archive_read_close(a);
            archive_read_free(a);
        }
    }
};
using ArchiveReadPtr = std::unique_ptr<archive, ArchiveReadDeleter>;

std::string archive_message(archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown libarchive error";
}

// opens a zip-only reader, throws on failure
ArchiveReadPtr open_zip(const fs::path& path) {
    ArchiveReadPtr a(archive_read_new());
    if (!a) {
        throw ming::ArchiveError("archive_read_new failed");
    }
    archive_read_support_format_zip(a.get());
    if (archive_read_set_options(a.get(), "hdrcharset=UTF-8") != ARCHIVE_OK) {
        ming::Logger::log(ming::LogLevel::Debug, "hdrcharset option not applied: " + archive_message(a.get()), kTag);
    }

    const int r = archive_read_open_filename(a.get(), path.string().c_str(), 10240);
    if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
        throw ming::ArchiveError("Cannot open " + path.string() + ": " + archive_message(a.get()));
    }
    if (r == ARCHIVE_WARN) {
        ming::Logger::log(ming::LogLevel::Warning, std::string("LIBARCHIVE WARN: ") + archive_message(a.get()), kTag);
    }
    return a;
}

// regular file with a usable name; directories and links are skipped
bool is_regular_entry(archive_entry* entry, std::string& name_out) {
    const char* ename = archive_entry_pathname(entry);
    if (!ename || !*ename) {
        return false;
    }
    name_out = ming::ZipArchive::normalize_name(ename);
    if (name_out.ends_with('/')) {
        return false;
    }
    const auto type = archive_entry_filetype(entry);
    // some writers leave the mode unset
    return type == AE_IFREG || type == 0;
}

} // namespace

namespace ming {

ZipArchive::ZipArchive(fs::path path, const std::size_t max_entry_size)
    : path_(std::move(path)), max_entry_size_(max_entry_size) {}

std::string ZipArchive::normalize_name(std::string name) {
    std::replace(name.begin(), name.end(), '\\', '/');
    return name;
}

std::vector<ZipEntry> ZipArchive::list_entries() const {
    const ArchiveReadPtr a = open_zip(path_);

    std::vector<ZipEntry> entries;
    archive_entry* entry = nullptr;
    int r = ARCHIVE_OK;
    while ((r = archive_read_next_header(a.get(), &entry)) == ARCHIVE_OK || r == ARCHIVE_WARN) {
        if (r == ARCHIVE_WARN) {
            Logger::log(LogLevel::Warning, std::string("LIBARCHIVE WARN: ") + archive_message(a.get()), kTag);
        }
        std::string name;
        if (is_regular_entry(entry, name)) {
            ZipEntry e;
            e.name = std::move(name);
            e.size = archive_entry_size_is_set(entry) ? archive_entry_size(entry) : 0;
            entries.push_back(std::move(e));
        }
        if (archive_read_data_skip(a.get()) != ARCHIVE_OK) {
            throw ArchiveError("Cannot skip entry in " + path_.string() + ": " + archive_message(a.get()));
        }
    }
    if (r != ARCHIVE_EOF) {
        throw ArchiveError("Iteration error in " + path_.string() + ": " + archive_message(a.get()));
    }

    Logger::log(LogLevel::Debug,
                path_.filename().string() + ": " + std::to_string(entries.size()) + " file entries",
                kTag);
    return entries;
}

std::size_t ZipArchive::read_entries(const std::unordered_set<std::string>& wanted,
                                     const EntryHandler& on_entry,
                                     const EntryErrorHandler& on_error,
                                     const StopPredicate& stop) const {
    if (wanted.empty()) {
        return 0;
    }
    const ArchiveReadPtr a = open_zip(path_);

    const auto report = [&](const std::string& name, const std::string& msg) {
        Logger::log(LogLevel::Error, name + ": " + msg, kTag);
        on_error(name, msg);
    };

    std::size_t delivered = 0;
    std::size_t remaining = wanted.size();
    std::vector<unsigned char> data;
    archive_entry* entry = nullptr;
    int r = ARCHIVE_OK;
    while (remaining > 0) {
        if (stop && stop()) {
            Logger::log(LogLevel::Debug, "Read of " + path_.string() + " stopped early", kTag);
            return delivered;
        }
        r = archive_read_next_header(a.get(), &entry);
        if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
            break;
        }
        std::string name;
        if (!is_regular_entry(entry, name) || !wanted.contains(name)) {
            if (archive_read_data_skip(a.get()) != ARCHIVE_OK) {
                throw ArchiveError("Cannot skip entry in " + path_.string() + ": " + archive_message(a.get()));
            }
            continue;
        }
        --remaining;

        data.clear();
        if (archive_entry_size_is_set(entry) && archive_entry_size(entry) > 0) {
            const auto declared = static_cast<std::uint64_t>(archive_entry_size(entry));
            if (declared > max_entry_size_) {
                report(name, "Entry declares " + std::to_string(declared) + " bytes, limit is " +
                             std::to_string(max_entry_size_));
                if (archive_read_data_skip(a.get()) != ARCHIVE_OK) {
                    throw ArchiveError("Cannot skip entry in " + path_.string() + ": " + archive_message(a.get()));
                }
                continue;
            }
            data.reserve(static_cast<std::size_t>(declared));
        }

        bool ok = true;
        const void* buff = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;
        while (true) {
            const int rb = archive_read_data_block(a.get(), &buff, &size, &offset);
            if (rb == ARCHIVE_EOF) break;
            if (rb != ARCHIVE_OK && rb != ARCHIVE_WARN) {
                ok = false;
                report(name, "Error reading data block: " + archive_message(a.get()));
                break;
            }
            const auto end = static_cast<std::uint64_t>(std::max<la_int64_t>(offset, 0)) + size;
            if (end > max_entry_size_ || data.size() + size > max_entry_size_) {
                ok = false;
                report(name, "Entry exceeds the limit of " + std::to_string(max_entry_size_) + " bytes");
                if (archive_read_data_skip(a.get()) != ARCHIVE_OK) {
                    throw ArchiveError("Cannot skip entry in " + path_.string() + ": " + archive_message(a.get()));
                }
                break;
            }
            // sparse entries report holes through the offset
            if (static_cast<std::size_t>(offset) > data.size()) {
                data.resize(static_cast<std::size_t>(offset), 0);
            }
            const auto* p = static_cast<const unsigned char*>(buff);
            data.insert(data.end(), p, p + size);
        }
        if (ok) {
            on_entry(name, std::span<const unsigned char>(data.data(), data.size()));
            ++delivered;
        }
    }
    if (remaining > 0 && r != ARCHIVE_EOF) {
        throw ArchiveError("Iteration error in " + path_.string() + ": " + archive_message(a.get()));
    }
    return delivered;
}

} // namespace ming
