#include "../../include/group_discoverer.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/image_codec.hpp"
#include "../../include/logger.hpp"
#include "../../include/mime_detector.hpp"
#include "../../include/zip_archive.hpp"
#include <algorithm>
#include <iterator>
#include <map>
#include <system_error>

namespace fs = std::filesystem;

namespace {

constexpr const char* kTag = "discovery";

std::string replace_all(std::string s, const char from, const char to) {
    std::replace(s.begin(), s.end(), from, to);
    return s;
}

// base name of a directory input, also for "dir/" and "."
std::string directory_base_name(const fs::path& root) {
    std::error_code ec;
    fs::path p = fs::absolute(root, ec);
    if (ec) p = root;
    p = p.lexically_normal();
    if (p.filename().empty()) p = p.parent_path();
    return p.filename().string();
}

void record(ming::DiscoveryResult& result, const fs::path& path, const ming::ErrorKind kind,
            const std::string& message) {
    ming::Logger::log(ming::LogLevel::Error, path.string() + ": " + message, kTag);
    result.errors.push_back({path.string(), kind, message});
}

bool is_zip_name(const fs::path& p) {
    return ming::to_lower_copy(p.extension().string()) == ".zip";
}

/**
 * @brief Files found by the walk: loose images per directory and archives.
 */
struct WalkResult {
    std::map<std::string, std::vector<std::string>> images_by_key;
    std::vector<fs::path> archives;
};

// depth-first walk without following directory symlinks
void walk_tree(const fs::path& root, WalkResult& walk, ming::DiscoveryResult& result) {
    std::vector<fs::path> pending{root};
    while (!pending.empty()) {
        const fs::path dir = std::move(pending.back());
        pending.pop_back();

        std::error_code ec;
        fs::directory_iterator it(dir, ec);
        if (ec) {
            record(result, dir, ming::ErrorKind::Filesystem, "Cannot read directory: " + ec.message());
            continue;
        }

        std::string key = dir.lexically_relative(root).generic_string();
        if (key == ".") key.clear();

        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) break;
            const fs::directory_entry& entry = *it;
            const std::string name = entry.path().filename().string();

            std::error_code sec;
            if (entry.is_symlink(sec) && entry.is_directory(sec)) {
                ming::Logger::log(ming::LogLevel::Debug, "Not following symlink " + entry.path().string(), kTag);
                continue;
            }
            if (entry.is_directory(sec)) {
                pending.push_back(entry.path());
                continue;
            }
            if (sec) {
                record(result, entry.path(), ming::ErrorKind::Filesystem, "Cannot stat: " + sec.message());
                continue;
            }
            if (!entry.is_regular_file(sec) || ming::is_junk_name(name)) {
                continue;
            }
            if (is_zip_name(entry.path())) {
                walk.archives.push_back(entry.path());
            } else if (ming::is_image_path(name)) {
                walk.images_by_key[key].push_back(entry.path().string());
            }
        }
        if (ec) {
            record(result, dir, ming::ErrorKind::Filesystem, "Directory listing aborted: " + ec.message());
        }
    }
}

} // namespace

namespace ming {

std::size_t DiscoveryResult::image_count() const noexcept {
    std::size_t n = 0;
    for (const auto& g : groups) n += g.images.size();
    return n;
}

std::optional<InputItem> classify_input(const fs::path& path) {
    std::error_code ec;
    const auto st = fs::status(path, ec);
    if (ec || !fs::exists(st)) {
        return std::nullopt;
    }
    if (fs::is_directory(st)) {
        return InputItem{path, InputKind::Directory};
    }
    if (!fs::is_regular_file(st)) {
        return std::nullopt;
    }
    if (is_zip_name(path)) {
        return InputItem{path, InputKind::ZipFile};
    }
    if (!path.has_extension() && MimeDetector::detect(path) == "application/zip") {
        Logger::log(LogLevel::Info, path.string() + " has no extension but contains a ZIP archive", kTag);
        return InputItem{path, InputKind::ZipFile};
    }
    return std::nullopt;
}

std::string GroupDiscoverer::zip_group_key(const std::string& entry_name) {
    const auto slash = entry_name.rfind('/');
    return slash == std::string::npos ? std::string() : entry_name.substr(0, slash);
}

bool GroupDiscoverer::is_junk_entry(const std::string& entry_name) {
    if (entry_name.starts_with("__MACOSX/") || entry_name.find("/__MACOSX/") != std::string::npos) {
        return true;
    }
    const auto slash = entry_name.rfind('/');
    const std::string_view base = slash == std::string::npos
        ? std::string_view(entry_name)
        : std::string_view(entry_name).substr(slash + 1);
    return is_junk_name(base);
}

DiscoveryResult GroupDiscoverer::discover(const InputItem& input) {
    return input.kind == InputKind::ZipFile ? discover_zip(input.path) : discover_directory(input.path);
}

DiscoveryResult GroupDiscoverer::discover_zip(const fs::path& zip_path) {
    DiscoveryResult result;

    std::vector<ZipEntry> entries;
    try {
        entries = ZipArchive(zip_path).list_entries();
    } catch (const ArchiveError& e) {
        record(result, zip_path, ErrorKind::Archive, e.what());
        return result;
    }

    const std::string stem = zip_path.stem().string();
    for (const auto& entry : entries) {
        if (is_junk_entry(entry.name) || !is_image_path(entry.name)) {
            continue;
        }
        const std::string key = zip_group_key(entry.name);
        auto it = std::ranges::find_if(result.groups, [&](const ImageGroup& g) { return g.key == key; });
        if (it == result.groups.end()) {
            ImageGroup group;
            group.source = GroupSource::Zip;
            group.origin = zip_path;
            group.key = key;
            group.output_base_name = key.empty() ? stem : stem + "_" + replace_all(key, '/', '_');
            result.groups.push_back(std::move(group));
            it = std::prev(result.groups.end());
        }
        it->images.push_back(entry.name);
    }

    for (auto& g : result.groups) {
        std::ranges::sort(g.images);
    }

    Logger::log(LogLevel::Debug,
                zip_path.filename().string() + ": " + std::to_string(result.groups.size()) + " group(s), " +
                std::to_string(result.image_count()) + " image(s)",
                kTag);
    return result;
}

DiscoveryResult GroupDiscoverer::discover_directory(const fs::path& root) {
    DiscoveryResult result;
    WalkResult walk;
    walk_tree(root, walk, result);

    std::ranges::sort(walk.archives);
    for (const auto& archive : walk.archives) {
        DiscoveryResult sub = discover_zip(archive);
        std::ranges::move(sub.groups, std::back_inserter(result.groups));
        std::ranges::move(sub.errors, std::back_inserter(result.errors));
    }

    // std::map iterates keys in order
    const std::string root_name = directory_base_name(root);
    for (auto& [key, images] : walk.images_by_key) {
        ImageGroup group;
        group.source = GroupSource::Directory;
        group.origin = root;
        group.key = key;
        group.images = std::move(images);
        std::ranges::sort(group.images);
        group.output_base_name = key.empty() ? root_name : replace_all(key, '/', '_');
        result.groups.push_back(std::move(group));
    }

    Logger::log(LogLevel::Debug,
                root.string() + ": " + std::to_string(result.groups.size()) + " group(s), " +
                std::to_string(result.image_count()) + " image(s)",
                kTag);
    return result;
}

} // namespace ming
