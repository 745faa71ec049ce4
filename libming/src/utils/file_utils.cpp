#include "../../include/file_utils.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include "../../include/random_utils.hpp"
#include <algorithm>
#include <cctype>
#include <memory>
#include <system_error>
#ifndef _WIN32
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace {

struct FileCloser {
    void operator()(FILE *f) const { if (f) std::fclose(f); }
};
using unique_FILE = std::unique_ptr<FILE, FileCloser>;

} // namespace

namespace ming {

    FILE* open_file(const fs::path& path, const char* mode) {
#ifdef _WIN32
        // _wfopen accepts UTF-16 paths; the \\?\ prefix lifts MAX_PATH
        std::wstring wmode;
        for (const char* p = mode; *p; ++p) wmode += static_cast<wchar_t>(*p);

        std::error_code ec;
        auto abs_path = fs::absolute(path, ec);
        if (ec) {
            return _wfopen(path.wstring().c_str(), wmode.c_str());
        }

        std::wstring long_path = L"\\\\?\\" + abs_path.wstring();
        return _wfopen(long_path.c_str(), wmode.c_str());
#else
        return std::fopen(path.string().c_str(), mode);
#endif
    }

    std::vector<unsigned char> read_file_bytes(const fs::path& path) {
        unique_FILE f(open_file(path, "rb"));
        if (!f) {
            throw FilesystemError("cannot open " + path.string());
        }
        std::fseek(f.get(), 0, SEEK_END);
        const long size = std::ftell(f.get());
        std::fseek(f.get(), 0, SEEK_SET);
        if (size < 0) {
            throw FilesystemError("cannot determine size of " + path.string());
        }

        std::vector<unsigned char> buf(static_cast<size_t>(size));
        if (size > 0 && std::fread(buf.data(), 1, buf.size(), f.get()) != buf.size()) {
            throw FilesystemError("short read on " + path.string());
        }
        return buf;
    }

    void write_file_durably(const fs::path& target, const std::span<const unsigned char> data) {
        const fs::path tmp = target.parent_path() /
            ("." + target.filename().string() + ".part-" + RandomUtils::random_suffix());

        auto discard_tmp = [&tmp] {
            std::error_code ec;
            fs::remove(tmp, ec);
        };

        {
            unique_FILE out(open_file(tmp, "wb"));
            if (!out) {
                throw WriteError("cannot create " + tmp.string());
            }
            if (!data.empty() && std::fwrite(data.data(), 1, data.size(), out.get()) != data.size()) {
                out.reset();
                discard_tmp();
                throw WriteError("short write on " + tmp.string());
            }
            if (std::fflush(out.get()) != 0) {
                out.reset();
                discard_tmp();
                throw WriteError("fflush failed for " + tmp.string());
            }
#ifndef _WIN32
            if (::fsync(fileno(out.get())) != 0) {
                out.reset();
                discard_tmp();
                throw WriteError("fsync failed for " + tmp.string());
            }
#endif
            if (std::fclose(out.release()) != 0) {
                discard_tmp();
                throw WriteError("close failed for " + tmp.string());
            }
        }

        std::error_code ec;
        fs::rename(tmp, target, ec);
        if (ec) {
            discard_tmp();
            throw WriteError("rename to " + target.string() + " failed (" + ec.message() + ")");
        }
    }

    bool remove_file_logged(const fs::path& path, const std::string_view tag) {
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "Can't remove " + path.string() + " (" + ec.message() + ")", tag);
            return false;
        }
        Logger::log(LogLevel::Debug, "Removed " + path.string(), tag);
        return true;
    }

    std::size_t prune_empty_directories(const fs::path& root) {
        std::error_code ec;
        if (!fs::is_directory(root, ec)) return 0;

        std::vector<fs::path> dirs;
        dirs.push_back(root);
        const auto opts = fs::directory_options::skip_permission_denied;
        for (auto it = fs::recursive_directory_iterator(root, opts, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            std::error_code ec2;
            if (it->is_directory(ec2) && !it->is_symlink(ec2)) {
                dirs.push_back(it->path());
            }
        }

        // deepest first: a parent is only visited after all of its children
        std::ranges::sort(dirs, [](const fs::path& a, const fs::path& b) {
            const auto da = std::distance(a.begin(), a.end());
            const auto db = std::distance(b.begin(), b.end());
            return da > db;
        });

        std::size_t removed = 0;
        for (const auto& d : dirs) {
            std::error_code rm_ec;
            if (!fs::is_empty(d, rm_ec) || rm_ec) continue;
            if (fs::remove(d, rm_ec) && !rm_ec) {
                Logger::log(LogLevel::Debug, "Removed empty directory: " + d.string(), "file_utils");
                ++removed;
            }
        }
        return removed;
    }

    std::string to_lower_copy(std::string s) {
        for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return s;
    }

    bool is_junk_name(const std::string_view file_name) {
        if (file_name.starts_with("._")) {
            return true;
        }
        const auto name = to_lower_copy(std::string(file_name));
        return name == ".ds_store" || name == "desktop.ini";
    }

} // namespace ming
