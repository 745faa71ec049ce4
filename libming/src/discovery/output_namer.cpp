#include "../../include/output_namer.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <system_error>

namespace fs = std::filesystem;

namespace ming {

OutputNamer::OutputNamer(fs::path output_dir) : output_dir_(std::move(output_dir)) {}

fs::path OutputNamer::resolve(const std::string& base_name) const {
    std::error_code ec;
    fs::path candidate = output_dir_ / fs::path(base_name + ".pdf");
    for (unsigned n = 1;; ++n) {
        const bool taken = fs::exists(candidate, ec);
        if (ec) {
            // an unknown state is never a free name
            Logger::log(LogLevel::Error, "Cannot stat " + candidate.string() + ": " + ec.message(), "output_namer");
            throw FilesystemError("Cannot check output name " + candidate.string() + ": " + ec.message());
        }
        if (!taken) {
            return candidate;
        }
        candidate = output_dir_ / fs::path(base_name + " (" + std::to_string(n) + ").pdf");
    }
}

} // namespace ming
