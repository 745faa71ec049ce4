#include "../../include/conversion_orchestrator.hpp"
#include "../../include/events.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/image_codec.hpp"
#include "../../include/logger.hpp"
#include "../../include/pdf_document_builder.hpp"
#include "../../include/zip_archive.hpp"
#include <chrono>
#include <map>
#include <optional>
#include <system_error>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace fs = std::filesystem;

namespace {

constexpr const char* kTag = "Orchestrator";

std::string entry_label(const std::filesystem::path& archive, const std::string& entry) {
    return archive.string() + ":" + entry;
}

std::string group_label(const ming::ImageGroup& group) {
    return group.key.empty() ? group.origin.string() : group.origin.string() + ":" + group.key;
}

/**
 * @brief Per-archive bookkeeping for the "fully consumed" rule.
 */
struct ArchiveTally {
    std::size_t groups = 0;
    std::size_t consumed = 0;
};

} // namespace

namespace ming {

ConversionOrchestrator::ConversionOrchestrator(ConversionOptions options, EventBus& bus)
    : options_(std::move(options)),
      namer_(options_.output_dir),
      event_bus_(bus) {
    std::error_code ec;
    fs::create_directories(options_.output_dir, ec);
    if (ec || !fs::is_directory(options_.output_dir, ec)) {
        Logger::log(LogLevel::Error, "Failed to create output directory: " + options_.output_dir.string(), kTag);
        throw OutputDirError("Failed to create output directory " + options_.output_dir.string() +
                             (ec ? ": " + ec.message() : std::string()));
    }
}

void ConversionOrchestrator::request_stop() noexcept {
    stop_flag_.store(true, std::memory_order_relaxed);
}

void ConversionOrchestrator::add_error(ConversionResult& result, ConversionError error, const bool log) {
    if (log) {
        Logger::log(error.kind == ErrorKind::Decode ? LogLevel::Warning : LogLevel::Error,
                    error.path + ": " + error.message, kTag);
    }
    event_bus_.publish(ConversionErrorEvent{error});
    result.errors.push_back(std::move(error));
}

bool ConversionOrchestrator::delete_source(const fs::path& path) {
    if (!remove_file_logged(path, kTag)) {
        return false;
    }
    event_bus_.publish(SourceDeletedEvent{path});
    return true;
}

ConversionResult ConversionOrchestrator::run(const std::vector<fs::path>& inputs) {
    ConversionResult result;
    for (const auto& input : inputs) {
        if (is_stopped()) {
            Logger::log(LogLevel::Info, "Stop requested, remaining inputs skipped", kTag);
            break;
        }
        convert(input, result);
    }
    return result;
}

std::size_t ConversionOrchestrator::convert(const fs::path& input, ConversionResult& result) {
    if (is_stopped()) {
        return 0;
    }
    const auto start = std::chrono::steady_clock::now();
    const std::size_t before = result.pdfs_created;

    stage_.store(ConversionStage::Discovering, std::memory_order_relaxed);
    event_bus_.publish(InputStartEvent{input});
    Logger::log(LogLevel::Info, "Processing " + input.string(), kTag);

    const auto item = classify_input(input);
    if (!item) {
        add_error(result, {input.string(), ErrorKind::Input, "Not a directory or .zip file"});
        stage_.store(ConversionStage::Done, std::memory_order_relaxed);
        event_bus_.publish(InputCompleteEvent{input, 0, std::chrono::milliseconds(0)});
        return 0;
    }

    try {
        DiscoveryResult discovery = GroupDiscoverer::discover(*item);
        for (auto& err : discovery.errors) {
            // already logged by the discoverer
            add_error(result, std::move(err), false);
        }
        const std::vector<ImageGroup>& groups = discovery.groups;
        event_bus_.publish(GroupsDiscoveredEvent{input, groups.size(), discovery.image_count()});
        if (groups.empty()) {
            Logger::log(LogLevel::Warning, "No images found in " + input.string(), kTag);
        }

        std::vector<fs::path> consumed_files;
        std::map<fs::path, ArchiveTally> archives;
        const auto record = [&](const ImageGroup& group, GroupOutcome outcome) {
            if (!outcome.written) {
                return;
            }
            if (group.source == GroupSource::Zip) {
                if (outcome.embedded.size() == group.images.size()) {
                    ++archives[group.origin].consumed;
                }
            } else {
                for (auto& file : outcome.embedded) {
                    consumed_files.emplace_back(std::move(file));
                }
            }
        };

        stage_.store(ConversionStage::ConvertingGroup, std::memory_order_relaxed);
        for (const auto& group : groups) {
            if (group.source == GroupSource::Zip) {
                ++archives[group.origin].groups;
            }
        }
        for (std::size_t i = 0; i < groups.size();) {
            if (is_stopped()) {
                Logger::log(LogLevel::Info, "Stop requested, remaining groups skipped", kTag);
                break;
            }
            if (groups[i].source == GroupSource::Zip) {
                std::size_t j = i + 1;
                while (j < groups.size() && groups[j].source == GroupSource::Zip &&
                       groups[j].origin == groups[i].origin) {
                    ++j;
                }
                auto outcomes = convert_zip_groups(std::span<const ImageGroup>(groups).subspan(i, j - i), result);
                for (std::size_t k = 0; k < outcomes.size(); ++k) {
                    record(groups[i + k], std::move(outcomes[k]));
                }
                i = j;
            } else {
                record(groups[i], convert_directory_group(groups[i], result));
                ++i;
            }
        }

        if (options_.delete_sources) {
            stage_.store(ConversionStage::Cleanup, std::memory_order_relaxed);
            for (const auto& file : consumed_files) {
                delete_source(file);
            }
            for (const auto& [archive, tally] : archives) {
                if (tally.groups > 0 && tally.consumed == tally.groups) {
                    delete_source(archive);
                } else {
                    Logger::log(LogLevel::Info,
                                "Keeping " + archive.string() + ": " + std::to_string(tally.consumed) + " of " +
                                std::to_string(tally.groups) + " group(s) fully converted",
                                kTag);
                }
            }
            if (item->kind == InputKind::Directory) {
                const std::size_t removed = prune_empty_directories(item->path);
                Logger::log(LogLevel::Debug, "Removed " + std::to_string(removed) + " empty director(ies)", kTag);
            }
        }
    } catch (const std::exception& e) {
        add_error(result, {input.string(), ErrorKind::Input, std::string("Input aborted: ") + e.what()});
    }

    stage_.store(ConversionStage::Done, std::memory_order_relaxed);
    const std::size_t created = result.pdfs_created - before;
    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    event_bus_.publish(InputCompleteEvent{input, created, duration});
    Logger::log(LogLevel::Info, input.string() + ": " + std::to_string(created) + " PDF(s) created", kTag);
    return created;
}

ConversionOrchestrator::GroupOutcome ConversionOrchestrator::convert_directory_group(const ImageGroup& group,
                                                                                     ConversionResult& result) {
    Logger::log(LogLevel::Debug,
                "Converting group '" + group_label(group) + "' (" + std::to_string(group.images.size()) +
                " image(s))",
                kTag);
    GroupOutcome outcome;
    PdfDocumentBuilder builder;
    builder.set_title(group.output_base_name);
    std::size_t skipped = 0;

    for (const auto& image : group.images) {
        if (is_stopped()) {
            return {};
        }
        try {
            const auto bytes = read_file_bytes(image);
            builder.add_image_page(ImageCodec::decode(bytes));
            outcome.embedded.push_back(image);
        } catch (const DecodeError& e) {
            ++skipped;
            add_error(result, {image, ErrorKind::Decode, e.what()});
        } catch (const FilesystemError& e) {
            ++skipped;
            add_error(result, {image, ErrorKind::Filesystem, e.what()});
        } catch (const std::exception& e) {
            ++skipped;
            add_error(result, {image, ErrorKind::Decode, std::string("Cannot embed image: ") + e.what()});
        }
    }

    outcome.written = finish_group(group, builder, skipped, result);
    return outcome;
}

struct ConversionOrchestrator::ZipGroupWork {
    const ImageGroup* group = nullptr;
    PdfDocumentBuilder builder;
    /// entries that arrived before their turn; nullopt marks a failed one
    std::map<std::size_t, std::optional<DecodedImage>> pending;
    std::size_t next = 0;
    std::size_t skipped = 0;
    bool finished = false;
    GroupOutcome outcome;
};

void ConversionOrchestrator::drain_zip_group(ZipGroupWork& work, ConversionResult& result) {
    const ImageGroup& group = *work.group;
    for (auto it = work.pending.find(work.next); it != work.pending.end(); it = work.pending.find(work.next)) {
        if (it->second) {
            const std::string& name = group.images[work.next];
            try {
                work.builder.add_image_page(*it->second);
                work.outcome.embedded.push_back(name);
            } catch (const std::exception& e) {
                ++work.skipped;
                add_error(result, {entry_label(group.origin, name), ErrorKind::Decode,
                                   std::string("Cannot embed image: ") + e.what()});
            }
        }
        work.pending.erase(it);
        ++work.next;
    }
    if (!work.finished && work.next == group.images.size()) {
        work.finished = true;
        work.outcome.written = finish_group(group, work.builder, work.skipped, result);
    }
}

std::vector<ConversionOrchestrator::GroupOutcome>
ConversionOrchestrator::convert_zip_groups(const std::span<const ImageGroup> groups, ConversionResult& result) {
    const fs::path& archive = groups.front().origin;
    Logger::log(LogLevel::Debug,
                "Converting " + std::to_string(groups.size()) + " group(s) from " + archive.string(), kTag);

    std::vector<ZipGroupWork> work(groups.size());
    // entry name -> (group, position in that group)
    std::unordered_map<std::string, std::pair<std::size_t, std::size_t>> slots;
    std::unordered_set<std::string> wanted;
    for (std::size_t g = 0; g < groups.size(); ++g) {
        work[g].group = &groups[g];
        work[g].builder.set_title(groups[g].output_base_name);
        for (std::size_t i = 0; i < groups[g].images.size(); ++i) {
            slots.emplace(groups[g].images[i], std::make_pair(g, i));
            wanted.insert(groups[g].images[i]);
        }
    }

    const auto settle = [&](const std::string& name, std::optional<DecodedImage> image) {
        const auto slot = slots.find(name);
        if (slot == slots.end()) {
            return;
        }
        ZipGroupWork& w = work[slot->second.first];
        const std::size_t index = slot->second.second;
        if (index < w.next || w.pending.contains(index)) {
            Logger::log(LogLevel::Debug, "Duplicate entry ignored: " + entry_label(archive, name), kTag);
            return;
        }
        if (!image) {
            ++w.skipped;
        }
        w.pending.emplace(index, std::move(image));
        drain_zip_group(w, result);
    };

    try {
        ZipArchive(archive).read_entries(
            wanted,
            [&](const std::string& name, std::span<const unsigned char> data) {
                std::optional<DecodedImage> image;
                try {
                    image = ImageCodec::decode(data);
                } catch (const DecodeError& e) {
                    add_error(result, {entry_label(archive, name), ErrorKind::Decode, e.what()});
                } catch (const std::exception& e) {
                    add_error(result, {entry_label(archive, name), ErrorKind::Decode,
                                       std::string("Cannot decode image: ") + e.what()});
                }
                settle(name, std::move(image));
            },
            [&](const std::string& name, const std::string& message) {
                // already logged by the archive reader
                add_error(result, {entry_label(archive, name), ErrorKind::Archive, message}, false);
                settle(name, std::nullopt);
            },
            [this] { return is_stopped(); });
    } catch (const ArchiveError& e) {
        add_error(result, {archive.string(), ErrorKind::Archive, e.what()});
        std::vector<GroupOutcome> outcomes(groups.size());
        for (std::size_t g = 0; g < groups.size(); ++g) {
            if (work[g].finished) {
                outcomes[g] = std::move(work[g].outcome);
            }
        }
        return outcomes;
    }

    std::vector<GroupOutcome> outcomes(groups.size());
    for (std::size_t g = 0; g < groups.size(); ++g) {
        ZipGroupWork& w = work[g];
        if (!w.finished && !is_stopped()) {
            for (std::size_t i = w.next; i < groups[g].images.size(); ++i) {
                if (!w.pending.contains(i)) {
                    ++w.skipped;
                    add_error(result, {entry_label(archive, groups[g].images[i]), ErrorKind::Archive,
                                       "Entry disappeared from archive"});
                    w.pending.emplace(i, std::nullopt);
                }
            }
            drain_zip_group(w, result);
        }
        if (w.finished) {
            outcomes[g] = std::move(w.outcome);
        }
    }
    return outcomes;
}

bool ConversionOrchestrator::finish_group(const ImageGroup& group, PdfDocumentBuilder& builder,
                                          const std::size_t skipped, ConversionResult& result) {
    if (is_stopped()) {
        return false;
    }
    if (builder.page_count() == 0) {
        event_bus_.publish(GroupSkippedEvent{group.origin, group.key, "no decodable images"});
        return false;
    }

    fs::path output;
    try {
        output = namer_.resolve(group.output_base_name);
        builder.write(output);
    } catch (const FilesystemError& e) {
        add_error(result, {(options_.output_dir / group.output_base_name).string(), ErrorKind::Filesystem,
                           e.what()});
        return false;
    } catch (const WriteError& e) {
        add_error(result, {output.string(), ErrorKind::Write, e.what()});
        return false;
    }

    ++result.pdfs_created;
    result.outputs.push_back(output);
    event_bus_.publish(PdfCreatedEvent{output, group.origin, group.key, builder.page_count(), skipped});
    Logger::log(LogLevel::Info,
                "Created " + output.string() + " (" + std::to_string(builder.page_count()) + " pages)", kTag);
    return true;
}

} // namespace ming
