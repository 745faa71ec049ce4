/**
 * @file conversion_orchestrator.hpp
 * @brief Drives discovery, PDF creation and source cleanup for each input.
 */

#ifndef MING_CONVERSION_ORCHESTRATOR_HPP
#define MING_CONVERSION_ORCHESTRATOR_HPP

#include "errors.hpp"
#include "event_bus.hpp"
#include "group_discoverer.hpp"
#include "output_namer.hpp"
#include <atomic>
#include <cstddef>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace ming {

class PdfDocumentBuilder;

/**
 * @brief Run configuration.
 */
struct ConversionOptions {
    std::filesystem::path output_dir{"pdf_output"}; ///< Created if absent
    bool delete_sources = false;                    ///< Remove consumed images and archives
};

/**
 * @brief Aggregated outcome of one or more inputs.
 */
struct ConversionResult {
    std::size_t pdfs_created = 0;
    std::vector<std::filesystem::path> outputs;  ///< Written PDFs, in creation order
    std::vector<ConversionError> errors;         ///< Non-fatal errors, in occurrence order
};

/**
 * @brief Lifecycle of the input being processed.
 */
enum class ConversionStage {
    Idle,
    Discovering,
    ConvertingGroup,
    Cleanup,
    Done
};

/**
 * @brief Sequential per-input driver.
 *
 * @details For each input: discover its groups, turn every group into one
 * PDF (undecodable images are skipped and recorded), then, when
 * delete_sources is set, delete what was consumed. Image files are
 * deleted only once the PDF embedding them is on disk; an archive only
 * when every one of its groups was written with all its images; directory
 * inputs are then pruned of empty directories bottom-up, root included.
 *
 * Progress is published on the EventBus given at construction. All
 * per-item failures end up in ConversionResult::errors; only
 * OutputDirError (from the constructor) is thrown.
 */
class ConversionOrchestrator {
public:
    /**
     * @brief Creates the output directory.
     * @throws OutputDirError if it cannot be created.
     */
    ConversionOrchestrator(ConversionOptions options, EventBus& bus);

    /**
     * @brief Processes one directory or ZIP input.
     * @param input Path supplied by the user.
     * @param result Accumulator for outputs and errors.
     * @return PDFs created for this input.
     */
    std::size_t convert(const std::filesystem::path& input, ConversionResult& result);

    /**
     * @brief Processes @p inputs in order until done or stopped.
     */
    [[nodiscard]] ConversionResult run(const std::vector<std::filesystem::path>& inputs);

    /**
     * @brief Requests cooperative cancellation.
     *
     * Checked between inputs, groups and images. A group interrupted
     * before its PDF was written keeps all its sources. Async-signal-safe.
     */
    void request_stop() noexcept;

    [[nodiscard]] bool is_stopped() const noexcept {
        return stop_flag_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] ConversionStage stage() const noexcept {
        return stage_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] const ConversionOptions& options() const noexcept { return options_; }

private:
    /// What happened to one group.
    struct GroupOutcome {
        bool written = false;
        std::vector<std::string> embedded; ///< images that made it into the PDF
    };

    /// One ZIP group whose pages are added in sorted order while its archive streams by.
    struct ZipGroupWork;

    GroupOutcome convert_directory_group(const ImageGroup& group, ConversionResult& result);
    /// Converts consecutive groups of the same archive in one read of that archive.
    std::vector<GroupOutcome> convert_zip_groups(std::span<const ImageGroup> groups, ConversionResult& result);
    void drain_zip_group(ZipGroupWork& work, ConversionResult& result);
    bool finish_group(const ImageGroup& group, PdfDocumentBuilder& builder, std::size_t skipped,
                      ConversionResult& result);

    void add_error(ConversionResult& result, ConversionError error, bool log = true);
    bool delete_source(const std::filesystem::path& path);

    ConversionOptions options_;
    OutputNamer namer_;
    EventBus& event_bus_;
    std::atomic<bool> stop_flag_{false};
    std::atomic<ConversionStage> stage_{ConversionStage::Idle};
};

} // namespace ming

#endif // MING_CONVERSION_ORCHESTRATOR_HPP
