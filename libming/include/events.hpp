/**
 * @file events.hpp
 * @brief Progress events published by the ConversionOrchestrator.
 *
 * These are plain data carriers used with EventBus. Subscribers (CLI
 * progress output, report generator, the Converter observer bridge)
 * receive them synchronously on the converting thread.
 */

#ifndef MING_EVENTS_HPP
#define MING_EVENTS_HPP

#include "errors.hpp"
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace ming {

// --- per input ---

/**
 * @brief Emitted when an input path starts being processed.
 */
struct InputStartEvent {
    std::filesystem::path path; ///< Input directory or ZIP file
};

/**
 * @brief Emitted once discovery of an input has finished.
 */
struct GroupsDiscoveredEvent {
    std::filesystem::path path;   ///< Input directory or ZIP file
    std::size_t group_count = 0;  ///< Number of non-empty image groups
    std::size_t image_count = 0;  ///< Images across all groups
};

/**
 * @brief Emitted after an input has been fully processed, cleanup included.
 */
struct InputCompleteEvent {
    std::filesystem::path path;            ///< Input directory or ZIP file
    std::size_t pdfs_created = 0;          ///< PDFs written for this input
    std::chrono::milliseconds duration{0}; ///< Wall time for this input
};

// --- per group ---

/**
 * @brief Emitted when a group's PDF has been written.
 */
struct PdfCreatedEvent {
    std::filesystem::path output;  ///< Final PDF path
    std::filesystem::path source;  ///< Directory or archive the group came from
    std::string group_key;         ///< Relative group key, empty for root
    std::size_t pages = 0;         ///< Pages in the PDF
    std::size_t skipped = 0;       ///< Images of the group that failed to decode
};

/**
 * @brief Emitted when a group produced no output.
 */
struct GroupSkippedEvent {
    std::filesystem::path source; ///< Directory or archive the group came from
    std::string group_key;        ///< Relative group key, empty for root
    std::string reason;           ///< Why nothing was written
};

// --- errors and cleanup ---

/**
 * @brief Emitted for every non-fatal error recorded in the run result.
 */
struct ConversionErrorEvent {
    ConversionError error;
};

/**
 * @brief Emitted when cleanup deleted a consumed source file.
 */
struct SourceDeletedEvent {
    std::filesystem::path path; ///< Deleted image or archive
};

} // namespace ming

#endif // MING_EVENTS_HPP
