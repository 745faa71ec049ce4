/**
 * @file ming.hpp
 * @brief Public API of the ming library.
 */

#ifndef MING_HPP
#define MING_HPP

#include "conversion_orchestrator.hpp"
#include "log_sink.hpp"
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace ming {

/**
 * @brief Receives progress callbacks during Converter::convert.
 *
 * Callbacks run on the converting thread.
 */
struct ConverterObserver {
    virtual ~ConverterObserver() = default;

    virtual void onInputStart(const std::filesystem::path& path) {}

    virtual void onPdfCreated(const std::filesystem::path& path, std::size_t pages) {}

    virtual void onError(const std::string& path, const std::string& message) {}

    virtual void onLog(LogLevel level, const std::string& msg, const std::string& tag) {}
};

/**
 * @brief Main interface for the ming library.
 *
 * @details Wraps discovery, PDF creation and cleanup into a simple,
 * blocking API:
 * @code
 * ming::Converter converter;
 * const auto result = converter.outputDirectory("out").deleteSources(false).convert({"scans"});
 * @endcode
 */
class Converter {
public:
    Converter();
    ~Converter();

    Converter(const Converter&) = delete;
    Converter& operator=(const Converter&) = delete;
    Converter(Converter&&) noexcept;
    Converter& operator=(Converter&&) noexcept;

    // --- Configuration ---

    /**
     * @brief Directory receiving the PDFs, created on demand.
     * Default: "pdf_output".
     */
    Converter& outputDirectory(const std::filesystem::path& dir);

    /**
     * @brief Delete images and archives once converted.
     * Default: false.
     */
    Converter& deleteSources(bool val);

    // --- Observability ---

    /**
     * @brief Sets the observer for progress events.
     * The caller retains ownership of the observer.
     */
    void setObserver(ConverterObserver* observer);

    // --- Execution ---

    /**
     * @brief Converts directories and ZIP files. Blocks until completion.
     * @throws OutputDirError if the output directory cannot be created.
     */
    ConversionResult convert(const std::vector<std::filesystem::path>& paths);

    ConversionResult convert(const std::filesystem::path& path);

    // --- Control ---

    /**
     * @brief Requests cancellation of a running convert(). Thread-safe.
     */
    void stop();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ming

#endif // MING_HPP
