/**
 * @file errors.hpp
 * @brief Exception taxonomy and the non-fatal error record.
 *
 * Library components throw the exceptions below. The orchestrator catches
 * them at image, group and input granularity and turns them into
 * ConversionError records, so a single bad file never aborts a run.
 * Only OutputDirError escapes to the caller.
 */

#ifndef MING_ERRORS_HPP
#define MING_ERRORS_HPP

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

namespace ming {

/**
 * @brief Base class of every exception thrown by libming.
 */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Image bytes are unsupported, corrupt or have a zero dimension.
class DecodeError final : public Error {
public:
    using Error::Error;
};

/// A ZIP archive cannot be opened or iterated.
class ArchiveError final : public Error {
public:
    using Error::Error;
};

/// A PDF cannot be serialized or saved.
class WriteError final : public Error {
public:
    using Error::Error;
};

/// Directory walk or cleanup failure.
class FilesystemError final : public Error {
public:
    using Error::Error;
};

/// The output directory cannot be created. Fatal for the whole run.
class OutputDirError final : public Error {
public:
    using Error::Error;
};

/**
 * @brief Category of a recorded, non-fatal error.
 */
enum class ErrorKind {
    Decode,     ///< image skipped
    Archive,    ///< archive skipped
    Write,      ///< group output lost, sources kept
    Filesystem, ///< walk entry or source file unreadable
    Input       ///< input path is neither a directory nor a .zip file
};

/**
 * @brief One non-fatal failure collected during a run.
 */
struct ConversionError {
    std::string path;    ///< File, archive entry ("archive.zip:dir/img.png") or output path
    ErrorKind kind{};    ///< Category
    std::string message; ///< Human readable description
};

/**
 * @brief Display name of an ErrorKind ("decode", "archive", ...).
 */
[[nodiscard]] std::string_view error_kind_to_string(ErrorKind kind) noexcept;

} // namespace ming

#endif // MING_ERRORS_HPP
