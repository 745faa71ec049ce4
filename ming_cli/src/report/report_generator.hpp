#ifndef MING_REPORT_GENERATOR_HPP
#define MING_REPORT_GENERATOR_HPP

#include "../../../libming/include/errors.hpp"
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

struct PdfRecord {
    std::filesystem::path output;  // written pdf
    std::filesystem::path source;  // directory or archive of the group
    std::string group_key;         // "" for the root group
    std::size_t pages{};
    std::size_t skipped{};         // images that failed to decode
};

void print_console_report(const std::vector<PdfRecord>& records,
                          const std::vector<ming::ConversionError>& errors,
                          double total_seconds);

/**
 * @brief Writes created PDFs, then errors, then totals as CSV.
 * @return false if the file cannot be written.
 */
bool export_csv_report(const std::vector<PdfRecord>& records,
                       const std::vector<ming::ConversionError>& errors,
                       const std::filesystem::path& output_path,
                       double total_seconds);

unsigned get_terminal_width();

bool is_stderr_a_tty();

#endif // MING_REPORT_GENERATOR_HPP
