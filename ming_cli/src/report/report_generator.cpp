#include "report_generator.hpp"
#include "../utils/color.hpp"
#include "../../../libming/include/logger.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

#ifdef _WIN32

#include <windows.h>
#include <io.h>      // _isatty, _fileno
#define isatty _isatty
#define fileno _fileno

#else

#include <sys/ioctl.h>
#include <unistd.h>

#endif

bool is_stderr_a_tty() {
    return isatty(fileno(stderr)) != 0;
}

unsigned get_terminal_width() {
#ifdef _WIN32
    CONSOLE_SCREEN_BUFFER_INFO csbi;
    if (GetConsoleScreenBufferInfo(GetStdHandle(STD_ERROR_HANDLE), &csbi))
        return csbi.srWindow.Right - csbi.srWindow.Left + 1;
    return 80;
#else
    winsize w{};
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
#endif
}

static std::string csv_escape(const std::string& data) {
    if (data.find_first_of(",\"\n\r") == std::string::npos) {
        return data;
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (char c : data) {
        if (c == '"') {
            result.push_back('"'); // escape quote with another quote
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

static std::string source_label(const PdfRecord& r) {
    const std::string name = r.source.filename().string();
    return r.group_key.empty() ? name : name + "/" + r.group_key;
}

void print_console_report(const std::vector<PdfRecord>& records,
                          const std::vector<ming::ConversionError>& errors,
                          const double total_seconds) {
    const unsigned term_width = get_terminal_width();
    const bool use_colors = is_stderr_a_tty();

    std::size_t max_pages = 6;
    std::size_t max_source = 7;
    for (const auto& r : records) {
        max_pages = std::max(max_pages, std::to_string(r.pages).size() + 2);
        max_source = std::max(max_source, source_label(r).size() + 2);
    }
    max_source = std::min<std::size_t>(max_source, 40);

    const std::size_t fixed_cols_width = max_pages + max_source;
    const std::size_t file_col_width = term_width > fixed_cols_width + 10
                                ? term_width - fixed_cols_width
                                : 10;

    auto truncate = [](const std::string& s, const std::size_t max_len) {
        return s.size() <= max_len || max_len < 4 ? s : s.substr(0, max_len - 3) + "...";
    };

    std::size_t total_pages = 0;
    if (!records.empty()) {
        std::cerr << "\n"
                  << std::left << std::setw(static_cast<int>(file_col_width)) << "PDF"
                  << std::setw(static_cast<int>(max_pages)) << "Pages"
                  << "Source"
                  << "\n";
        for (const auto& r : records) {
            total_pages += r.pages;
            std::cerr << std::left << std::setw(static_cast<int>(file_col_width))
                      << truncate(r.output.filename().string(), file_col_width - 1)
                      << std::setw(static_cast<int>(max_pages)) << r.pages
                      << truncate(source_label(r), max_source);
            if (r.skipped > 0) {
                std::cerr << (use_colors ? YELLOW : "") << "  (" << r.skipped << " skipped)"
                          << (use_colors ? RESET : "");
            }
            std::cerr << "\n";
        }
    }

    if (!errors.empty()) {
        std::cerr << "\n=== Errors ===\n";
        for (const auto& e : errors) {
            std::cerr << (use_colors ? RED : "")
                      << "[" << ming::error_kind_to_string(e.kind) << "] "
                      << (use_colors ? RESET : "")
                      << e.path << ": " << e.message << "\n";
        }
    }

    std::cerr << "\nPDFs created: " << records.size()
              << " (" << total_pages << " page" << (total_pages == 1 ? "" : "s") << ")\n";
    std::cerr << "Errors: " << errors.size() << "\n";
    std::cerr << "Total time: " << std::fixed << std::setprecision(2) << total_seconds << " s\n";
}

bool export_csv_report(const std::vector<PdfRecord>& records,
                       const std::vector<ming::ConversionError>& errors,
                       const std::filesystem::path& output_path,
                       const double total_seconds) {
    std::ofstream out(output_path);
    if (!out) {
        ming::Logger::log(ming::LogLevel::Error, "Cannot write report: " + output_path.string(), "report");
        return false;
    }

    std::size_t total_pages = 0;
    out << "Output,Pages,Source\n";
    for (const auto& r : records) {
        total_pages += r.pages;
        const std::string source = r.group_key.empty()
                                 ? r.source.string()
                                 : r.source.string() + ":" + r.group_key;
        out << csv_escape(r.output.string()) << ","
            << r.pages << ","
            << csv_escape(source) << "\n";
    }

    if (!errors.empty()) {
        out << "\n\nPath,Kind,Error\n";
        for (const auto& e : errors) {
            out << csv_escape(e.path) << ","
                << ming::error_kind_to_string(e.kind) << ","
                << csv_escape(e.message) << "\n";
        }
    }

    out << "\n\nPDFs,Pages,Errors,Total time(s)\n";
    std::ostringstream osstime;
    osstime << std::fixed << std::setprecision(2) << total_seconds;
    out << records.size() << "," << total_pages << "," << errors.size() << "," << osstime.str() << "\n";

    out.flush();
    if (!out) {
        ming::Logger::log(ming::LogLevel::Error, "Failed writing report: " + output_path.string(), "report");
        return false;
    }
    return true;
}
