#include "cli_parser.hpp"
#include <CLI/CLI.hpp>

void setup_cli_parser(CLI::App& app, Settings& settings) {
    // setup standard help and version flags
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "1.0");

    // --- Flags (booleans) ---
    app.add_flag("--delete-source", settings.delete_source,
                 "Delete images and ZIP files once they are in a written PDF,\n"
                 "then remove directories left empty.");

    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress console output (progress lines, summary, logs).");

    app.add_flag("--strict", settings.strict,
                 "Exit with code 2 if any image, archive or PDF failed.");

    app.add_option("-o,--output", settings.output_path,
                   "Directory receiving the PDFs (created if missing).")
                   ->default_val("pdf_output");

    app.add_option("--report", settings.report_path,
                   "CSV report export filename.")
                   ->take_last(); // if used multiple times, take the last one

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
                   ->default_val("ERROR")
                   ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Write logs to a specific file (default: no file logging).");

    // --- Positional Arguments ---
    app.add_option("inputs", settings.inputs, "One or more directories or .zip files")
        ->required()
        ->check([](const std::string& str) {
            if (!std::filesystem::exists(str)) return "Input path '" + str + "' not found.";
            return std::string(); // ok
        });

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        if (!settings.report_path.empty() && std::filesystem::is_directory(settings.report_path)) {
            throw CLI::ValidationError("--report must name a file, not a directory.");
        }
    });
}
