#ifndef MING_CLI_PARSER_HPP
#define MING_CLI_PARSER_HPP

#include <filesystem>
#include <string>
#include <vector>

// forward declaration
namespace CLI { class App; }

struct Settings {
    bool delete_source = false;
    bool quiet = false;
    bool strict = false;

    std::string log_level = "ERROR";
    std::filesystem::path output_path = "pdf_output";
    std::filesystem::path log_file;
    std::filesystem::path report_path;

    std::vector<std::filesystem::path> inputs;

    /// "NONE" disables console logging entirely.
    [[nodiscard]] bool console_logging() const { return !quiet && log_level != "NONE"; }
};

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif // MING_CLI_PARSER_HPP
