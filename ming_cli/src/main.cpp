#include <atomic>
#include <chrono>
#include <clocale>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <CLI/CLI.hpp>
#include "utils/color.hpp"
#include "cli/cli_parser.hpp"
#include "report/report_generator.hpp"
#include "../../libming/include/conversion_orchestrator.hpp"
#include "../../libming/include/event_bus.hpp"
#include "../../libming/include/events.hpp"
#include "../../libming/include/group_discoverer.hpp"
#include "../../libming/include/logger.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"

using namespace ming;
namespace fs = std::filesystem;

static std::atomic<bool> interrupted{false};
static std::atomic<ConversionOrchestrator*> g_orchestrator{nullptr};

// handle ctrl+c or termination signals
extern "C" void signal_handler(const int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        if (auto* orchestrator = g_orchestrator.load()) {
            orchestrator->request_stop();
        }
        interrupted.store(true);
    }
}

inline void init_utf8_locale() {
    std::setlocale(LC_ALL, "");

    const char *cur = std::setlocale(LC_CTYPE, nullptr);
    if (cur && std::string(cur).find("UTF-8") != std::string::npos) {
        Logger::log(LogLevel::Debug, std::string("Current locale: ") + cur, "LocaleInit");
        return; // ok
    }

    constexpr const char *fallbacks[] = {"C.UTF-8", "en_US.UTF-8", ".UTF-8" /* Windows */};
    for (const auto fb: fallbacks) {
        if (std::setlocale(LC_ALL, fb)) {
            Logger::log(LogLevel::Info, std::string("Locale set to ") + fb, "LocaleInit");
            return;
        }
    }

    // no UTF-8 available
    Logger::log(LogLevel::Warning, "UTF-8 locale not available; non-ASCII file names may be problematic.",
                "LocaleInit");
}

int main(int argc, char* argv[]) {

    CLI::App app{"ming: converts folders and ZIP archives of images into PDF documents."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        return app.exit(e);
    }

    // set loggers
    Logger::clear_sinks();
    if (!settings.log_file.empty()) {
        auto fileSink = std::make_unique<FileLogSink>(settings.log_file);
        if (!fileSink->is_open()) {
            std::cerr << YELLOW << "Cannot open log file " << settings.log_file.string() << RESET << std::endl;
        } else {
            Logger::add_sink(std::move(fileSink));
        }
    }
    if (settings.console_logging()) {
        auto consoleSink = std::make_unique<ConsoleLogSink>();
        consoleSink->log_level = Logger::string_to_level(settings.log_level);
        Logger::add_sink(std::move(consoleSink));
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    init_utf8_locale();

    // at least one input must be a directory or a zip file
    std::size_t valid_inputs = 0;
    for (const auto& input : settings.inputs) {
        if (classify_input(input)) {
            ++valid_inputs;
        } else {
            Logger::log(LogLevel::Warning, "Ignoring " + input.string() + ": not a directory or .zip file", "main");
        }
    }
    if (valid_inputs == 0) {
        Logger::log(LogLevel::Error, "No valid input.", "main");
        if (!settings.console_logging()) {
            std::cerr << RED << "No valid input." << RESET << std::endl;
        }
        return 1;
    }

    EventBus bus;
    std::vector<PdfRecord> records;

    bus.subscribe<InputStartEvent>([&](const InputStartEvent& e) {
        if (!settings.quiet) {
            std::cerr << CYAN << "[INPUT] " << e.path.string() << RESET << std::endl;
        }
    });

    bus.subscribe<GroupsDiscoveredEvent>([&](const GroupsDiscoveredEvent& e) {
        Logger::log(LogLevel::Info,
                    e.path.filename().string() + ": " + std::to_string(e.group_count) + " group(s), " +
                    std::to_string(e.image_count) + " image(s)",
                    "main");
    });

    bus.subscribe<PdfCreatedEvent>([&](const PdfCreatedEvent& e) {
        if (!settings.quiet) {
            std::cerr << GREEN << "[PDF] " << e.output.filename().string()
                      << " (" << e.pages << " page" << (e.pages == 1 ? "" : "s") << ")"
                      << RESET << std::endl;
        }
        records.push_back({e.output, e.source, e.group_key, e.pages, e.skipped});
    });

    bus.subscribe<GroupSkippedEvent>([&](const GroupSkippedEvent& e) {
        if (!settings.quiet) {
            const std::string group = e.group_key.empty() ? e.source.filename().string()
                                                          : e.source.filename().string() + "/" + e.group_key;
            std::cerr << YELLOW << "[SKIP] " << group << ": " << e.reason << RESET << std::endl;
        }
    });

    bus.subscribe<SourceDeletedEvent>([](const SourceDeletedEvent& e) {
        Logger::log(LogLevel::Debug, "Deleted " + e.path.string(), "main");
    });

    const auto start_total = std::chrono::steady_clock::now();

    ConversionOptions options;
    options.output_dir = settings.output_path;
    options.delete_sources = settings.delete_source;

    ConversionResult result;
    try {
        ConversionOrchestrator orchestrator(options, bus);
        g_orchestrator.store(&orchestrator);
        // a signal may have arrived before the orchestrator was published
        if (interrupted.load()) {
            orchestrator.request_stop();
        }
        result = orchestrator.run(settings.inputs);
        g_orchestrator.store(nullptr);
    } catch (const OutputDirError& e) {
        g_orchestrator.store(nullptr);
        Logger::log(LogLevel::Error, e.what(), "main");
        if (!settings.console_logging()) {
            std::cerr << RED << e.what() << RESET << std::endl;
        }
        return 1;
    }

    const double total_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start_total).count();

    if (interrupted.load() && !settings.quiet) {
        std::cerr << CYAN << "\n[INTERRUPT] Stopped; unfinished groups kept their sources." << RESET << std::endl;
    }

    if (!settings.quiet) {
        print_console_report(records, result.errors, total_seconds);
    }

    // export CSV if requested
    if (!settings.report_path.empty()) {
        if (!export_csv_report(records, result.errors, settings.report_path, total_seconds)) {
            std::cerr << RED << "Failed to write report " << settings.report_path.string() << RESET << std::endl;
        }
    }

    if (interrupted.load()) {
        return 130; // standard exit code for SIGINT
    }
    if (settings.strict && !result.errors.empty()) {
        return 2;
    }
    return 0;
}
