#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <clocale>
#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <CLI/CLI.hpp>
#include "cli/cli_parser.hpp"
#include "utils/color.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "utils/file_scanner.hpp"
#include "utils/terminal.hpp"
#include "../../libshrink/include/batch_driver.hpp"
#include "../../libshrink/include/codec_registry.hpp"
#include "../../libshrink/include/config.hpp"
#include "../../libshrink/include/errors.hpp"
#include "../../libshrink/include/event_bus.hpp"
#include "../../libshrink/include/events.hpp"
#include "../../libshrink/include/file_processor.hpp"
#include "../../libshrink/include/language_pack.hpp"
#include "../../libshrink/include/logger.hpp"
#include "../../libshrink/include/report_renderer.hpp"

#ifndef SHRINK_VERSION
#define SHRINK_VERSION "0.0.0"
#endif

// simple progress bar printer
inline void print_progress_bar(const size_t done, const size_t total, const double elapsed_seconds) {
    const unsigned term_width = get_terminal_width();
    const unsigned int bar_width = std::max(10u, term_width > 40u ? term_width - 40u : 20u);

    const double progress = total ? static_cast<double>(done) / static_cast<double>(total) : (done > 0 ? 1.0 : 0.0);
    const unsigned pos = static_cast<unsigned>(bar_width * progress);

    double percent = progress * 100.0;
    if (done < total && percent >= 99.95) {
        percent = 99.9;
    }
    if (done == total) {
        percent = 100.0;
    }

    std::cerr << "\r[";
    for (unsigned i = 0; i < bar_width; ++i) {
        if (i < pos) std::cerr << "=";
        else if (i == pos && done < total) std::cerr << ">";
        else if (i == pos && done == total) std::cerr << "=";
        else std::cerr << " ";
    }
    std::cerr << "] "
              << std::setw(5) << std::fixed << std::setprecision(1) << percent << "%"
              << " (" << done << "/" << total << ")"
              << " elapsed: " << std::fixed << std::setprecision(1) << elapsed_seconds << "s"
              << std::flush;
}

using namespace shrink;
namespace fs = std::filesystem;

namespace {

constexpr int kExitBadFolder = 1;
constexpr int kExitConfigError = 2;
constexpr int kExitInterrupted = 130;

std::atomic<bool> interrupted{false};
std::atomic<BatchDriver*> g_driver{nullptr};

// handle ctrl+c or termination signals; only lock-free stores are safe here
void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        if (BatchDriver* driver = g_driver.load()) {
            driver->request_stop();
        }
        interrupted.store(true);
    }
}

void init_utf8_locale() {
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
    Logger::log(LogLevel::Warning, "UTF-8 locale not available; non-ASCII file names may be printed wrongly.",
                "LocaleInit");
}

void print_about() {
    std::cout << "shrink " << SHRINK_VERSION << "\n"
              << "Batch recompression of JPEG, PNG and WebP images in place,\n"
              << "with backups, name-based skipping and localized reports.\n";
}

std::string trim(std::string s) {
    const auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    // paths dragged into a terminal often arrive quoted
    if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
        s = s.substr(1, s.size() - 2);
    }
    return s;
}

} // namespace

int main(int argc, char* argv[]) {

    CLI::App app{"shrink: batch image recompression with backups and reports."};
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

    if (settings.about) {
        print_about();
        return 0;
    }

    // set loggers
    Logger::clear_sinks();
    auto consoleSink = std::make_unique<ConsoleLogSink>();
    consoleSink->log_level = Logger::string_to_level(settings.log_level);
    consoleSink->use_colors = is_stderr_a_tty();
    Logger::add_sink(std::move(consoleSink));

    if (!settings.log_file.empty()) {
        auto fileSink = std::make_unique<FileLogSink>(settings.log_file);
        if (fileSink->is_open()) {
            Logger::add_sink(std::move(fileSink));
        } else {
            Logger::log(LogLevel::Warning, "Cannot open log file " + settings.log_file.string(), "main");
        }
    }

    init_utf8_locale();

    // configuration: CLI > config.yaml > defaults
    Config cfg;
    LanguagePack lang;
    try {
        cfg = load_config_file(settings.config_path);
        apply_overrides(settings, cfg);
        validate_config(cfg);
        lang = LanguagePack::load(cfg.language_dir, cfg.lang_code);
        lang.require(kRequiredMessageKeys);
    } catch (const ConfigurationError& e) {
        Logger::log(LogLevel::Error, e.what(), "main");
        return kExitConfigError;
    }

    try {
        if (cfg.path.empty()) {
            std::cout << lang.format("general.ask_input_path") << std::flush;
            std::string line;
            if (!std::getline(std::cin, line)) {
                line.clear();
            }
            cfg.path = trim(line);
        }

        const fs::path root(cfg.path);
        std::error_code ec;
        if (cfg.path.empty() || !fs::is_directory(root, ec)) {
            std::cout << lang.format("general.folder_not_found") << std::endl;
            return kExitBadFolder;
        }

        const fs::path summary_dir = prepare_output_folders(cfg, root);

        const auto files = collect_image_files(root, cfg);

        CodecRegistry registry;
        for (const auto& codec : registry.all()) {
            Logger::log(LogLevel::Debug, "Codec available: " + std::string(codec->get_name()), "main");
        }
        FileProcessor processor(registry, cfg.process_options());
        Logger::log(LogLevel::Info,
                    "Quality " + std::to_string(processor.options().quality) +
                    (processor.options().backup ? ", backups in '" + processor.options().backup_folder.string() + "'"
                                                : ", no backups"),
                    "main");
        EventBus bus;

        const bool show_bar = is_stderr_a_tty();
        const bool use_colors = is_stdout_a_tty();
        const auto start_total = std::chrono::steady_clock::now();

        bus.subscribe<BatchStartEvent>([&](const BatchStartEvent& e) {
            std::cout << lang.format("general.start_processing", {{"count", static_cast<std::uint64_t>(e.total)}})
                      << std::endl;
        });

        bus.subscribe<FileProcessedEvent>([&](const FileProcessedEvent& e) {
            if (cfg.print_image_reduced) {
                const char* color = e.record.status == Status::Compressed ? GREEN
                                  : e.record.has_error() ? RED : YELLOW;
                if (show_bar) std::cerr << "\r\033[K" << std::flush;
                std::cout << (use_colors ? color : "")
                          << render_progress_line(e.record, lang)
                          << (use_colors ? RESET : "") << std::endl;
            }
            if (show_bar) {
                const double elapsed = std::chrono::duration<double>(
                    std::chrono::steady_clock::now() - start_total).count();
                print_progress_bar(e.index + 1, e.total, elapsed);
            }
        });

        bus.subscribe<BatchInterruptedEvent>([&](const BatchInterruptedEvent& e) {
            std::cout << "\n" << lang.format("general.interrupted",
                                             {{"processed", static_cast<std::uint64_t>(e.processed)},
                                              {"dropped", static_cast<std::uint64_t>(e.dropped)}})
                      << std::endl;
        });

        BatchDriver driver(processor, bus, cfg.threads);
        g_driver.store(&driver);
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        const AggregateSnapshot snapshot = driver.run(files);

        g_driver.store(nullptr);
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
        if (show_bar) std::cerr << std::endl;

        if (cfg.print_summary) {
            std::cout << render_console(snapshot, lang) << std::flush;
        }

        int exit_code = 0;
        if (cfg.save_summary_to_csv) {
            try {
                const auto csv_path = write_csv_report(snapshot, lang, summary_dir, cfg.summary_filename);
                std::cout << lang.format("general.saved_report", {{"path", csv_path.string()}}) << std::endl;
            } catch (const ConfigurationError&) {
                throw;
            } catch (const std::runtime_error& e) {
                Logger::log(LogLevel::Error, e.what(), "main");
                exit_code = 1;
            }
        }

        std::cout << lang.format("general.finished_processing", {{"folder", root.string()}}) << std::endl;

        if (interrupted.load() || driver.interrupted()) {
            return kExitInterrupted;
        }
        return exit_code;
    } catch (const ConfigurationError& e) {
        g_driver.store(nullptr);
        Logger::log(LogLevel::Error, e.what(), "main");
        return kExitConfigError;
    }
}
