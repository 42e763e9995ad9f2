#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include "vecsync/common/logger.h"
#include "vecsync/core/config.h"
#include "vecsync/embedding/embedding_provider.h"
#include "vecsync/extract/text_file_extractor.h"
#include "vecsync/index/vector_index.h"
#include "vecsync/monitor/change_monitor.h"
#include "vecsync/monitor/inotify_change_source.h"
#include "vecsync/query/query_engine.h"
#include "vecsync/query/query_optimizer.h"
#include "vecsync/scanner/file_scanner.h"
#include "vecsync/scanner/scan_log.h"

// Global flag for shutdown
std::atomic<bool> g_running(true);

void SignalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running.store(false);
    }
}

namespace vecsync {

/**
 * @brief Wires the components together for one CLI invocation
 */
class App {
public:
    explicit App(const core::Config& config)
        : config_(config),
          logger_(common::Logger::create("vecsync", config.log)),
          extractor_(config.extractor),
          embedder_(config.index.dimension) {
    }

    bool Open() {
        auto opened = index::VectorIndex::open(config_.index, logger_);
        if (!opened.ok()) {
            logger_->critical("Cannot open index: {} ({})", opened.error(),
                              core::error_code_name(opened.code()));
            return false;
        }
        index_ = opened.take_value();
        scanner_ = std::make_unique<scanner::FileScanner>(
            *index_, extractor_, embedder_, config_.scanner, logger_,
            [this](const std::string& message) { logger_->debug("{}", message); });
        if (!config_.scanner.scan_log_path.empty()) {
            scan_log_ = std::make_unique<scanner::ScanLog>(config_.scanner.scan_log_path);
        }
        return true;
    }

    int Scan(const std::vector<std::string>& roots) {
        auto result = scanner_->scanDirectories(roots);
        writeScanLog(result);

        std::cout << "Indexed " << result.scanned_files().size() << " files from "
                  << result.scanned_paths().size() << " directories in "
                  << result.duration_ms() << " ms" << std::endl;
        for (const auto& error : result.errors()) {
            std::cout << "  error: " << error << std::endl;
        }
        std::cout << "Index now holds " << index_->count() << " files" << std::endl;
        return result.errors().empty() ? 0 : 2;
    }

    int Watch(const std::vector<std::string>& roots) {
        Scan(roots);

        auto source = std::make_unique<monitor::InotifyChangeSource>(config_.monitor, logger_);
        monitor::ChangeMonitor change_monitor(
            *scanner_, *index_, config_.monitor, logger_, std::move(source),
            [](const std::string& path, core::ChangeKind kind) {
                std::cout << core::change_kind_name(kind) << ": " << path << std::endl;
            },
            scan_log_.get());

        auto started = change_monitor.start(roots);
        if (!started.ok()) {
            logger_->critical("Cannot start monitor: {}", started.error());
            return 1;
        }

        std::cout << "Watching " << roots.size() << " directories. Press Ctrl+C to stop." << std::endl;
        while (g_running.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        auto stopped = change_monitor.stop();
        if (!stopped.ok()) {
            logger_->warn("Monitor did not shut down cleanly: {}", stopped.error());
        }
        return 0;
    }

    int Search(const std::string& text, int64_t top_k, bool optimize) {
        query::KeywordQueryOptimizer optimizer;
        query::QueryEngine engine(*index_, embedder_, &optimizer, logger_);

        auto results = engine.search(text, top_k, optimize && config_.query.optimize);
        if (results.empty()) {
            std::cout << "No results" << std::endl;
            return 0;
        }
        int rank = 1;
        for (const auto& hit : results) {
            std::cout << std::setw(3) << rank++ << ". " << std::fixed << std::setprecision(4)
                      << hit.distance << "  " << hit.metadata.path << std::endl;
        }
        return 0;
    }

    int Stats() {
        std::cout << "Index:     " << config_.index.index_path << std::endl;
        std::cout << "Id map:    " << config_.index.id_map_path << std::endl;
        std::cout << "Dimension: " << index_->dimension() << std::endl;
        std::cout << "Files:     " << index_->count() << std::endl;
        return 0;
    }

private:
    void writeScanLog(const core::ScanResult& result) {
        if (!scan_log_) {
            return;
        }
        auto logged = scan_log_->append(result);
        if (!logged.ok()) {
            logger_->warn("Scan log: {}", logged.error());
        }
    }

    core::Config config_;
    common::LoggerPtr logger_;
    extract::TextFileExtractor extractor_;
    embedding::HashingEmbeddingProvider embedder_;
    std::unique_ptr<index::VectorIndex> index_;
    std::unique_ptr<scanner::FileScanner> scanner_;
    std::unique_ptr<scanner::ScanLog> scan_log_;
};

} // namespace vecsync

namespace {

void PrintUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [OPTIONS] COMMAND [ARGS]" << std::endl;
    std::cout << "Commands:" << std::endl;
    std::cout << "  scan DIR...              Index the given directories" << std::endl;
    std::cout << "  watch DIR...             Index, then keep the index in sync until Ctrl+C" << std::endl;
    std::cout << "  search [--top-k N] [--no-optimize] QUERY..." << std::endl;
    std::cout << "                           Print the closest indexed files" << std::endl;
    std::cout << "  stats                    Show index size and location" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --config FILE            JSON configuration file" << std::endl;
    std::cout << "  --data-dir DIR           Directory holding the index files" << std::endl;
    std::cout << "  --log-level LEVEL        Log level (trace, debug, info, warn, error, off)" << std::endl;
    std::cout << "  --help, -h               Show this help message" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);

    std::string config_path;
    std::string data_dir;
    std::string log_level;
    std::string command;
    std::vector<std::string> args;
    int64_t top_k = 0;
    bool optimize = true;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (!command.empty()) {
            if (command == "search" && arg == "--top-k" && i + 1 < argc) {
                try {
                    top_k = std::stoll(argv[++i]);
                } catch (const std::exception&) {
                    std::cerr << "Invalid --top-k value: " << argv[i] << std::endl;
                    return 1;
                }
            } else if (command == "search" && arg == "--no-optimize") {
                optimize = false;
            } else {
                args.push_back(arg);
            }
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--data-dir" && i + 1 < argc) {
            data_dir = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            log_level = argv[++i];
            if (log_level != "trace" && log_level != "debug" && log_level != "info" &&
                log_level != "warn" && log_level != "error" && log_level != "off") {
                std::cerr << "Unknown log level: " << log_level << ". Using default (info)." << std::endl;
                log_level = "info";
            }
        } else if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        } else if (arg == "scan" || arg == "watch" || arg == "search" || arg == "stats") {
            command = arg;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            std::cerr << "Use --help for usage information" << std::endl;
            return 1;
        }
    }

    if (command.empty()) {
        PrintUsage(argv[0]);
        return 1;
    }
    if ((command == "scan" || command == "watch" || command == "search") && args.empty()) {
        std::cerr << command << " needs at least one argument" << std::endl;
        return 1;
    }

    vecsync::core::Config config = vecsync::core::Config::Default();
    if (!config_path.empty()) {
        auto loaded = vecsync::core::load_config(config_path);
        if (!loaded.ok()) {
            std::cerr << "Failed to load config: " << loaded.error() << std::endl;
            return 1;
        }
        config = loaded.take_value();
    }
    if (!data_dir.empty()) {
        config.set_data_dir(data_dir);
    }
    if (!log_level.empty()) {
        config.log.level = log_level;
    }
    auto valid = config.validate();
    if (!valid.ok()) {
        std::cerr << "Invalid configuration: " << valid.error() << std::endl;
        return 1;
    }

    try {
        vecsync::App app(config);
        if (!app.Open()) {
            return 1;
        }

        if (command == "scan") {
            return app.Scan(args);
        }
        if (command == "watch") {
            return app.Watch(args);
        }
        if (command == "search") {
            std::string text;
            for (const auto& word : args) {
                text += (text.empty() ? "" : " ") + word;
            }
            return app.Search(text, top_k > 0 ? top_k : static_cast<int64_t>(config.query.default_top_k),
                              optimize);
        }
        return app.Stats();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
