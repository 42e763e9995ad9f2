#ifndef VECSYNC_CORE_CONFIG_H_
#define VECSYNC_CORE_CONFIG_H_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "vecsync/core/result.h"

namespace vecsync {
namespace core {

/**
 * @brief Configuration for the vector index and its persisted artifacts
 */
struct IndexConfig {
    size_t dimension;              // Embedding length accepted by the index
    std::string index_path;        // Binary ANN snapshot
    std::string id_map_path;       // JSON id -> metadata map

    IndexConfig() : dimension(0) {}

    static IndexConfig Default() {
        IndexConfig config;
        config.dimension = 384;
        config.index_path = "data/faiss.index";
        config.id_map_path = "data/id_map.json";
        return config;
    }
};

/**
 * @brief Configuration for directory scanning
 */
struct ScannerConfig {
    std::vector<std::string> supported_extensions;  // Lower case, with the dot
    uint32_t scan_workers;         // 0 = hardware concurrency
    std::string scan_log_path;     // Empty disables the scan log

    ScannerConfig() : scan_workers(0) {}

    static ScannerConfig Default() {
        ScannerConfig config;
        config.supported_extensions = {".pdf", ".txt", ".md"};
        config.scan_workers = 0;
        config.scan_log_path = "logs/scan_result.log";
        return config;
    }
};

/**
 * @brief Configuration for the text file extractor
 */
struct ExtractorConfig {
    double max_file_size_mb;       // Larger files fail extraction

    ExtractorConfig() : max_file_size_mb(0.0) {}

    static ExtractorConfig Default() {
        ExtractorConfig config;
        config.max_file_size_mb = 50.0;
        return config;
    }
};

/**
 * @brief Configuration for the change monitor
 */
struct MonitorConfig {
    uint32_t event_workers;                            // Event processing pool size
    std::chrono::milliseconds cooldown;                // Min interval between passes per path
    std::chrono::milliseconds created_suppression;     // Ignore MODIFIED this long after CREATED
    std::chrono::milliseconds settle_delay;            // Wait for writers before reading
    std::chrono::milliseconds shutdown_timeout;        // Bounded drain on stop()
    std::chrono::milliseconds poll_interval;           // Watch source / consumer wakeup
    std::vector<std::string> ignore_patterns;          // Filename substrings to drop

    MonitorConfig()
        : event_workers(0), cooldown(0), created_suppression(0), settle_delay(0),
          shutdown_timeout(0), poll_interval(0) {}

    static MonitorConfig Default() {
        MonitorConfig config;
        config.event_workers = 4;
        config.cooldown = std::chrono::milliseconds(1000);
        config.created_suppression = std::chrono::milliseconds(2000);
        config.settle_delay = std::chrono::milliseconds(500);
        config.shutdown_timeout = std::chrono::milliseconds(5000);
        config.poll_interval = std::chrono::milliseconds(200);
        config.ignore_patterns = {"desktop.ini", "Thumbs.db", ".DS_Store", ".tmp",
                                  ".crdownload", ".part", "~$", ".swp", ".goutputstream"};
        return config;
    }
};

/**
 * @brief Configuration for query handling
 */
struct QueryConfig {
    size_t default_top_k;
    bool optimize;                 // Rewrite queries when an optimizer is present

    QueryConfig() : default_top_k(0), optimize(false) {}

    static QueryConfig Default() {
        QueryConfig config;
        config.default_top_k = 5;
        config.optimize = true;
        return config;
    }
};

/**
 * @brief Configuration for process logging
 */
struct LogConfig {
    std::string level;             // trace, debug, info, warn, error, off
    std::string file;              // Empty = console only

    static LogConfig Default() {
        LogConfig config;
        config.level = "info";
        config.file = "logs/vecsync.log";
        return config;
    }
};

/**
 * @brief Top level configuration
 */
struct Config {
    IndexConfig index;
    ScannerConfig scanner;
    ExtractorConfig extractor;
    MonitorConfig monitor;
    QueryConfig query;
    LogConfig log;

    static Config Default() {
        Config config;
        config.index = IndexConfig::Default();
        config.scanner = ScannerConfig::Default();
        config.extractor = ExtractorConfig::Default();
        config.monitor = MonitorConfig::Default();
        config.query = QueryConfig::Default();
        config.log = LogConfig::Default();
        return config;
    }

    // Places both index artifacts under data_dir.
    void set_data_dir(const std::string& data_dir);

    Result<void> validate() const;
};

/**
 * @brief Loads a JSON configuration file on top of Config::Default()
 *
 * Missing sections and keys keep their defaults and unknown keys are ignored.
 * A key with the wrong JSON type fails with INVALID_ARGUMENT.
 *
 * Example:
 * ```
 * {
 *   "index":   {"dimension": 384, "index_path": "data/faiss.index"},
 *   "monitor": {"cooldown_ms": 1000, "event_workers": 4},
 *   "log":     {"level": "debug"}
 * }
 * ```
 */
Result<Config> load_config(const std::string& path);

// Same as load_config but from an in-memory JSON document.
Result<Config> parse_config(const std::string& json);

} // namespace core
} // namespace vecsync

#endif // VECSYNC_CORE_CONFIG_H_
