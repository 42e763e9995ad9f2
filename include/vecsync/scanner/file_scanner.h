#ifndef VECSYNC_SCANNER_FILE_SCANNER_H_
#define VECSYNC_SCANNER_FILE_SCANNER_H_

#include <filesystem>
#include <string>
#include <unordered_set>
#include <vector>

#include "vecsync/common/logger.h"
#include "vecsync/core/config.h"
#include "vecsync/core/result.h"
#include "vecsync/core/types.h"
#include "vecsync/embedding/embedding_provider.h"
#include "vecsync/extract/content_extractor.h"
#include "vecsync/index/vector_index.h"

namespace vecsync {
namespace scanner {

/**
 * @brief Walks directory trees and feeds supported files into the index
 *
 * The scanner borrows the index, extractor and embedder; all three must
 * outlive it. scanFile() is safe to call concurrently from several threads.
 */
class FileScanner {
public:
    FileScanner(index::VectorIndex& index,
                const extract::ContentExtractor& extractor,
                const embedding::EmbeddingProvider& embedder,
                const core::ScannerConfig& config,
                common::LoggerPtr logger,
                core::ProgressCallback progress = nullptr);

    /**
     * @brief Depth-first scan of one root
     *
     * Never fails as a whole: a missing root yields a result holding a single
     * error, and per-file failures are collected in errors(). Symbolic links
     * and unsupported files are skipped. Index entries under the root whose
     * file is no longer a supported regular file are removed afterwards.
     */
    core::ScanResult scanDirectory(const std::string& root);

    /**
     * @brief Scans several roots in parallel and merges the results
     */
    core::ScanResult scanDirectories(const std::vector<std::string>& roots);

    /**
     * @brief Extract, embed and index a single file
     *
     * Unsupported files and files without text produce the sentinel record
     * (ok, empty vector). An existing entry for the same path is replaced.
     * Extraction and index errors are returned with their code.
     */
    core::Result<core::VectorRecord> scanFile(const std::string& path);

    bool isSupported(const std::filesystem::path& path) const;

    const core::ScannerConfig& config() const { return config_; }

private:
    struct Pass {
        std::vector<core::VectorRecord> files;
        std::vector<std::string> errors;
        std::unordered_set<core::RecordID> seen;
    };

    void scanTree(const std::filesystem::path& dir, Pass& pass);
    void visitFile(const std::filesystem::path& file, Pass& pass);
    void pruneStale(const std::string& root, Pass& pass);
    void reportProgress(const std::string& message) const;

    index::VectorIndex& index_;
    const extract::ContentExtractor& extractor_;
    const embedding::EmbeddingProvider& embedder_;
    core::ScannerConfig config_;
    common::LoggerPtr logger_;
    core::ProgressCallback progress_;
    std::vector<std::string> extensions_;  // Configured set intersected with the extractor's
};

} // namespace scanner
} // namespace vecsync

#endif // VECSYNC_SCANNER_FILE_SCANNER_H_
