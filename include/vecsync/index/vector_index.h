#ifndef VECSYNC_INDEX_VECTOR_INDEX_H_
#define VECSYNC_INDEX_VECTOR_INDEX_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "vecsync/common/logger.h"
#include "vecsync/core/config.h"
#include "vecsync/core/result.h"
#include "vecsync/core/types.h"
#include "vecsync/index/id_map_store.h"

namespace faiss {
struct Index;
}

namespace vecsync {
namespace index {

/**
 * @brief Exclusive owner of the ANN structure and the id -> metadata map
 *
 * Invariant: every id in the ANN structure has exactly one metadata entry
 * and every metadata entry has exactly one vector. Mutations take the
 * writer lock, change both structures and persist both artifacts before
 * releasing it. Reads share the lock.
 *
 * Distances are squared L2 (FAISS IndexFlatL2).
 *
 * Persistence failures are reported as PERSISTENCE_FAILED after the
 * in-memory change has been applied; memory may then be ahead of disk.
 */
class VectorIndex {
public:
    /**
     * @brief Opens the index described by config
     *
     * Loads both artifacts when both exist, creates and immediately writes an
     * empty store when neither exists, and fails with INDEX_CORRUPTION when
     * exactly one exists or the two disagree.
     */
    static core::Result<std::unique_ptr<VectorIndex>> open(const core::IndexConfig& config,
                                                          common::LoggerPtr logger);

    ~VectorIndex();

    VectorIndex(const VectorIndex&) = delete;
    VectorIndex& operator=(const VectorIndex&) = delete;

    /**
     * @brief Insert or replace the entry for id
     * @return DIMENSION_MISMATCH (store unchanged) or PERSISTENCE_FAILED
     */
    core::Result<void> add(core::RecordID id, const core::Vector& vector,
                           const core::FileMetadata& metadata);

    /**
     * @brief Delete the entry for id; absent ids are a no-op
     */
    core::Result<void> remove(core::RecordID id);

    /**
     * @brief Up to top_k entries ordered by ascending distance, then id
     */
    core::Result<std::vector<core::SearchResult>> search(const core::Vector& query,
                                                         int64_t top_k) const;

    bool isEmpty() const;
    size_t count() const;
    bool exists(core::RecordID id) const;
    std::optional<core::FileMetadata> get(core::RecordID id) const;

    // Ids whose stored path is directory or lies below it.
    std::vector<core::RecordID> idsUnder(const std::string& directory) const;

    size_t dimension() const { return config_.dimension; }
    const core::IndexConfig& config() const { return config_; }

private:
    VectorIndex(const core::IndexConfig& config, common::LoggerPtr logger,
                std::unique_ptr<faiss::Index> ann, IdMap id_map);

    // Caller holds the writer lock.
    void removeFromAnnLocked(core::RecordID id);
    core::Result<void> persistLocked();

    core::IndexConfig config_;
    common::LoggerPtr logger_;

    mutable std::shared_mutex mutex_;  // Guards ann_ and id_map_ together
    std::unique_ptr<faiss::Index> ann_;  // Always a faiss::IndexIDMap
    IdMap id_map_;
};

} // namespace index
} // namespace vecsync

#endif // VECSYNC_INDEX_VECTOR_INDEX_H_
