#include "vecsync/index/vector_index.h"

#include <faiss/IndexFlat.h>
#include <faiss/IndexIDMap.h>
#include <faiss/impl/FaissException.h>
#include <faiss/impl/IDSelector.h>
#include <faiss/index_io.h>

#include <algorithm>
#include <filesystem>
#include <mutex>
#include <system_error>
#include <unordered_set>

namespace vecsync {
namespace index {

namespace {

faiss::IndexIDMap* as_id_map(faiss::Index* index) {
    return static_cast<faiss::IndexIDMap*>(index);
}

core::Result<std::unique_ptr<VectorIndex>> corruption(const std::string& message) {
    return core::Result<std::unique_ptr<VectorIndex>>::error(
        core::Error::Code::INDEX_CORRUPTION, message);
}

void ensure_parent_dir(const std::string& path) {
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }
}

} // namespace

VectorIndex::VectorIndex(const core::IndexConfig& config, common::LoggerPtr logger,
                         std::unique_ptr<faiss::Index> ann, IdMap id_map)
    : config_(config),
      logger_(std::move(logger)),
      ann_(std::move(ann)),
      id_map_(std::move(id_map)) {
}

VectorIndex::~VectorIndex() = default;

core::Result<std::unique_ptr<VectorIndex>> VectorIndex::open(const core::IndexConfig& config,
                                                             common::LoggerPtr logger) {
    if (!logger) {
        logger = common::Logger::null();
    }
    if (config.dimension == 0) {
        return core::Result<std::unique_ptr<VectorIndex>>::error(
            core::Error::Code::INVALID_ARGUMENT, "Index dimension must be positive");
    }

    const bool have_index = std::filesystem::exists(config.index_path);
    const bool have_map = std::filesystem::exists(config.id_map_path);

    if (have_index != have_map) {
        const std::string& present = have_index ? config.index_path : config.id_map_path;
        const std::string& missing = have_index ? config.id_map_path : config.index_path;
        logger->critical("Index artifacts inconsistent: {} exists but {} is missing", present, missing);
        return corruption("Found " + present + " without its pair " + missing +
                          "; refusing to rebuild the index silently");
    }

    if (!have_index) {
        auto ann = std::make_unique<faiss::IndexIDMap>(
            new faiss::IndexFlatL2(static_cast<faiss::idx_t>(config.dimension)));
        ann->own_fields = true;

        ensure_parent_dir(config.index_path);
        ensure_parent_dir(config.id_map_path);

        std::unique_ptr<VectorIndex> store(
            new VectorIndex(config, logger, std::move(ann), IdMap{}));
        {
            std::unique_lock<std::shared_mutex> lock(store->mutex_);
            auto persisted = store->persistLocked();
            if (!persisted.ok()) {
                return core::Result<std::unique_ptr<VectorIndex>>::propagate(persisted);
            }
        }
        logger->info("Created empty index (dimension {}) at {}", config.dimension, config.index_path);
        return core::Result<std::unique_ptr<VectorIndex>>(std::move(store));
    }

    std::unique_ptr<faiss::Index> ann;
    try {
        ann.reset(faiss::read_index(config.index_path.c_str()));
    } catch (const faiss::FaissException& e) {
        return corruption("Cannot read index snapshot " + config.index_path + ": " + e.what());
    }
    auto* id_index = dynamic_cast<faiss::IndexIDMap*>(ann.get());
    if (id_index == nullptr) {
        return corruption("Index snapshot " + config.index_path + " is not an id-mapped index");
    }
    if (static_cast<size_t>(ann->d) != config.dimension) {
        return corruption("Index snapshot dimension " + std::to_string(ann->d) +
                          " does not match configured dimension " +
                          std::to_string(config.dimension));
    }

    auto loaded = IdMapStore::load(config.id_map_path, config.dimension);
    if (!loaded.ok()) {
        return core::Result<std::unique_ptr<VectorIndex>>::propagate(loaded);
    }
    IdMap id_map = loaded.take_value();

    // Both artifacts must describe the same id set.
    if (id_index->id_map.size() != id_map.size()) {
        return corruption("Index holds " + std::to_string(id_index->id_map.size()) +
                          " vectors but id map holds " + std::to_string(id_map.size()) + " entries");
    }
    std::unordered_set<core::RecordID> seen;
    for (auto fid : id_index->id_map) {
        auto id = static_cast<core::RecordID>(fid);
        if (!seen.insert(id).second) {
            return corruption("Index snapshot holds id " + std::to_string(id) + " twice");
        }
        if (id_map.find(id) == id_map.end()) {
            return corruption("Index snapshot id " + std::to_string(id) + " has no metadata");
        }
    }

    logger->info("Loaded index with {} entries (dimension {}) from {}",
                 id_map.size(), config.dimension, config.index_path);
    return core::Result<std::unique_ptr<VectorIndex>>(std::unique_ptr<VectorIndex>(
        new VectorIndex(config, logger, std::move(ann), std::move(id_map))));
}

core::Result<void> VectorIndex::add(core::RecordID id, const core::Vector& vector,
                                    const core::FileMetadata& metadata) {
    if (vector.size() != config_.dimension) {
        return core::Result<void>::error(core::Error::Code::DIMENSION_MISMATCH,
            "Vector dimension " + std::to_string(vector.size()) +
            " does not match index dimension " + std::to_string(config_.dimension));
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    const faiss::idx_t fid = static_cast<faiss::idx_t>(id);
    const bool replacing = id_map_.find(id) != id_map_.end();

    try {
        if (replacing) {
            removeFromAnnLocked(id);
        }
        ann_->add_with_ids(1, vector.data(), &fid);
    } catch (const faiss::FaissException& e) {
        // The old vector may already be gone; drop its metadata too so the
        // pair stays consistent.
        if (replacing) {
            id_map_.erase(id);
            auto persisted = persistLocked();
            if (!persisted.ok()) {
                logger_->error("Persist after failed add of {}: {}", id, persisted.error());
            }
        }
        logger_->error("ANN insert failed for id {}: {}", id, e.what());
        return core::Result<void>::error(core::Error::Code::INTERNAL,
                                         std::string("ANN insert failed: ") + e.what());
    }

    id_map_[id] = metadata;
    logger_->debug("{} id {} ({})", replacing ? "Replaced" : "Added", id, metadata.path);
    return persistLocked();
}

core::Result<void> VectorIndex::remove(core::RecordID id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = id_map_.find(id);
    if (it == id_map_.end()) {
        return core::Result<void>();
    }

    try {
        removeFromAnnLocked(id);
    } catch (const faiss::FaissException& e) {
        logger_->error("ANN removal failed for id {}: {}", id, e.what());
        return core::Result<void>::error(core::Error::Code::INTERNAL,
                                         std::string("ANN removal failed: ") + e.what());
    }
    logger_->debug("Removed id {} ({})", id, it->second.path);
    id_map_.erase(it);
    return persistLocked();
}

core::Result<std::vector<core::SearchResult>> VectorIndex::search(const core::Vector& query,
                                                                  int64_t top_k) const {
    using SearchResults = std::vector<core::SearchResult>;
    if (query.size() != config_.dimension) {
        return core::Result<SearchResults>::error(core::Error::Code::DIMENSION_MISMATCH,
            "Query dimension " + std::to_string(query.size()) +
            " does not match index dimension " + std::to_string(config_.dimension));
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);
    const faiss::idx_t k = std::min<faiss::idx_t>(top_k, ann_->ntotal);
    if (k <= 0) {
        return core::Result<SearchResults>(SearchResults{});
    }

    std::vector<float> distances(static_cast<size_t>(k));
    std::vector<faiss::idx_t> labels(static_cast<size_t>(k));
    try {
        ann_->search(1, query.data(), k, distances.data(), labels.data());
    } catch (const faiss::FaissException& e) {
        return core::Result<SearchResults>::error(core::Error::Code::INTERNAL,
                                                  std::string("ANN search failed: ") + e.what());
    }

    SearchResults results;
    results.reserve(static_cast<size_t>(k));
    for (faiss::idx_t i = 0; i < k; ++i) {
        if (labels[i] < 0) {
            continue;  // fewer than k hits
        }
        auto id = static_cast<core::RecordID>(labels[i]);
        auto it = id_map_.find(id);
        if (it == id_map_.end()) {
            logger_->warn("Search hit id {} has no metadata, skipping", id);
            continue;
        }
        results.push_back(core::SearchResult{id, distances[i], it->second});
    }

    std::sort(results.begin(), results.end(),
              [](const core::SearchResult& a, const core::SearchResult& b) {
                  if (a.distance != b.distance) {
                      return a.distance < b.distance;
                  }
                  return a.id < b.id;
              });
    return core::Result<SearchResults>(std::move(results));
}

bool VectorIndex::isEmpty() const {
    return count() == 0;
}

size_t VectorIndex::count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return static_cast<size_t>(ann_->ntotal);
}

bool VectorIndex::exists(core::RecordID id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return id_map_.find(id) != id_map_.end();
}

std::optional<core::FileMetadata> VectorIndex::get(core::RecordID id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = id_map_.find(id);
    if (it == id_map_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<core::RecordID> VectorIndex::idsUnder(const std::string& directory) const {
    std::string prefix = directory;
    if (prefix.empty() || prefix.back() != '/') {
        prefix += '/';
    }

    std::vector<core::RecordID> ids;
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& entry : id_map_) {
        const auto& path = entry.second.path;
        if (path == directory || path.compare(0, prefix.size(), prefix) == 0) {
            ids.push_back(entry.first);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

void VectorIndex::removeFromAnnLocked(core::RecordID id) {
    const faiss::idx_t fid = static_cast<faiss::idx_t>(id);
    faiss::IDSelectorBatch selector(1, &fid);
    as_id_map(ann_.get())->remove_ids(selector);
}

core::Result<void> VectorIndex::persistLocked() {
    const std::string tmp_index = config_.index_path + ".tmp";
    try {
        faiss::write_index(ann_.get(), tmp_index.c_str());
    } catch (const faiss::FaissException& e) {
        logger_->error("Failed to write index snapshot {}: {}", tmp_index, e.what());
        return core::Result<void>::error(core::Error::Code::PERSISTENCE_FAILED,
            "Failed to write index snapshot: " + std::string(e.what()));
    }

    std::error_code ec;
    std::filesystem::rename(tmp_index, config_.index_path, ec);
    if (ec) {
        logger_->error("Failed to move index snapshot into place: {}", ec.message());
        return core::Result<void>::error(core::Error::Code::PERSISTENCE_FAILED,
            "Cannot rename " + tmp_index + ": " + ec.message());
    }

    auto saved = IdMapStore::save(config_.id_map_path, config_.dimension, id_map_);
    if (!saved.ok()) {
        logger_->error("Failed to write id map: {}", saved.error());
    }
    return saved;
}

} // namespace index
} // namespace vecsync
