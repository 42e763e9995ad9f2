#ifndef VECSYNC_QUERY_QUERY_ENGINE_H_
#define VECSYNC_QUERY_QUERY_ENGINE_H_

#include <cstdint>
#include <string>
#include <vector>

#include "vecsync/common/logger.h"
#include "vecsync/core/types.h"
#include "vecsync/embedding/embedding_provider.h"
#include "vecsync/index/vector_index.h"
#include "vecsync/query/query_optimizer.h"

namespace vecsync {
namespace query {

/**
 * @brief Text query front end over the vector index
 *
 * search() never throws: any failure (embedding, dimension mismatch, ANN
 * error) is logged and turned into an empty result.
 */
class QueryEngine {
public:
    // optimizer may be null; the engine then embeds queries as given.
    QueryEngine(const index::VectorIndex& index,
                const embedding::EmbeddingProvider& embedder,
                const QueryOptimizer* optimizer,
                common::LoggerPtr logger);

    std::vector<core::SearchResult> search(const std::string& query, int64_t top_k,
                                           bool optimize = true) const;

    // Rewritten query, or the input when there is no optimizer or it fails.
    std::string rewrite(const std::string& query) const;

private:
    const index::VectorIndex& index_;
    const embedding::EmbeddingProvider& embedder_;
    const QueryOptimizer* optimizer_;
    common::LoggerPtr logger_;
};

} // namespace query
} // namespace vecsync

#endif // VECSYNC_QUERY_QUERY_ENGINE_H_
