#include "vecsync/query/query_engine.h"

#include <algorithm>
#include <cctype>

namespace vecsync {
namespace query {

namespace {

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

} // namespace

QueryEngine::QueryEngine(const index::VectorIndex& index,
                         const embedding::EmbeddingProvider& embedder,
                         const QueryOptimizer* optimizer,
                         common::LoggerPtr logger)
    : index_(index),
      embedder_(embedder),
      optimizer_(optimizer),
      logger_(logger ? std::move(logger) : common::Logger::null()) {
}

std::string QueryEngine::rewrite(const std::string& query) const {
    if (optimizer_ == nullptr) {
        return query;
    }
    try {
        std::string rewritten = optimizer_->optimize(query);
        if (is_blank(rewritten)) {
            logger_->warn("Query optimizer returned nothing for '{}', using the original", query);
            return query;
        }
        return rewritten;
    } catch (const std::exception& e) {
        logger_->warn("Query optimizer failed: {}; using the original query", e.what());
        return query;
    }
}

std::vector<core::SearchResult> QueryEngine::search(const std::string& query, int64_t top_k,
                                                    bool optimize) const {
    if (is_blank(query) || top_k <= 0) {
        return {};
    }

    try {
        const std::string text = optimize ? rewrite(query) : query;
        if (text != query) {
            logger_->debug("Query rewritten: '{}' -> '{}'", query, text);
        }

        const core::Vector vector = embedder_.embed(text);
        auto results = index_.search(vector, top_k);
        if (!results.ok()) {
            logger_->error("Search for '{}' failed: {}", text, results.error());
            return {};
        }
        logger_->info("Search '{}' returned {} results", text, results.value().size());
        return results.take_value();
    } catch (const std::exception& e) {
        logger_->error("Search for '{}' threw: {}", query, e.what());
        return {};
    }
}

} // namespace query
} // namespace vecsync
