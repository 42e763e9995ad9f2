#ifndef VECSYNC_EMBEDDING_EMBEDDING_PROVIDER_H_
#define VECSYNC_EMBEDDING_EMBEDDING_PROVIDER_H_

#include <cstddef>
#include <string>

#include "vecsync/core/types.h"

namespace vecsync {
namespace embedding {

/**
 * @brief Interface for turning text into a fixed-length vector
 *
 * embed() always returns exactly dimension() floats. On internal failure,
 * or for blank text, it returns the zero vector instead of throwing:
 * callers treat every successful extraction as yielding a usable vector.
 * Implementations must be safe to call from several threads at once.
 */
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    virtual size_t dimension() const = 0;
    virtual core::Vector embed(const std::string& text) const = 0;
};

/**
 * @brief Deterministic feature-hashing embedding
 *
 * Lower-cased alphanumeric tokens are hashed (FNV-1a) into dimension()
 * signed buckets, weighted by log term frequency, and the result is L2
 * normalized. Texts sharing vocabulary land close together, which is
 * enough for local search without a model.
 */
class HashingEmbeddingProvider : public EmbeddingProvider {
public:
    explicit HashingEmbeddingProvider(size_t dimension);

    size_t dimension() const override { return dimension_; }
    core::Vector embed(const std::string& text) const override;

private:
    size_t dimension_;
};

} // namespace embedding
} // namespace vecsync

#endif // VECSYNC_EMBEDDING_EMBEDDING_PROVIDER_H_
