#include "vecsync/embedding/embedding_provider.h"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <unordered_map>

namespace vecsync {
namespace embedding {

namespace {

uint64_t fnv1a(const std::string& token) {
    uint64_t hash = 0xcbf29ce484222325ULL;
    for (unsigned char c : token) {
        hash ^= c;
        hash *= 0x100000001b3ULL;
    }
    return hash;
}

std::unordered_map<std::string, uint32_t> tokenize(const std::string& text) {
    std::unordered_map<std::string, uint32_t> counts;
    std::string token;
    for (unsigned char c : text) {
        if (std::isalnum(c)) {
            token.push_back(static_cast<char>(std::tolower(c)));
        } else if (!token.empty()) {
            counts[token]++;
            token.clear();
        }
    }
    if (!token.empty()) {
        counts[token]++;
    }
    return counts;
}

} // namespace

HashingEmbeddingProvider::HashingEmbeddingProvider(size_t dimension)
    : dimension_(dimension == 0 ? 1 : dimension) {
}

core::Vector HashingEmbeddingProvider::embed(const std::string& text) const {
    core::Vector vec(dimension_, 0.0f);

    for (const auto& entry : tokenize(text)) {
        uint64_t h = fnv1a(entry.first);
        size_t bucket = static_cast<size_t>(h % dimension_);
        // High bit picks the sign so collisions partly cancel out.
        float sign = (h >> 63) ? -1.0f : 1.0f;
        vec[bucket] += sign * (1.0f + std::log(static_cast<float>(entry.second)));
    }

    double norm = 0.0;
    for (float v : vec) {
        norm += static_cast<double>(v) * v;
    }
    if (norm > 0.0) {
        const float inv = static_cast<float>(1.0 / std::sqrt(norm));
        for (auto& v : vec) {
            v *= inv;
        }
    }
    return vec;
}

} // namespace embedding
} // namespace vecsync
