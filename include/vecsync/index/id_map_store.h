#ifndef VECSYNC_INDEX_ID_MAP_STORE_H_
#define VECSYNC_INDEX_ID_MAP_STORE_H_

#include <string>
#include <unordered_map>

#include "vecsync/core/result.h"
#include "vecsync/core/types.h"

namespace vecsync {
namespace index {

using IdMap = std::unordered_map<core::RecordID, core::FileMetadata>;

/**
 * @brief JSON persistence of the id -> metadata map
 *
 * Layout:
 * ```
 * {"version": 1, "dimension": 384,
 *  "entries": [{"id": 123, "path": "...", "filename": "...", "file_type": "txt",
 *               "size_bytes": 10, "created_at": 0, "last_modified": 0,
 *               "page_count": 3}]}
 * ```
 * page_count is omitted when absent.
 */
class IdMapStore {
public:
    static constexpr int kFormatVersion = 1;

    // Writes to "<path>.tmp" and renames over path.
    static core::Result<void> save(const std::string& path, size_t dimension, const IdMap& id_map);

    // Fails with INDEX_CORRUPTION on malformed content or a dimension that
    // differs from expected_dimension.
    static core::Result<IdMap> load(const std::string& path, size_t expected_dimension);

    static std::string to_json(size_t dimension, const IdMap& id_map);
    static core::Result<IdMap> from_json(const std::string& json, size_t expected_dimension);
};

} // namespace index
} // namespace vecsync

#endif // VECSYNC_INDEX_ID_MAP_STORE_H_
