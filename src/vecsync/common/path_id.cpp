#include "vecsync/common/path_id.h"

#include <openssl/sha.h>

#include <algorithm>
#include <cctype>
#include <system_error>

namespace vecsync {
namespace common {

namespace {
constexpr core::RecordID kIdMask = 0x7FFFFFFFFFFFFFFFULL;
}

std::string canonical_path(const std::filesystem::path& path) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        absolute = path;
    }
    auto canonical = std::filesystem::weakly_canonical(absolute, ec);
    if (ec) {
        canonical = absolute.lexically_normal();
    }
    std::string result = canonical.string();
    // weakly_canonical keeps a trailing separator for "dir/"; drop it.
    while (result.size() > 1 && result.back() == std::filesystem::path::preferred_separator) {
        result.pop_back();
    }
    return result;
}

core::RecordID path_id(const std::string& canonical) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(canonical.data()),
           canonical.size(), hash);

    core::RecordID id = 0;
    for (int i = 0; i < 8; i++) {
        id = (id << 8) | static_cast<core::RecordID>(hash[i]);
    }
    return id & kIdMask;
}

core::RecordID path_id_for(const std::filesystem::path& path) {
    return path_id(canonical_path(path));
}

std::string lower_extension(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

} // namespace common
} // namespace vecsync
