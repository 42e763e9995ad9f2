#include "vecsync/index/id_map_store.h"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace vecsync {
namespace index {

namespace {

core::Result<IdMap> corrupt(const std::string& message) {
    return core::Result<IdMap>::error(core::Error::Code::INDEX_CORRUPTION,
                                      "Id map is corrupt: " + message);
}

bool read_entry(const rapidjson::Value& v, core::RecordID& id, core::FileMetadata& meta) {
    if (!v.IsObject()) return false;
    auto id_it = v.FindMember("id");
    auto path_it = v.FindMember("path");
    auto name_it = v.FindMember("filename");
    auto type_it = v.FindMember("file_type");
    auto size_it = v.FindMember("size_bytes");
    auto created_it = v.FindMember("created_at");
    auto modified_it = v.FindMember("last_modified");
    if (id_it == v.MemberEnd() || !id_it->value.IsUint64()) return false;
    if (path_it == v.MemberEnd() || !path_it->value.IsString()) return false;
    if (name_it == v.MemberEnd() || !name_it->value.IsString()) return false;
    if (type_it == v.MemberEnd() || !type_it->value.IsString()) return false;
    if (size_it == v.MemberEnd() || !size_it->value.IsUint64()) return false;
    if (created_it == v.MemberEnd() || !created_it->value.IsInt64()) return false;
    if (modified_it == v.MemberEnd() || !modified_it->value.IsInt64()) return false;

    id = id_it->value.GetUint64();
    meta.path = path_it->value.GetString();
    meta.filename = name_it->value.GetString();
    meta.file_type = type_it->value.GetString();
    meta.size_bytes = size_it->value.GetUint64();
    meta.created_at = created_it->value.GetInt64();
    meta.last_modified = modified_it->value.GetInt64();

    auto pages_it = v.FindMember("page_count");
    if (pages_it != v.MemberEnd()) {
        if (!pages_it->value.IsUint()) return false;
        meta.page_count = pages_it->value.GetUint();
    }
    return true;
}

} // namespace

std::string IdMapStore::to_json(size_t dimension, const IdMap& id_map) {
    rapidjson::Document doc;
    doc.SetObject();
    auto& allocator = doc.GetAllocator();

    doc.AddMember("version", kFormatVersion, allocator);
    doc.AddMember("dimension", static_cast<uint64_t>(dimension), allocator);

    // Sorted ids keep the file stable between saves of the same state.
    std::vector<core::RecordID> ids;
    ids.reserve(id_map.size());
    for (const auto& entry : id_map) {
        ids.push_back(entry.first);
    }
    std::sort(ids.begin(), ids.end());

    rapidjson::Value entries(rapidjson::kArrayType);
    for (auto id : ids) {
        const auto& meta = id_map.at(id);
        rapidjson::Value e(rapidjson::kObjectType);
        e.AddMember("id", static_cast<uint64_t>(id), allocator);
        e.AddMember("path", rapidjson::Value(meta.path.c_str(), allocator).Move(), allocator);
        e.AddMember("filename", rapidjson::Value(meta.filename.c_str(), allocator).Move(), allocator);
        e.AddMember("file_type", rapidjson::Value(meta.file_type.c_str(), allocator).Move(), allocator);
        e.AddMember("size_bytes", static_cast<uint64_t>(meta.size_bytes), allocator);
        e.AddMember("created_at", static_cast<int64_t>(meta.created_at), allocator);
        e.AddMember("last_modified", static_cast<int64_t>(meta.last_modified), allocator);
        if (meta.page_count) {
            e.AddMember("page_count", static_cast<unsigned>(*meta.page_count), allocator);
        }
        entries.PushBack(e, allocator);
    }
    doc.AddMember("entries", entries, allocator);

    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);
    return buffer.GetString();
}

core::Result<IdMap> IdMapStore::from_json(const std::string& json, size_t expected_dimension) {
    rapidjson::Document doc;
    doc.Parse(json.c_str(), json.size());
    if (doc.HasParseError()) {
        std::ostringstream ss;
        ss << "parse error at offset " << doc.GetErrorOffset() << ": "
           << rapidjson::GetParseError_En(doc.GetParseError());
        return corrupt(ss.str());
    }
    if (!doc.IsObject()) {
        return corrupt("root is not an object");
    }

    auto version_it = doc.FindMember("version");
    if (version_it == doc.MemberEnd() || !version_it->value.IsInt() ||
        version_it->value.GetInt() != kFormatVersion) {
        return corrupt("unsupported format version");
    }
    auto dim_it = doc.FindMember("dimension");
    if (dim_it == doc.MemberEnd() || !dim_it->value.IsUint64()) {
        return corrupt("missing dimension");
    }
    if (dim_it->value.GetUint64() != expected_dimension) {
        return corrupt("dimension " + std::to_string(dim_it->value.GetUint64()) +
                       " does not match configured dimension " + std::to_string(expected_dimension));
    }
    auto entries_it = doc.FindMember("entries");
    if (entries_it == doc.MemberEnd() || !entries_it->value.IsArray()) {
        return corrupt("missing entries");
    }

    IdMap id_map;
    for (const auto& v : entries_it->value.GetArray()) {
        core::RecordID id = 0;
        core::FileMetadata meta;
        if (!read_entry(v, id, meta)) {
            return corrupt("malformed entry");
        }
        if (!id_map.emplace(id, std::move(meta)).second) {
            return corrupt("duplicate id " + std::to_string(id));
        }
    }
    return core::Result<IdMap>(std::move(id_map));
}

core::Result<void> IdMapStore::save(const std::string& path, size_t dimension, const IdMap& id_map) {
    const std::string tmp_path = path + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            return core::Result<void>::error(core::Error::Code::PERSISTENCE_FAILED,
                                             "Cannot open " + tmp_path + " for writing");
        }
        out << to_json(dimension, id_map);
        out.flush();
        if (!out) {
            return core::Result<void>::error(core::Error::Code::PERSISTENCE_FAILED,
                                             "Failed writing " + tmp_path);
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        return core::Result<void>::error(core::Error::Code::PERSISTENCE_FAILED,
                                         "Cannot rename " + tmp_path + ": " + ec.message());
    }
    return core::Result<void>();
}

core::Result<IdMap> IdMapStore::load(const std::string& path, size_t expected_dimension) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return core::Result<IdMap>::error(core::Error::Code::PERSISTENCE_FAILED,
                                          "Cannot open id map " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return from_json(buffer.str(), expected_dimension);
}

} // namespace index
} // namespace vecsync
