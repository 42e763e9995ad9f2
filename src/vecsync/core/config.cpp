#include "vecsync/core/config.h"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace vecsync {
namespace core {

namespace {

using Object = rapidjson::Value::ConstObject;

Result<void> type_error(const std::string& section, const char* key, const char* expected) {
    return Result<void>::error(Error::Code::INVALID_ARGUMENT,
        "Config key '" + section + "." + key + "' must be " + expected);
}

Result<void> read_string(const Object& obj, const std::string& section, const char* key,
                         std::string& out) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd()) return Result<void>();
    if (!it->value.IsString()) return type_error(section, key, "a string");
    out = it->value.GetString();
    return Result<void>();
}

template<typename T>
Result<void> read_uint(const Object& obj, const std::string& section, const char* key, T& out) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd()) return Result<void>();
    if (!it->value.IsUint64()) return type_error(section, key, "a non-negative integer");
    out = static_cast<T>(it->value.GetUint64());
    return Result<void>();
}

Result<void> read_ms(const Object& obj, const std::string& section, const char* key,
                     std::chrono::milliseconds& out) {
    uint64_t value = 0;
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd()) return Result<void>();
    auto r = read_uint(obj, section, key, value);
    if (!r.ok()) return r;
    out = std::chrono::milliseconds(value);
    return Result<void>();
}

Result<void> read_bool(const Object& obj, const std::string& section, const char* key, bool& out) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd()) return Result<void>();
    if (!it->value.IsBool()) return type_error(section, key, "a boolean");
    out = it->value.GetBool();
    return Result<void>();
}

Result<void> read_double(const Object& obj, const std::string& section, const char* key,
                         double& out) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd()) return Result<void>();
    if (!it->value.IsNumber()) return type_error(section, key, "a number");
    out = it->value.GetDouble();
    return Result<void>();
}

Result<void> read_strings(const Object& obj, const std::string& section, const char* key,
                          std::vector<std::string>& out) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd()) return Result<void>();
    if (!it->value.IsArray()) return type_error(section, key, "an array of strings");
    std::vector<std::string> values;
    for (const auto& v : it->value.GetArray()) {
        if (!v.IsString()) return type_error(section, key, "an array of strings");
        values.emplace_back(v.GetString());
    }
    out = std::move(values);
    return Result<void>();
}

// Runs each reader in turn and stops at the first failure.
#define VECSYNC_CONFIG_READ(expr)      \
    do {                               \
        auto _r = (expr);              \
        if (!_r.ok()) return _r;       \
    } while (0)

Result<void> parse_index(const Object& obj, IndexConfig& c) {
    const std::string s = "index";
    VECSYNC_CONFIG_READ(read_uint(obj, s, "dimension", c.dimension));
    VECSYNC_CONFIG_READ(read_string(obj, s, "index_path", c.index_path));
    VECSYNC_CONFIG_READ(read_string(obj, s, "id_map_path", c.id_map_path));
    return Result<void>();
}

Result<void> parse_scanner(const Object& obj, ScannerConfig& c) {
    const std::string s = "scanner";
    VECSYNC_CONFIG_READ(read_strings(obj, s, "supported_extensions", c.supported_extensions));
    VECSYNC_CONFIG_READ(read_uint(obj, s, "scan_workers", c.scan_workers));
    VECSYNC_CONFIG_READ(read_string(obj, s, "scan_log_path", c.scan_log_path));
    return Result<void>();
}

Result<void> parse_extractor(const Object& obj, ExtractorConfig& c) {
    VECSYNC_CONFIG_READ(read_double(obj, "extractor", "max_file_size_mb", c.max_file_size_mb));
    return Result<void>();
}

Result<void> parse_monitor(const Object& obj, MonitorConfig& c) {
    const std::string s = "monitor";
    VECSYNC_CONFIG_READ(read_uint(obj, s, "event_workers", c.event_workers));
    VECSYNC_CONFIG_READ(read_ms(obj, s, "cooldown_ms", c.cooldown));
    VECSYNC_CONFIG_READ(read_ms(obj, s, "created_suppression_ms", c.created_suppression));
    VECSYNC_CONFIG_READ(read_ms(obj, s, "settle_delay_ms", c.settle_delay));
    VECSYNC_CONFIG_READ(read_ms(obj, s, "shutdown_timeout_ms", c.shutdown_timeout));
    VECSYNC_CONFIG_READ(read_ms(obj, s, "poll_interval_ms", c.poll_interval));
    VECSYNC_CONFIG_READ(read_strings(obj, s, "ignore_patterns", c.ignore_patterns));
    return Result<void>();
}

Result<void> parse_query(const Object& obj, QueryConfig& c) {
    VECSYNC_CONFIG_READ(read_uint(obj, "query", "default_top_k", c.default_top_k));
    VECSYNC_CONFIG_READ(read_bool(obj, "query", "optimize", c.optimize));
    return Result<void>();
}

Result<void> parse_log(const Object& obj, LogConfig& c) {
    VECSYNC_CONFIG_READ(read_string(obj, "log", "level", c.level));
    VECSYNC_CONFIG_READ(read_string(obj, "log", "file", c.file));
    return Result<void>();
}

template<typename Section, typename Parser>
Result<void> parse_section(const rapidjson::Document& doc, const char* name, Section& section,
                           Parser parser) {
    auto it = doc.FindMember(name);
    if (it == doc.MemberEnd()) return Result<void>();
    if (!it->value.IsObject()) {
        return Result<void>::error(Error::Code::INVALID_ARGUMENT,
            std::string("Config section '") + name + "' must be an object");
    }
    return parser(it->value.GetObject(), section);
}

} // namespace

void Config::set_data_dir(const std::string& data_dir) {
    std::filesystem::path dir(data_dir);
    index.index_path = (dir / "faiss.index").string();
    index.id_map_path = (dir / "id_map.json").string();
}

Result<void> Config::validate() const {
    if (index.dimension == 0) {
        return Result<void>::error(Error::Code::INVALID_ARGUMENT, "index.dimension must be positive");
    }
    if (index.index_path.empty() || index.id_map_path.empty()) {
        return Result<void>::error(Error::Code::INVALID_ARGUMENT, "index paths must be set");
    }
    if (index.index_path == index.id_map_path) {
        return Result<void>::error(Error::Code::INVALID_ARGUMENT,
            "index.index_path and index.id_map_path must differ");
    }
    if (monitor.event_workers == 0) {
        return Result<void>::error(Error::Code::INVALID_ARGUMENT, "monitor.event_workers must be positive");
    }
    if (query.default_top_k == 0) {
        return Result<void>::error(Error::Code::INVALID_ARGUMENT, "query.default_top_k must be positive");
    }
    return Result<void>();
}

Result<Config> parse_config(const std::string& json) {
    rapidjson::Document doc;
    doc.Parse(json.c_str(), json.size());
    if (doc.HasParseError()) {
        std::ostringstream ss;
        ss << "Invalid config JSON at offset " << doc.GetErrorOffset() << ": "
           << rapidjson::GetParseError_En(doc.GetParseError());
        return Result<Config>::error(Error::Code::INVALID_ARGUMENT, ss.str());
    }
    if (!doc.IsObject()) {
        return Result<Config>::error(Error::Code::INVALID_ARGUMENT, "Config root must be an object");
    }

    Config config = Config::Default();
    std::vector<Result<void>> steps;
    steps.push_back(parse_section(doc, "index", config.index, parse_index));
    steps.push_back(parse_section(doc, "scanner", config.scanner, parse_scanner));
    steps.push_back(parse_section(doc, "extractor", config.extractor, parse_extractor));
    steps.push_back(parse_section(doc, "monitor", config.monitor, parse_monitor));
    steps.push_back(parse_section(doc, "query", config.query, parse_query));
    steps.push_back(parse_section(doc, "log", config.log, parse_log));
    for (const auto& step : steps) {
        if (!step.ok()) {
            return Result<Config>::propagate(step);
        }
    }
    return Result<Config>(std::move(config));
}

Result<Config> load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<Config>::error(Error::Code::NOT_FOUND, "Cannot open config file: " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return parse_config(buffer.str());
}

} // namespace core
} // namespace vecsync
