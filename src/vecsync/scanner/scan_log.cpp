#include "vecsync/scanner/scan_log.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace vecsync {
namespace scanner {

namespace {

const std::string kRule(50, '=');

std::string display_time(core::Timestamp ts) {
    std::string iso = core::format_timestamp(ts);
    auto t = iso.find('T');
    if (t != std::string::npos) {
        iso[t] = ' ';
    }
    return iso;
}

} // namespace

ScanLog::ScanLog(std::string path) : path_(std::move(path)) {
}

core::Result<void> ScanLog::append(const core::ScanResult& result) {
    std::ostringstream out;
    out << "File System Scan Results\n" << kRule << "\n";
    out << "Scan started at: " << display_time(result.scan_time()) << "\n";
    out << "Duration: " << result.duration_ms() << " ms\n";
    out << "Scanned directories:\n";
    for (const auto& root : result.scanned_paths()) {
        out << "- " << root << "\n";
    }
    out << kRule << "\n";
    for (const auto& record : result.scanned_files()) {
        out << record.metadata.to_string() << "\n";
    }
    for (const auto& error : result.errors()) {
        out << "ERROR " << error << "\n";
    }
    out << "Indexed " << result.scanned_files().size() << " files, "
        << result.errors().size() << " errors\n\n";
    return write(out.str());
}

core::Result<void> ScanLog::appendChange(const core::VectorRecord& record, core::ChangeKind kind) {
    std::ostringstream out;
    out << "[" << display_time(core::now_millis()) << "] " << core::change_kind_name(kind) << " ";
    if (record.indexed()) {
        out << record.metadata.to_string();
    } else {
        out << record.metadata.path;
    }
    out << "\n";
    return write(out.str());
}

core::Result<void> ScanLog::write(const std::string& block) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return core::Result<void>::error(core::Error::Code::PERSISTENCE_FAILED,
                "Cannot create " + parent.string() + ": " + ec.message());
        }
    }

    std::ofstream file(path_, std::ios::app);
    if (!file) {
        return core::Result<void>::error(core::Error::Code::PERSISTENCE_FAILED,
                                         "Cannot open scan log " + path_);
    }
    file << block;
    file.flush();
    if (!file) {
        return core::Result<void>::error(core::Error::Code::PERSISTENCE_FAILED,
                                         "Write to scan log " + path_ + " failed");
    }
    return core::Result<void>();
}

} // namespace scanner
} // namespace vecsync
