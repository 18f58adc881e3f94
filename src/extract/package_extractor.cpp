#include "fluttersec/extract/package_extractor.hpp"
#include "fluttersec/extract/apk_extractor.hpp"
#include "fluttersec/extract/ipa_extractor.hpp"
#include "fluttersec/core/error_codes.hpp"
#include "fluttersec/common/logger.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <fstream>

namespace fs = std::filesystem;

namespace fluttersec {
namespace extract {

using core::PipelineError;
using core::PipelineErrorCode;

namespace {

constexpr size_t READ_BLOCK_SIZE = 10240;

struct ArchiveDeleter {
    void operator()(struct archive* a) const {
        if (a) archive_read_free(a);
    }
};

using ArchivePtr = std::unique_ptr<struct archive, ArchiveDeleter>;

common::ErrorContext archiveContext(const fs::path& package) {
    common::ErrorContext ctx;
    ctx.component = "Extractor";
    ctx.with("package", package.string());
    return ctx;
}

}

ExtractionLimits ExtractionLimits::fromConfig(const common::ScanConfig& scan) {
    ExtractionLimits limits;
    limits.max_entries = scan.max_archive_entries;
    limits.max_total_bytes = scan.max_extracted_size_mb * 1024 * 1024;
    limits.max_compression_ratio = scan.max_compression_ratio;
    return limits;
}

bool isSafeEntryPath(const std::string& entry_path) {
    if (entry_path.empty() || entry_path[0] == '/' || entry_path[0] == '\\') {
        return false;
    }
    fs::path p(entry_path);
    if (p.has_root_name() || p.has_root_directory()) {
        return false;
    }
    for (const auto& part : p) {
        if (part == "..") {
            return false;
        }
    }
    return true;
}

PackageExtractor::PackageExtractor(fs::path package, ExtractionLimits limits,
                                   common::CancellationToken cancel)
    : package_(std::move(package)), limits_(limits), cancel_(std::move(cancel)) {}

std::unique_ptr<PackageExtractor> PackageExtractor::create(common::Platform platform,
                                                           fs::path package,
                                                           ExtractionLimits limits,
                                                           common::CancellationToken cancel) {
    switch (platform) {
        case common::Platform::ANDROID:
            return std::make_unique<ApkExtractor>(std::move(package), limits, std::move(cancel));
        case common::Platform::IOS:
            return std::make_unique<IpaExtractor>(std::move(package), limits, std::move(cancel));
        default:
            throw PipelineError(PipelineErrorCode::UNSUPPORTED_FORMAT, "", archiveContext(package));
    }
}

ExtractionStats PackageExtractor::extract(const WorkDirectory& target) {
    std::error_code ec;
    if (!fs::is_regular_file(package_, ec)) {
        throw PipelineError(PipelineErrorCode::FILE_NOT_FOUND,
                            "File not found: " + package_.string(), archiveContext(package_));
    }

    target.clear();
    root_ = target.path();

    common::Logger::instance().info("[Extractor] Extracting | package={} | target={}",
                                   package_.string(), root_.string());

    auto stats = unzip(root_);
    validateLayout();

    common::Logger::instance().info("[Extractor] Extracted | files={} | dirs={} | skipped={} | bytes={}",
                                   stats.files, stats.directories, stats.skipped,
                                   common::formatBytes(stats.total_bytes));
    return stats;
}

ExtractionStats PackageExtractor::unzip(const fs::path& target) {
    ArchivePtr a(archive_read_new());
    archive_read_support_format_zip(a.get());

    if (archive_read_open_filename(a.get(), package_.c_str(), READ_BLOCK_SIZE) != ARCHIVE_OK) {
        std::string reason = archive_error_string(a.get()) ? archive_error_string(a.get()) : "open failed";
        throw PipelineError(PipelineErrorCode::INVALID_ARCHIVE,
                            "Invalid archive: " + reason, archiveContext(package_));
    }

    std::error_code ec;
    size_t package_size = fs::file_size(package_, ec);
    if (ec || package_size == 0) {
        package_size = 1;
    }

    ExtractionStats stats;
    size_t entry_count = 0;
    struct archive_entry* entry = nullptr;
    int r;
    std::vector<char> buffer(64 * 1024);

    while ((r = archive_read_next_header(a.get(), &entry)) == ARCHIVE_OK) {
        if (cancel_.isCancelled()) {
            throw PipelineError(PipelineErrorCode::CANCELLED, "", archiveContext(package_));
        }

        if (++entry_count > limits_.max_entries) {
            throw PipelineError(PipelineErrorCode::INVALID_ARCHIVE,
                                "Archive entry limit exceeded",
                                archiveContext(package_).with("limit", std::to_string(limits_.max_entries)));
        }

        const char* pathname = archive_entry_pathname(entry);
        std::string entry_path = pathname ? pathname : "";

        if (!isSafeEntryPath(entry_path)) {
            common::Logger::instance().warn("[Extractor] Unsafe entry skipped | entry={}", entry_path);
            stats.skipped++;
            continue;
        }

        fs::path out_path = target / fs::path(entry_path).lexically_normal();
        auto filetype = archive_entry_filetype(entry);

        if (filetype == AE_IFDIR) {
            fs::create_directories(out_path, ec);
            stats.directories++;
            continue;
        }

        if (filetype != AE_IFREG) {
            common::Logger::instance().debug("[Extractor] Non-regular entry skipped | entry={}", entry_path);
            stats.skipped++;
            continue;
        }

        if (archive_entry_size_is_set(entry)) {
            auto declared = static_cast<size_t>(std::max<la_int64_t>(0, archive_entry_size(entry)));
            if (declared > package_size * limits_.max_compression_ratio) {
                throw PipelineError(PipelineErrorCode::INVALID_ARCHIVE,
                                    "Compression ratio limit exceeded",
                                    archiveContext(package_).with("entry", entry_path));
            }
        }

        fs::create_directories(out_path.parent_path(), ec);
        std::ofstream out(out_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            common::Logger::instance().warn("[Extractor] Write open failed | path={}", out_path.string());
            stats.skipped++;
            continue;
        }

        la_ssize_t n;
        while ((n = archive_read_data(a.get(), buffer.data(), buffer.size())) > 0) {
            stats.total_bytes += static_cast<size_t>(n);
            if (stats.total_bytes > limits_.max_total_bytes) {
                throw PipelineError(PipelineErrorCode::INVALID_ARCHIVE,
                                    "Extracted size limit exceeded",
                                    archiveContext(package_).with("limit", common::formatBytes(limits_.max_total_bytes)));
            }
            out.write(buffer.data(), n);
        }

        if (n < 0) {
            std::string reason = archive_error_string(a.get()) ? archive_error_string(a.get()) : "read failed";
            throw PipelineError(PipelineErrorCode::INVALID_ARCHIVE,
                                "Corrupt archive entry: " + reason,
                                archiveContext(package_).with("entry", entry_path));
        }

        stats.files++;
    }

    if (r != ARCHIVE_EOF) {
        std::string reason = archive_error_string(a.get()) ? archive_error_string(a.get()) : "header read failed";
        throw PipelineError(PipelineErrorCode::INVALID_ARCHIVE,
                            "Invalid archive: " + reason, archiveContext(package_));
    }

    if (entry_count == 0) {
        throw PipelineError(PipelineErrorCode::INVALID_ARCHIVE,
                            "Archive contains no entries", archiveContext(package_));
    }

    return stats;
}

PackageMetadata PackageExtractor::metadata() const {
    PackageMetadata meta;
    readMetadata(meta);

    if (meta.app_name.empty()) {
        meta.app_name = package_.stem().string();
    }
    if (meta.package_name.empty()) {
        meta.package_name = "unknown";
    }
    return meta;
}

bool PackageExtractor::detectFlutter() const {
    return layout().hasFlutterRuntime();
}

std::vector<std::string> PackageExtractor::listFiles() const {
    std::vector<std::string> files;
    std::error_code ec;
    if (root_.empty() || !fs::is_directory(root_, ec)) {
        return files;
    }

    PackageLayout l = layout();
    for (fs::recursive_directory_iterator it(root_, ec), end; it != end; it.increment(ec)) {
        if (ec) break;
        if (it->is_regular_file(ec) && it->path().filename() != WorkDirectory::MARKER_FILE) {
            files.push_back(l.relativePath(it->path()));
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

}}
