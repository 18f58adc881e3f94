#pragma once

#include "package_layout.hpp"
#include "work_directory.hpp"
#include "../common/cancellation.hpp"
#include "../common/config.hpp"
#include "../common/constants.hpp"
#include "../common/types.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace fluttersec {
namespace extract {

struct ExtractionLimits {
    size_t max_entries = constants::limits::DEFAULT_MAX_ARCHIVE_ENTRIES;
    size_t max_total_bytes = constants::limits::DEFAULT_MAX_EXTRACTED_SIZE_MB * 1024 * 1024;
    size_t max_compression_ratio = constants::limits::DEFAULT_MAX_COMPRESSION_RATIO;

    static ExtractionLimits fromConfig(const common::ScanConfig& scan);
};

struct ExtractionStats {
    size_t files = 0;
    size_t directories = 0;
    size_t skipped = 0;
    size_t total_bytes = 0;
};

struct PackageMetadata {
    std::string app_name;
    std::string package_name;
    std::string version;
};

class PackageExtractor {
public:
    PackageExtractor(std::filesystem::path package, ExtractionLimits limits,
                     common::CancellationToken cancel = {});
    virtual ~PackageExtractor() = default;

    PackageExtractor(const PackageExtractor&) = delete;
    PackageExtractor& operator=(const PackageExtractor&) = delete;

    static std::unique_ptr<PackageExtractor> create(common::Platform platform,
                                                    std::filesystem::path package,
                                                    ExtractionLimits limits,
                                                    common::CancellationToken cancel = {});

    virtual common::Platform platform() const = 0;
    virtual std::string label() const = 0;

    // Unpacks the package into `target` (cleared first), then checks the
    // platform layout. Throws core::PipelineError.
    ExtractionStats extract(const WorkDirectory& target);

    // Falls back to the package stem and "unknown" when metadata is absent.
    PackageMetadata metadata() const;

    bool detectFlutter() const;
    std::vector<std::string> listFiles() const;

    const std::filesystem::path& packagePath() const { return package_; }
    const std::filesystem::path& root() const { return root_; }
    PackageLayout layout() const { return PackageLayout(root_, platform()); }

protected:
    virtual void validateLayout() const {}
    virtual void readMetadata(PackageMetadata& meta) const = 0;

    std::filesystem::path package_;
    std::filesystem::path root_;
    ExtractionLimits limits_;
    common::CancellationToken cancel_;

private:
    ExtractionStats unzip(const std::filesystem::path& target);
};

// Rejects absolute paths and ".." components.
bool isSafeEntryPath(const std::string& entry_path);

}}
