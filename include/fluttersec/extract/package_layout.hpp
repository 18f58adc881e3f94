#pragma once

#include "../common/types.hpp"
#include <filesystem>
#include <optional>
#include <vector>

namespace fluttersec {
namespace extract {

// Canonical locations inside an unpacked APK or IPA.
class PackageLayout {
public:
    static constexpr const char* DEFAULT_ANDROID_ARCH = "arm64-v8a";

    PackageLayout(std::filesystem::path root, common::Platform platform);

    const std::filesystem::path& root() const { return root_; }
    common::Platform platform() const { return platform_; }

    // First Payload/*.app directory in name order (iOS only).
    std::optional<std::filesystem::path> appBundleDir() const;

    std::optional<std::filesystem::path> flutterAssetsDir() const;
    std::filesystem::path genericAssetsDir() const;

    // Candidate native binaries holding compiled Dart code, in scan
    // preference order. Only existing files are returned.
    std::vector<std::filesystem::path> nativeBinaries() const;
    std::optional<std::filesystem::path> primaryBinary() const;

    std::optional<std::filesystem::path> manifestFile() const;

    bool hasFlutterRuntime() const;

    std::string relativePath(const std::filesystem::path& path) const;

private:
    std::filesystem::path root_;
    common::Platform platform_;

    std::vector<std::filesystem::path> androidArchDirs() const;
};

}}
