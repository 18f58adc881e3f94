#include "fluttersec/extract/package_layout.hpp"
#include <algorithm>

namespace fs = std::filesystem;

namespace fluttersec {
namespace extract {

PackageLayout::PackageLayout(fs::path root, common::Platform platform)
    : root_(std::move(root)), platform_(platform) {}

std::optional<fs::path> PackageLayout::appBundleDir() const {
    std::error_code ec;
    fs::path payload = root_ / "Payload";
    if (!fs::is_directory(payload, ec)) {
        return std::nullopt;
    }

    std::vector<fs::path> bundles;
    for (const auto& entry : fs::directory_iterator(payload, ec)) {
        if (entry.is_directory(ec) && entry.path().extension() == ".app") {
            bundles.push_back(entry.path());
        }
    }
    if (bundles.empty()) {
        return std::nullopt;
    }
    std::sort(bundles.begin(), bundles.end());
    return bundles.front();
}

std::optional<fs::path> PackageLayout::flutterAssetsDir() const {
    std::error_code ec;
    fs::path candidate;

    if (platform_ == common::Platform::ANDROID) {
        candidate = root_ / "assets" / "flutter_assets";
    } else if (platform_ == common::Platform::IOS) {
        auto app = appBundleDir();
        if (!app) {
            return std::nullopt;
        }
        candidate = *app / "Frameworks" / "App.framework" / "flutter_assets";
    } else {
        return std::nullopt;
    }

    if (fs::is_directory(candidate, ec)) {
        return candidate;
    }
    return std::nullopt;
}

fs::path PackageLayout::genericAssetsDir() const {
    return root_ / "assets";
}

std::vector<fs::path> PackageLayout::androidArchDirs() const {
    std::error_code ec;
    std::vector<fs::path> dirs;
    fs::path lib = root_ / "lib";
    if (!fs::is_directory(lib, ec)) {
        return dirs;
    }

    for (const auto& entry : fs::directory_iterator(lib, ec)) {
        if (entry.is_directory(ec)) {
            dirs.push_back(entry.path());
        }
    }

    std::sort(dirs.begin(), dirs.end(), [](const fs::path& a, const fs::path& b) {
        bool a_default = a.filename() == DEFAULT_ANDROID_ARCH;
        bool b_default = b.filename() == DEFAULT_ANDROID_ARCH;
        if (a_default != b_default) {
            return a_default;
        }
        return a.filename() < b.filename();
    });
    return dirs;
}

std::vector<fs::path> PackageLayout::nativeBinaries() const {
    std::error_code ec;
    std::vector<fs::path> binaries;

    if (platform_ == common::Platform::ANDROID) {
        for (const auto& arch : androidArchDirs()) {
            fs::path candidate = arch / "libapp.so";
            if (fs::is_regular_file(candidate, ec)) {
                binaries.push_back(candidate);
            }
        }
    } else if (platform_ == common::Platform::IOS) {
        auto app = appBundleDir();
        if (!app) {
            return binaries;
        }
        fs::path framework_binary = *app / "Frameworks" / "App.framework" / "App";
        if (fs::is_regular_file(framework_binary, ec)) {
            binaries.push_back(framework_binary);
        }
        fs::path main_binary = *app / app->stem();
        if (fs::is_regular_file(main_binary, ec)) {
            binaries.push_back(main_binary);
        }
    }

    return binaries;
}

std::optional<fs::path> PackageLayout::primaryBinary() const {
    auto binaries = nativeBinaries();
    if (binaries.empty()) {
        return std::nullopt;
    }
    return binaries.front();
}

std::optional<fs::path> PackageLayout::manifestFile() const {
    std::error_code ec;
    fs::path candidate;

    if (platform_ == common::Platform::ANDROID) {
        candidate = root_ / "AndroidManifest.xml";
    } else if (platform_ == common::Platform::IOS) {
        auto app = appBundleDir();
        if (!app) {
            return std::nullopt;
        }
        candidate = *app / "Info.plist";
    } else {
        return std::nullopt;
    }

    if (fs::is_regular_file(candidate, ec)) {
        return candidate;
    }
    return std::nullopt;
}

bool PackageLayout::hasFlutterRuntime() const {
    if (flutterAssetsDir()) {
        return true;
    }

    std::error_code ec;
    if (platform_ == common::Platform::ANDROID) {
        for (const auto& arch : androidArchDirs()) {
            if (fs::is_regular_file(arch / "libflutter.so", ec)) {
                return true;
            }
        }
    } else if (platform_ == common::Platform::IOS) {
        auto app = appBundleDir();
        if (app && fs::is_directory(*app / "Frameworks" / "Flutter.framework", ec)) {
            return true;
        }
    }
    return false;
}

std::string PackageLayout::relativePath(const fs::path& path) const {
    std::error_code ec;
    auto rel = fs::relative(path, root_, ec);
    if (ec || rel.empty()) {
        return path.generic_string();
    }
    return rel.generic_string();
}

}}
