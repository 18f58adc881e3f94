#pragma once

#include "fluttersec/common/types.hpp"
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace fluttersec {
namespace test {

// Private directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir();
    ~TempDir();
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(const std::string& rel) const { return path_ / rel; }

private:
    std::filesystem::path path_;
};

void writeFile(const std::filesystem::path& path, const std::string& content);
void writeFile(const std::filesystem::path& path, const std::vector<uint8_t>& content);
std::string readFile(const std::filesystem::path& path);

using ZipEntries = std::vector<std::pair<std::string, std::string>>;

// Writes a zip archive with libarchive; entry names are stored verbatim.
void writeZip(const std::filesystem::path& path, const ZipEntries& entries);

common::Finding makeFinding(common::Severity severity, const std::string& title,
                            const std::string& description = "");

// bplist00 with a top-level dictionary of ASCII string pairs.
std::vector<uint8_t> buildBinaryPlist(const std::map<std::string, std::string>& entries);

// Compiled AndroidManifest.xml holding <manifest package versionName><application label/>.
std::vector<uint8_t> buildBinaryManifest(const std::string& package, const std::string& version,
                                         const std::string& label);

// Minimal Flutter APK entries: manifest, flutter_assets, libapp.so with the given strings.
ZipEntries flutterApkEntries(const std::vector<std::string>& binary_strings);

std::vector<std::filesystem::path> listWorkDirs(const std::string& label);

}}
