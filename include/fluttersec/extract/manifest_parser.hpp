#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fluttersec {
namespace extract {

struct ManifestInfo {
    std::string package_name;
    std::string version_name;
    // Only set when the label is a literal string, not a resource reference.
    std::optional<std::string> label;
};

// Reads AndroidManifest.xml in either the compiled binary XML form found
// in APKs or plain text XML.
class ManifestParser {
public:
    static constexpr size_t MAX_MANIFEST_SIZE = 16 * 1024 * 1024;

    static std::optional<ManifestInfo> parseFile(const std::filesystem::path& path);
    static std::optional<ManifestInfo> parse(const std::vector<uint8_t>& data);

private:
    static std::optional<ManifestInfo> parseBinary(const std::vector<uint8_t>& data);
    static std::optional<ManifestInfo> parseText(const std::vector<uint8_t>& data);
};

}}
