#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fluttersec {
namespace extract {

// Top-level scalar entries of a property list dictionary. Strings are
// kept as-is, integers in decimal, booleans as "true"/"false"; nested
// containers are skipped.
using PlistDict = std::map<std::string, std::string>;

class PlistParser {
public:
    static constexpr size_t MAX_PLIST_SIZE = 16 * 1024 * 1024;

    static std::optional<PlistDict> parseFile(const std::filesystem::path& path);
    static std::optional<PlistDict> parse(const std::vector<uint8_t>& data);

private:
    static std::optional<PlistDict> parseBinary(const std::vector<uint8_t>& data);
    static std::optional<PlistDict> parseXml(const std::vector<uint8_t>& data);
};

}}
