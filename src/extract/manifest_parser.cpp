#include "fluttersec/extract/manifest_parser.hpp"
#include "fluttersec/extract/byte_reader.hpp"
#include "fluttersec/common/logger.hpp"
#include <pugixml.hpp>
#include <algorithm>
#include <cstdio>

namespace fluttersec {
namespace extract {

namespace {

constexpr uint16_t RES_XML_TYPE = 0x0003;
constexpr uint16_t RES_STRING_POOL_TYPE = 0x0001;
constexpr uint16_t RES_XML_START_ELEMENT_TYPE = 0x0102;

constexpr uint32_t UTF8_FLAG = 1 << 8;
constexpr uint32_t NO_INDEX = 0xFFFFFFFF;

constexpr uint8_t TYPE_REFERENCE = 0x01;
constexpr uint8_t TYPE_STRING = 0x03;
constexpr uint8_t TYPE_INT_DEC = 0x10;
constexpr uint8_t TYPE_INT_HEX = 0x11;
constexpr uint8_t TYPE_INT_BOOLEAN = 0x12;

class StringPool {
public:
    bool load(const std::vector<uint8_t>& data, size_t chunk) {
        if (!in_bounds(data, chunk, 28)) return false;

        uint32_t chunk_size = read_le32(data, chunk + 4);
        uint32_t count = read_le32(data, chunk + 8);
        uint32_t flags = read_le32(data, chunk + 16);
        uint32_t strings_start = read_le32(data, chunk + 20);
        uint16_t header_size = read_le16(data, chunk + 2);

        if (!in_bounds(data, chunk, chunk_size)) return false;
        if (!in_bounds(data, chunk + header_size, static_cast<size_t>(count) * 4)) return false;

        bool utf8 = (flags & UTF8_FLAG) != 0;
        size_t chunk_end = chunk + chunk_size;
        strings_.reserve(count);

        for (uint32_t i = 0; i < count; ++i) {
            size_t offset = chunk + strings_start + read_le32(data, chunk + header_size + i * 4);
            std::string value;
            if (offset < chunk_end) {
                value = utf8 ? decodeUtf8(data, offset, chunk_end) : decodeUtf16(data, offset, chunk_end);
            }
            strings_.push_back(std::move(value));
        }
        return true;
    }

    std::string get(uint32_t index) const {
        return index < strings_.size() ? strings_[index] : std::string();
    }

private:
    std::vector<std::string> strings_;

    static std::string decodeUtf8(const std::vector<uint8_t>& data, size_t off, size_t end) {
        // utf16 length, then utf8 length; each 1 or 2 bytes
        auto read_len = [&](size_t& pos) -> size_t {
            if (pos >= end) return 0;
            size_t len = data[pos++];
            if (len & 0x80) {
                if (pos >= end) return 0;
                len = ((len & 0x7F) << 8) | data[pos++];
            }
            return len;
        };
        size_t pos = off;
        read_len(pos);
        size_t len = read_len(pos);
        if (pos > end || len > end - pos) return std::string();
        return std::string(reinterpret_cast<const char*>(data.data() + pos), len);
    }

    static std::string decodeUtf16(const std::vector<uint8_t>& data, size_t off, size_t end) {
        if (off + 2 > end) return std::string();
        size_t len = read_le16(data, off);
        size_t pos = off + 2;
        if (len & 0x8000) {
            if (pos + 2 > end) return std::string();
            len = ((len & 0x7FFF) << 16) | read_le16(data, pos);
            pos += 2;
        }
        if (len * 2 > end - pos) return std::string();

        std::vector<uint16_t> units(len);
        for (size_t i = 0; i < len; ++i) {
            units[i] = read_le16(data, pos + i * 2);
        }
        return utf16_to_utf8(units);
    }
};

struct Attribute {
    std::string name;
    std::string value;
    uint8_t type = 0;
};

std::string typedValueText(const StringPool& pool, uint32_t raw, uint8_t type, uint32_t value) {
    if (raw != NO_INDEX) {
        return pool.get(raw);
    }
    char buf[16];
    switch (type) {
        case TYPE_STRING:
            return pool.get(value);
        case TYPE_INT_DEC:
            return std::to_string(static_cast<int32_t>(value));
        case TYPE_INT_BOOLEAN:
            return value ? "true" : "false";
        case TYPE_REFERENCE:
            std::snprintf(buf, sizeof(buf), "@0x%08x", value);
            return buf;
        case TYPE_INT_HEX:
        default:
            std::snprintf(buf, sizeof(buf), "0x%08x", value);
            return buf;
    }
}

}

std::optional<ManifestInfo> ManifestParser::parseFile(const std::filesystem::path& path) {
    std::vector<uint8_t> data;
    if (!read_file_bytes(path.string(), data, MAX_MANIFEST_SIZE)) {
        common::Logger::instance().debug("[Manifest] Read failed | path={}", path.string());
        return std::nullopt;
    }
    return parse(data);
}

std::optional<ManifestInfo> ManifestParser::parse(const std::vector<uint8_t>& data) {
    if (data.size() >= 8 && read_le16(data, 0) == RES_XML_TYPE) {
        return parseBinary(data);
    }
    return parseText(data);
}

std::optional<ManifestInfo> ManifestParser::parseBinary(const std::vector<uint8_t>& data) {
    uint16_t file_header_size = read_le16(data, 2);
    uint32_t file_size = read_le32(data, 4);
    size_t end = std::min<size_t>(file_size, data.size());

    StringPool pool;
    bool have_pool = false;
    bool seen_manifest = false;
    ManifestInfo info;

    size_t offset = file_header_size;
    while (offset + 8 <= end) {
        uint16_t type = read_le16(data, offset);
        uint16_t header_size = read_le16(data, offset + 2);
        uint32_t chunk_size = read_le32(data, offset + 4);
        if (chunk_size < 8 || !in_bounds(data, offset, chunk_size)) {
            common::Logger::instance().debug("[Manifest] Truncated chunk | offset={}", offset);
            break;
        }

        if (type == RES_STRING_POOL_TYPE && !have_pool) {
            have_pool = pool.load(data, offset);
        } else if (type == RES_XML_START_ELEMENT_TYPE && have_pool && in_bounds(data, offset, 36)) {
            std::string element = pool.get(read_le32(data, offset + 20));
            uint16_t attr_start = read_le16(data, offset + 24);
            uint16_t attr_size = read_le16(data, offset + 26);
            uint16_t attr_count = read_le16(data, offset + 28);
            size_t attrs = offset + header_size + attr_start;

            if (attr_size < 20) attr_size = 20;

            for (uint16_t i = 0; i < attr_count; ++i) {
                size_t a = attrs + static_cast<size_t>(i) * attr_size;
                if (!in_bounds(data, a, 20) || a + 20 > offset + chunk_size) break;

                std::string name = pool.get(read_le32(data, a + 4));
                uint32_t raw = read_le32(data, a + 8);
                uint8_t data_type = data[a + 15];
                uint32_t value = read_le32(data, a + 16);

                if (element == "manifest") {
                    if (name == "package") {
                        info.package_name = typedValueText(pool, raw, data_type, value);
                    } else if (name == "versionName") {
                        info.version_name = typedValueText(pool, raw, data_type, value);
                    }
                } else if (element == "application" && name == "label" && !info.label) {
                    if (raw != NO_INDEX || data_type == TYPE_STRING) {
                        info.label = typedValueText(pool, raw, data_type, value);
                    }
                }
            }

            if (element == "manifest") {
                seen_manifest = true;
            }
        }

        offset += chunk_size;
    }

    if (!seen_manifest) {
        return std::nullopt;
    }
    return info;
}

std::optional<ManifestInfo> ManifestParser::parseText(const std::vector<uint8_t>& data) {
    pugi::xml_document doc;
    pugi::xml_parse_result res = doc.load_buffer(data.data(), data.size(),
                                                 pugi::parse_default, pugi::encoding_auto);
    if (!res) {
        common::Logger::instance().debug("[Manifest] XML parse failed | error={}", res.description());
        return std::nullopt;
    }

    pugi::xml_node manifest = doc.child("manifest");
    if (!manifest) {
        return std::nullopt;
    }

    ManifestInfo info;
    info.package_name = manifest.attribute("package").as_string();
    info.version_name = manifest.attribute("android:versionName").as_string();

    pugi::xml_attribute label = manifest.child("application").attribute("android:label");
    if (label) {
        std::string value = label.as_string();
        if (!value.empty() && value[0] != '@') {
            info.label = value;
        }
    }
    return info;
}

}}
