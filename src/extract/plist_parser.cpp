#include "fluttersec/extract/plist_parser.hpp"
#include "fluttersec/extract/byte_reader.hpp"
#include "fluttersec/common/logger.hpp"
#include <pugixml.hpp>
#include <cstring>

namespace fluttersec {
namespace extract {

namespace {

constexpr char BPLIST_MAGIC[] = "bplist00";
constexpr size_t TRAILER_SIZE = 32;

class BinaryPlist {
public:
    explicit BinaryPlist(const std::vector<uint8_t>& data) : data_(data) {}

    bool readTrailer() {
        if (data_.size() < 8 + TRAILER_SIZE) return false;
        size_t t = data_.size() - TRAILER_SIZE;
        offset_size_ = data_[t + 6];
        ref_size_ = data_[t + 7];
        num_objects_ = read_be(data_, t + 8, 8);
        top_object_ = read_be(data_, t + 16, 8);
        offset_table_ = read_be(data_, t + 24, 8);

        if (offset_size_ == 0 || offset_size_ > 8 || ref_size_ == 0 || ref_size_ > 8) return false;
        if (top_object_ >= num_objects_) return false;
        if (num_objects_ > data_.size()) return false;
        return in_bounds(data_, offset_table_, num_objects_ * offset_size_);
    }

    std::optional<size_t> objectOffset(uint64_t ref) const {
        if (ref >= num_objects_) return std::nullopt;
        uint64_t off = read_be(data_, offset_table_ + ref * offset_size_, offset_size_);
        if (off >= data_.size()) return std::nullopt;
        return static_cast<size_t>(off);
    }

    // Resolves the count encoded in a marker's low nibble, following an
    // int object when the nibble is 0xF.
    std::optional<size_t> readCount(size_t off, size_t& payload) const {
        uint8_t info = data_[off] & 0x0F;
        payload = off + 1;
        if (info != 0x0F) return info;

        if (!in_bounds(data_, payload, 1)) return std::nullopt;
        uint8_t marker = data_[payload];
        if ((marker & 0xF0) != 0x10) return std::nullopt;
        size_t width = size_t(1) << (marker & 0x0F);
        if (width > 8 || !in_bounds(data_, payload + 1, width)) return std::nullopt;
        uint64_t count = read_be(data_, payload + 1, width);
        if (count > data_.size()) return std::nullopt;
        payload += 1 + width;
        return static_cast<size_t>(count);
    }

    std::optional<std::string> scalar(uint64_t ref) const {
        auto off = objectOffset(ref);
        if (!off) return std::nullopt;

        uint8_t marker = data_[*off];
        uint8_t type = marker & 0xF0;
        size_t payload = 0;

        switch (type) {
            case 0x00:
                if (marker == 0x08) return std::string("false");
                if (marker == 0x09) return std::string("true");
                return std::nullopt;
            case 0x10: {
                size_t width = size_t(1) << (marker & 0x0F);
                if (width > 8 || !in_bounds(data_, *off + 1, width)) return std::nullopt;
                uint64_t v = read_be(data_, *off + 1, width);
                if (width == 8) return std::to_string(static_cast<int64_t>(v));
                return std::to_string(v);
            }
            case 0x50: {
                auto count = readCount(*off, payload);
                if (!count || !in_bounds(data_, payload, *count)) return std::nullopt;
                return std::string(reinterpret_cast<const char*>(data_.data() + payload), *count);
            }
            case 0x60: {
                auto count = readCount(*off, payload);
                if (!count || !in_bounds(data_, payload, *count * 2)) return std::nullopt;
                std::vector<uint16_t> units(*count);
                for (size_t i = 0; i < *count; ++i) {
                    units[i] = static_cast<uint16_t>(read_be(data_, payload + i * 2, 2));
                }
                return utf16_to_utf8(units);
            }
            default:
                return std::nullopt;
        }
    }

    std::optional<PlistDict> topDict() const {
        auto off = objectOffset(top_object_);
        if (!off || (data_[*off] & 0xF0) != 0xD0) return std::nullopt;

        size_t payload = 0;
        auto count = readCount(*off, payload);
        if (!count || !in_bounds(data_, payload, *count * 2 * ref_size_)) return std::nullopt;

        PlistDict dict;
        for (size_t i = 0; i < *count; ++i) {
            uint64_t key_ref = read_be(data_, payload + i * ref_size_, ref_size_);
            uint64_t val_ref = read_be(data_, payload + (*count + i) * ref_size_, ref_size_);
            auto key = scalar(key_ref);
            auto value = scalar(val_ref);
            if (key && value) {
                dict[*key] = *value;
            }
        }
        return dict;
    }

private:
    const std::vector<uint8_t>& data_;
    uint8_t offset_size_ = 0;
    uint8_t ref_size_ = 0;
    uint64_t num_objects_ = 0;
    uint64_t top_object_ = 0;
    uint64_t offset_table_ = 0;
};

}

std::optional<PlistDict> PlistParser::parseFile(const std::filesystem::path& path) {
    std::vector<uint8_t> data;
    if (!read_file_bytes(path.string(), data, MAX_PLIST_SIZE)) {
        common::Logger::instance().debug("[Plist] Read failed | path={}", path.string());
        return std::nullopt;
    }
    return parse(data);
}

std::optional<PlistDict> PlistParser::parse(const std::vector<uint8_t>& data) {
    if (data.size() >= 8 && std::memcmp(data.data(), BPLIST_MAGIC, 8) == 0) {
        return parseBinary(data);
    }
    return parseXml(data);
}

std::optional<PlistDict> PlistParser::parseBinary(const std::vector<uint8_t>& data) {
    BinaryPlist plist(data);
    if (!plist.readTrailer()) {
        common::Logger::instance().debug("[Plist] Invalid binary trailer | size={}", data.size());
        return std::nullopt;
    }
    return plist.topDict();
}

std::optional<PlistDict> PlistParser::parseXml(const std::vector<uint8_t>& data) {
    pugi::xml_document doc;
    pugi::xml_parse_result res = doc.load_buffer(data.data(), data.size(),
                                                 pugi::parse_default, pugi::encoding_auto);
    if (!res) {
        common::Logger::instance().debug("[Plist] XML parse failed | error={}", res.description());
        return std::nullopt;
    }

    pugi::xml_node dict = doc.child("plist").child("dict");
    if (!dict) {
        return std::nullopt;
    }

    PlistDict result;
    for (pugi::xml_node key = dict.child("key"); key; key = key.next_sibling("key")) {
        pugi::xml_node value = key.next_sibling();
        if (!value) break;

        std::string type = value.name();
        if (type == "string" || type == "integer" || type == "real" || type == "date") {
            result[key.child_value()] = value.child_value();
        } else if (type == "true" || type == "false") {
            result[key.child_value()] = type;
        }
    }
    return result;
}

}}
