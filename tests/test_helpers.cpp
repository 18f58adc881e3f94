#include "test_helpers.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <cstdlib>

namespace fs = std::filesystem;

namespace fluttersec {
namespace test {

TempDir::TempDir() {
    std::string pattern = (fs::temp_directory_path() / "fluttersec_test_XXXXXX").string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (mkdtemp(buffer.data()) == nullptr) {
        throw std::runtime_error("mkdtemp failed for " + pattern);
    }
    path_ = buffer.data();
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

void writeFile(const fs::path& path, const std::string& content) {
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("cannot write " + path.string());
    }
    out << content;
}

void writeFile(const fs::path& path, const std::vector<uint8_t>& content) {
    writeFile(path, std::string(content.begin(), content.end()));
}

std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void writeZip(const fs::path& path, const ZipEntries& entries) {
    struct archive* a = archive_write_new();
    archive_write_set_format_zip(a);
    if (archive_write_open_filename(a, path.string().c_str()) != ARCHIVE_OK) {
        std::string err = archive_error_string(a) ? archive_error_string(a) : "unknown";
        archive_write_free(a);
        throw std::runtime_error("cannot open zip for writing: " + err);
    }

    for (const auto& [name, data] : entries) {
        struct archive_entry* entry = archive_entry_new();
        archive_entry_set_pathname(entry, name.c_str());
        archive_entry_set_size(entry, static_cast<la_int64_t>(data.size()));
        archive_entry_set_filetype(entry, AE_IFREG);
        archive_entry_set_perm(entry, 0644);
        archive_write_header(a, entry);
        if (!data.empty()) {
            archive_write_data(a, data.data(), data.size());
        }
        archive_entry_free(entry);
    }

    archive_write_close(a);
    archive_write_free(a);
}

common::Finding makeFinding(common::Severity severity, const std::string& title,
                            const std::string& description) {
    common::Finding finding;
    finding.severity = severity;
    finding.title = title;
    finding.description = description;
    return finding;
}

namespace {

void putLe16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xFF));
    out.push_back(static_cast<uint8_t>(v >> 8));
}

void putLe32(std::vector<uint8_t>& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
    }
}

void setLe32(std::vector<uint8_t>& out, size_t offset, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out[offset + i] = static_cast<uint8_t>((v >> (8 * i)) & 0xFF);
    }
}

void putBe(std::vector<uint8_t>& out, uint64_t v, int width) {
    for (int i = width - 1; i >= 0; --i) {
        out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
    }
}

void putAsciiObject(std::vector<uint8_t>& out, const std::string& s) {
    if (s.size() < 15) {
        out.push_back(static_cast<uint8_t>(0x50 | s.size()));
    } else {
        out.push_back(0x5F);
        out.push_back(0x11);
        putBe(out, s.size(), 2);
    }
    out.insert(out.end(), s.begin(), s.end());
}

}

std::vector<uint8_t> buildBinaryPlist(const std::map<std::string, std::string>& entries) {
    std::vector<uint8_t> out = {'b', 'p', 'l', 'i', 's', 't', '0', '0'};
    std::vector<uint64_t> offsets;

    size_t count = entries.size();
    size_t num_objects = 1 + count * 2;

    offsets.push_back(out.size());
    if (count < 15) {
        out.push_back(static_cast<uint8_t>(0xD0 | count));
    } else {
        out.push_back(0xDF);
        out.push_back(0x10);
        out.push_back(static_cast<uint8_t>(count));
    }
    for (size_t i = 0; i < count; ++i) out.push_back(static_cast<uint8_t>(1 + i));
    for (size_t i = 0; i < count; ++i) out.push_back(static_cast<uint8_t>(1 + count + i));

    for (const auto& kv : entries) {
        offsets.push_back(out.size());
        putAsciiObject(out, kv.first);
    }
    for (const auto& kv : entries) {
        offsets.push_back(out.size());
        putAsciiObject(out, kv.second);
    }

    uint64_t offset_table = out.size();
    for (auto off : offsets) putBe(out, off, 2);

    for (int i = 0; i < 6; ++i) out.push_back(0);
    out.push_back(2);
    out.push_back(1);
    putBe(out, num_objects, 8);
    putBe(out, 0, 8);
    putBe(out, offset_table, 8);
    return out;
}

std::vector<uint8_t> buildBinaryManifest(const std::string& package, const std::string& version,
                                         const std::string& label) {
    const std::vector<std::string> strings = {
        "manifest", "package", "versionName", "application", "label", package, version, label
    };

    std::vector<uint8_t> pool;
    size_t strings_start = 28 + strings.size() * 4;
    std::vector<uint8_t> string_data;
    std::vector<uint32_t> offsets;
    for (const auto& s : strings) {
        offsets.push_back(static_cast<uint32_t>(string_data.size()));
        string_data.push_back(static_cast<uint8_t>(s.size()));
        string_data.push_back(static_cast<uint8_t>(s.size()));
        string_data.insert(string_data.end(), s.begin(), s.end());
        string_data.push_back(0);
    }
    while (string_data.size() % 4 != 0) string_data.push_back(0);

    putLe16(pool, 0x0001);
    putLe16(pool, 28);
    putLe32(pool, static_cast<uint32_t>(strings_start + string_data.size()));
    putLe32(pool, static_cast<uint32_t>(strings.size()));
    putLe32(pool, 0);
    putLe32(pool, 1 << 8);
    putLe32(pool, static_cast<uint32_t>(strings_start));
    putLe32(pool, 0);
    for (auto off : offsets) putLe32(pool, off);
    pool.insert(pool.end(), string_data.begin(), string_data.end());

    auto element = [](uint32_t name, const std::vector<std::pair<uint32_t, uint32_t>>& attrs) {
        std::vector<uint8_t> e;
        putLe16(e, 0x0102);
        putLe16(e, 16);
        putLe32(e, static_cast<uint32_t>(36 + attrs.size() * 20));
        putLe32(e, 1);
        putLe32(e, 0xFFFFFFFF);
        putLe32(e, 0xFFFFFFFF);
        putLe32(e, name);
        putLe16(e, 20);
        putLe16(e, 20);
        putLe16(e, static_cast<uint16_t>(attrs.size()));
        putLe16(e, 0);
        putLe16(e, 0);
        putLe16(e, 0);
        for (const auto& [attr_name, value] : attrs) {
            putLe32(e, 0xFFFFFFFF);
            putLe32(e, attr_name);
            putLe32(e, value);
            putLe16(e, 8);
            e.push_back(0);
            e.push_back(0x03);
            putLe32(e, value);
        }
        return e;
    };

    auto manifest = element(0, {{1, 5}, {2, 6}});
    auto application = element(3, {{4, 7}});

    std::vector<uint8_t> out;
    putLe16(out, 0x0003);
    putLe16(out, 8);
    putLe32(out, 0);
    out.insert(out.end(), pool.begin(), pool.end());
    out.insert(out.end(), manifest.begin(), manifest.end());
    out.insert(out.end(), application.begin(), application.end());
    setLe32(out, 4, static_cast<uint32_t>(out.size()));
    return out;
}

ZipEntries flutterApkEntries(const std::vector<std::string>& binary_strings) {
    std::string binary("\x7f" "ELF\x02\x01\x01", 7);
    for (const auto& s : binary_strings) {
        binary += std::string(4, '\0');
        binary += s;
    }
    binary += std::string(4, '\0');

    auto manifest = buildBinaryManifest("com.example.shop", "2.1.0", "Shop");
    return {
        {"AndroidManifest.xml", std::string(manifest.begin(), manifest.end())},
        {"assets/flutter_assets/AssetManifest.json", "{}"},
        {"assets/flutter_assets/fonts/FontManifest.json", "[]"},
        {"lib/arm64-v8a/libflutter.so", "flutter engine"},
        {"lib/arm64-v8a/libapp.so", binary},
        {"classes.dex", "dex\n035"},
    };
}

std::vector<fs::path> listWorkDirs(const std::string& label) {
    std::vector<fs::path> dirs;
    std::string prefix = "fluttersec_" + label + "_";
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(fs::temp_directory_path(), ec)) {
        if (entry.path().filename().string().rfind(prefix, 0) == 0) {
            dirs.push_back(entry.path());
        }
    }
    return dirs;
}

}}
