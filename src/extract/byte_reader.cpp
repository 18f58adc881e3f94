#include "fluttersec/extract/byte_reader.hpp"
#include <fstream>

namespace fluttersec {
namespace extract {

bool read_file_bytes(const std::string& path, std::vector<uint8_t>& out, size_t max_size) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return false;
    }

    auto size = file.tellg();
    if (size < 0 || static_cast<size_t>(size) > max_size) {
        return false;
    }

    out.resize(static_cast<size_t>(size));
    file.seekg(0);
    if (size > 0 && !file.read(reinterpret_cast<char*>(out.data()), size)) {
        return false;
    }
    return true;
}

}}
