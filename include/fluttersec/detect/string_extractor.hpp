#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fluttersec {
namespace detect {

struct StringExtractorOptions {
    size_t min_length = 8;
    size_t max_length = 4096;
    size_t max_bytes = static_cast<size_t>(-1);
    size_t chunk_size = 64 * 1024;
};

// Streams runs of printable ASCII (0x20..0x7E) out of a binary input, one
// chunk at a time. Runs longer than max_length are split. Single pass.
class StringExtractor {
public:
    explicit StringExtractor(std::unique_ptr<std::istream> input, StringExtractorOptions options = {});

    static std::optional<StringExtractor> openFile(const std::filesystem::path& path,
                                                   StringExtractorOptions options = {});

    bool next(std::string& out);

    size_t bytesConsumed() const { return consumed_; }
    bool truncated() const { return truncated_; }

private:
    std::unique_ptr<std::istream> input_;
    StringExtractorOptions options_;
    std::vector<char> buffer_;
    size_t pos_ = 0;
    size_t len_ = 0;
    size_t consumed_ = 0;
    bool exhausted_ = false;
    bool truncated_ = false;
    std::string current_;

    void refill();
};

}}
