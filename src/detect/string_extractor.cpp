#include "fluttersec/detect/string_extractor.hpp"
#include <algorithm>
#include <fstream>

namespace fluttersec {
namespace detect {

StringExtractor::StringExtractor(std::unique_ptr<std::istream> input, StringExtractorOptions options)
    : input_(std::move(input)), options_(options) {
    options_.min_length = std::max<size_t>(1, options_.min_length);
    options_.max_length = std::max(options_.min_length, options_.max_length);
    options_.chunk_size = std::max<size_t>(1, options_.chunk_size);
    buffer_.resize(options_.chunk_size);
}

std::optional<StringExtractor> StringExtractor::openFile(const std::filesystem::path& path,
                                                         StringExtractorOptions options) {
    auto file = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!*file) {
        return std::nullopt;
    }
    return StringExtractor(std::move(file), options);
}

void StringExtractor::refill() {
    pos_ = 0;
    len_ = 0;

    if (!input_ || !*input_) {
        exhausted_ = true;
        return;
    }

    if (consumed_ >= options_.max_bytes) {
        exhausted_ = true;
        truncated_ = input_->peek() != std::char_traits<char>::eof();
        return;
    }

    size_t want = std::min(buffer_.size(), options_.max_bytes - consumed_);
    input_->read(buffer_.data(), static_cast<std::streamsize>(want));
    len_ = static_cast<size_t>(input_->gcount());
    consumed_ += len_;

    if (len_ == 0) {
        exhausted_ = true;
    }
}

bool StringExtractor::next(std::string& out) {
    for (;;) {
        if (pos_ >= len_) {
            if (!exhausted_) {
                refill();
                continue;
            }
            if (current_.size() >= options_.min_length) {
                out = std::move(current_);
                current_.clear();
                return true;
            }
            current_.clear();
            return false;
        }

        auto c = static_cast<unsigned char>(buffer_[pos_++]);
        if (c >= 32 && c <= 126) {
            current_ += static_cast<char>(c);
            if (current_.size() >= options_.max_length) {
                out = std::move(current_);
                current_.clear();
                return true;
            }
        } else {
            if (current_.size() >= options_.min_length) {
                out = std::move(current_);
                current_.clear();
                return true;
            }
            current_.clear();
        }
    }
}

}}
