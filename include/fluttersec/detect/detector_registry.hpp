#pragma once

#include "detector.hpp"
#include <functional>
#include <memory>
#include <vector>

namespace fluttersec {
namespace detect {

class DetectorRegistry {
public:
    using Creator = std::function<std::unique_ptr<Detector>()>;

    void add(Creator creator) {
        creators_.push_back(std::move(creator));
    }

    // Environment files, then assets, then native binary strings.
    void registerDefaults();

    std::vector<std::unique_ptr<Detector>> createAll() const {
        std::vector<std::unique_ptr<Detector>> result;
        result.reserve(creators_.size());
        for (const auto& creator : creators_) {
            result.push_back(creator());
        }
        return result;
    }

    size_t size() const { return creators_.size(); }

private:
    std::vector<Creator> creators_;
};

}}
