#pragma once

#include "detector.hpp"
#include "string_extractor.hpp"
#include <filesystem>

namespace fluttersec {
namespace detect {

// Pulls printable strings out of the compiled Dart binary and reports one
// finding per pattern category with at least one distinct match.
class BinaryStringDetector : public Detector {
public:
    std::string name() const override { return "binary_strings"; }
    std::vector<common::Finding> scan(const ScanContext& ctx) const override;

    struct PatternMatches {
        const StringPattern* pattern;
        std::vector<std::string> matches;
    };

    // Matches are kept distinct, in first-seen order.
    static std::vector<PatternMatches> analyze(StringExtractor& strings, const ScanContext& ctx);

private:
    static common::Finding makeFinding(const PatternMatches& matches, const std::string& binary_name,
                                       const std::string& rel_path);
    static common::Remediation remediation(const std::string& pattern_name);
};

}}
