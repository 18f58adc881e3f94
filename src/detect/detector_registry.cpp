#include "fluttersec/detect/detector_registry.hpp"
#include "fluttersec/detect/env_file_detector.hpp"
#include "fluttersec/detect/asset_exposure_detector.hpp"
#include "fluttersec/detect/binary_string_detector.hpp"

namespace fluttersec {
namespace detect {

void DetectorRegistry::registerDefaults() {
    add([] { return std::make_unique<EnvFileDetector>(); });
    add([] { return std::make_unique<AssetExposureDetector>(); });
    add([] { return std::make_unique<BinaryStringDetector>(); });
}

}}
