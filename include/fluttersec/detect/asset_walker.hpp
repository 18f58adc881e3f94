#pragma once

#include "detector.hpp"
#include <filesystem>
#include <functional>

namespace fluttersec {
namespace detect {

// Visits every regular file under the flutter-assets directory and the
// generic assets/ directory, in path order. A file reachable from both
// roots is visited once.
void forEachAssetFile(const ScanContext& ctx,
                      const std::function<void(const std::filesystem::path&)>& visit);

}}
