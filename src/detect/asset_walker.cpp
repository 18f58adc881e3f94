#include "fluttersec/detect/asset_walker.hpp"
#include "fluttersec/common/logger.hpp"
#include <algorithm>
#include <set>
#include <vector>

namespace fs = std::filesystem;

namespace fluttersec {
namespace detect {

void forEachAssetFile(const ScanContext& ctx,
                      const std::function<void(const fs::path&)>& visit) {
    std::vector<fs::path> roots;
    if (auto flutter_assets = ctx.layout.flutterAssetsDir()) {
        roots.push_back(*flutter_assets);
    }
    roots.push_back(ctx.layout.genericAssetsDir());

    std::set<fs::path> seen;
    std::vector<fs::path> files;

    for (const auto& root : roots) {
        std::error_code ec;
        if (!fs::is_directory(root, ec)) {
            continue;
        }

        std::vector<fs::path> found;
        for (fs::recursive_directory_iterator it(root, ec), end; it != end; it.increment(ec)) {
            if (ec) {
                common::Logger::instance().debug("[Assets] Walk error | root={} | error={}",
                                                root.string(), ec.message());
                break;
            }
            if (it->is_regular_file(ec)) {
                found.push_back(it->path());
            }
        }
        std::sort(found.begin(), found.end());

        for (const auto& file : found) {
            fs::path key = fs::weakly_canonical(file, ec);
            if (ec) {
                key = file.lexically_normal();
            }
            if (seen.insert(key).second) {
                files.push_back(file);
            }
        }
    }

    for (const auto& file : files) {
        Detector::checkCancelled(ctx);
        visit(file);
    }
}

}}
