#include "fluttersec/extract/work_directory.hpp"
#include "fluttersec/core/error_codes.hpp"
#include "fluttersec/common/constants.hpp"
#include "fluttersec/common/logger.hpp"
#include <fstream>
#include <vector>
#include <cerrno>
#include <cstring>
#include <cstdlib>
#include <unistd.h>

namespace fs = std::filesystem;

namespace fluttersec {
namespace extract {

using core::PipelineError;
using core::PipelineErrorCode;

namespace {

constexpr const char* ADOPTED_TAG = "adopted";

common::ErrorContext workDirContext(const fs::path& path) {
    common::ErrorContext ctx;
    ctx.component = "WorkDir";
    ctx.with("path", path.string());
    return ctx;
}

}

WorkDirectory::WorkDirectory(fs::path path, bool owned)
    : path_(std::move(path)), owned_(owned) {}

WorkDirectory::WorkDirectory(WorkDirectory&& other) noexcept
    : path_(std::move(other.path_)), owned_(other.owned_),
      adopted_(other.adopted_), keep_(other.keep_) {
    other.path_.clear();
    other.owned_ = false;
    other.adopted_ = false;
}

WorkDirectory& WorkDirectory::operator=(WorkDirectory&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        owned_ = other.owned_;
        adopted_ = other.adopted_;
        keep_ = other.keep_;
        other.path_.clear();
        other.owned_ = false;
        other.adopted_ = false;
    }
    return *this;
}

WorkDirectory::~WorkDirectory() {
    if (keep_) {
        if (valid()) {
            common::Logger::instance().info("[WorkDir] Kept | path={}", path_.string());
        }
        return;
    }
    release();
}

WorkDirectory WorkDirectory::create(const std::string& requested, const std::string& label) {
    std::error_code ec;
    fs::path path;
    bool fresh = false;

    if (requested.empty()) {
        fs::path base = fs::temp_directory_path(ec);
        if (ec) {
            base = "/tmp";
        }
        std::string pattern = (base / (std::string(constants::system::WORK_DIR_PREFIX) + label + "_XXXXXX")).string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');

        if (mkdtemp(buffer.data()) == nullptr) {
            throw PipelineError(PipelineErrorCode::WORKSPACE_FAILED,
                                std::string("mkdtemp failed: ") + std::strerror(errno),
                                workDirContext(pattern));
        }
        path = buffer.data();
        fresh = true;
    } else {
        path = fs::absolute(requested, ec);
        if (ec) {
            path = requested;
        }

        if (fs::exists(path, ec)) {
            if (!fs::is_directory(path, ec)) {
                throw PipelineError(PipelineErrorCode::WORKSPACE_FAILED,
                                    "Work directory path exists and is not a directory",
                                    workDirContext(path));
            }

            WorkDirectory dir(path, false);
            if (dir.hasMarker()) {
                dir.owned_ = true;
                dir.adopted_ = dir.markerSaysAdopted();
                dir.clear();
            } else if (fs::is_empty(path, ec)) {
                dir.adopted_ = true;
                dir.writeMarker();
                dir.owned_ = true;
            } else {
                throw PipelineError(PipelineErrorCode::WORKSPACE_FAILED,
                                    "Work directory is not empty and was not created by fluttersec",
                                    workDirContext(path));
            }
            common::Logger::instance().debug("[WorkDir] Reused | path={}", path.string());
            return dir;
        }

        if (!fs::create_directories(path, ec) || ec) {
            throw PipelineError(PipelineErrorCode::WORKSPACE_FAILED,
                                "Failed to create work directory: " + ec.message(),
                                workDirContext(path));
        }
        fresh = true;
    }

    WorkDirectory dir(path, false);
    try {
        dir.writeMarker();
    } catch (const PipelineError&) {
        if (fresh) {
            fs::remove_all(path, ec);
        }
        throw;
    }
    dir.owned_ = true;

    common::Logger::instance().debug("[WorkDir] Created | path={}", path.string());
    return dir;
}

void WorkDirectory::clear() const {
    if (!owned_ || !hasMarker()) {
        return;
    }

    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(path_, ec)) {
        if (entry.path().filename() == MARKER_FILE) {
            continue;
        }
        std::error_code remove_ec;
        fs::remove_all(entry.path(), remove_ec);
        if (remove_ec) {
            common::Logger::instance().warn("[WorkDir] Clear failed | path={} | error={}",
                                           entry.path().string(), remove_ec.message());
        }
    }
}

bool WorkDirectory::release() {
    if (path_.empty()) {
        return false;
    }

    fs::path target = path_;
    bool owned = owned_;
    bool adopted = adopted_;
    path_.clear();
    owned_ = false;
    adopted_ = false;

    if (!owned) {
        common::Logger::instance().warn("[WorkDir] Cleanup refused, not owned | path={}", target.string());
        return false;
    }

    std::error_code ec;
    if (!fs::is_regular_file(target / MARKER_FILE, ec)) {
        common::Logger::instance().warn("[WorkDir] Cleanup refused, marker missing | path={}", target.string());
        return false;
    }

    if (adopted) {
        return releaseContents(target);
    }

    auto removed = fs::remove_all(target, ec);
    if (ec) {
        common::Logger::instance().warn("[WorkDir] Cleanup failed | path={} | error={}",
                                       target.string(), ec.message());
        return false;
    }

    common::Logger::instance().debug("[WorkDir] Removed | path={} | entries={}", target.string(), removed);
    return true;
}

bool WorkDirectory::releaseContents(const fs::path& target) {
    std::error_code ec;
    bool ok = true;
    for (const auto& entry : fs::directory_iterator(target, ec)) {
        if (entry.path().filename() == MARKER_FILE) {
            continue;
        }
        std::error_code remove_ec;
        fs::remove_all(entry.path(), remove_ec);
        if (remove_ec) {
            common::Logger::instance().warn("[WorkDir] Cleanup failed | path={} | error={}",
                                           entry.path().string(), remove_ec.message());
            ok = false;
        }
    }
    if (ec) {
        common::Logger::instance().warn("[WorkDir] Cleanup failed | path={} | error={}",
                                       target.string(), ec.message());
        return false;
    }
    if (ok) {
        fs::remove(target / MARKER_FILE, ec);
    }

    common::Logger::instance().debug("[WorkDir] Emptied | path={}", target.string());
    return ok && !ec;
}

bool WorkDirectory::hasMarker() const {
    std::error_code ec;
    return fs::is_regular_file(path_ / MARKER_FILE, ec);
}

void WorkDirectory::writeMarker() const {
    std::ofstream marker(path_ / MARKER_FILE, std::ios::trunc);
    if (!marker) {
        throw PipelineError(PipelineErrorCode::WORKSPACE_FAILED,
                            "Failed to write work directory marker", workDirContext(path_));
    }
    marker << getpid() << "\n";
    if (adopted_) {
        marker << ADOPTED_TAG << "\n";
    }
}

bool WorkDirectory::markerSaysAdopted() const {
    std::ifstream marker(path_ / MARKER_FILE);
    std::string line;
    while (std::getline(marker, line)) {
        if (line == ADOPTED_TAG) {
            return true;
        }
    }
    return false;
}

}}
