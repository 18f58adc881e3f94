#pragma once

#include <filesystem>
#include <string>

namespace fluttersec {
namespace extract {

// Scoped extraction directory. Removes itself on destruction, but only
// when it was created by this process and still carries the ownership
// marker. A pre-existing empty directory is adopted: on release its
// contents are removed and the directory itself stays.
class WorkDirectory {
public:
    static constexpr const char* MARKER_FILE = ".fluttersec-workdir";

    // An empty `requested` path creates a fresh directory under the system
    // temp dir named "fluttersec_<label>_XXXXXX".
    static WorkDirectory create(const std::string& requested, const std::string& label);

    WorkDirectory() = default;
    WorkDirectory(WorkDirectory&& other) noexcept;
    WorkDirectory& operator=(WorkDirectory&& other) noexcept;
    WorkDirectory(const WorkDirectory&) = delete;
    WorkDirectory& operator=(const WorkDirectory&) = delete;
    ~WorkDirectory();

    const std::filesystem::path& path() const { return path_; }
    bool owned() const { return owned_; }
    bool adopted() const { return adopted_; }
    bool valid() const { return !path_.empty(); }

    // Empties the directory, keeping the marker.
    void clear() const;

    // Leaves the directory on disk when the guard goes out of scope.
    void keep() { keep_ = true; }

    // Removes the directory (or only its contents, when adopted). Returns
    // false, and leaves the path alone, when it is not recognized as ours.
    bool release();

private:
    WorkDirectory(std::filesystem::path path, bool owned);

    std::filesystem::path path_;
    bool owned_ = false;
    bool adopted_ = false;
    bool keep_ = false;

    static bool releaseContents(const std::filesystem::path& target);
    bool hasMarker() const;
    bool markerSaysAdopted() const;
    void writeMarker() const;
};

}}
