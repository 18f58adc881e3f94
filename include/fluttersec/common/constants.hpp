#pragma once

#include <string>
#include <cstddef>
#include <cstdint>

namespace fluttersec {
namespace constants {

namespace version {
    constexpr const char* CLI_VERSION = "1.0.0";

    inline std::string getFullVersion() {
        return std::string("fluttersec v") + CLI_VERSION;
    }
}

namespace system {
    constexpr const char* APPLICATION_NAME = "fluttersec";
    constexpr const char* LOGGER_NAME = "fluttersec";
    constexpr const char* CONFIG_ENV = "FLUTTERSEC_CONFIG";
    constexpr const char* WORK_DIR_PREFIX = "fluttersec_";
}

namespace limits {
    constexpr size_t DEFAULT_MIN_STRING_LENGTH = 8;
    constexpr size_t DEFAULT_MAX_STRING_LENGTH = 512;
    constexpr size_t DEFAULT_MAX_BINARY_SCAN_MB = 512;
    constexpr size_t DEFAULT_MAX_EXTRACTED_SIZE_MB = 2048;
    constexpr size_t DEFAULT_MAX_ARCHIVE_ENTRIES = 100000;
    constexpr size_t DEFAULT_MAX_COMPRESSION_RATIO = 250;
    constexpr size_t STRING_READ_CHUNK = 64 * 1024;
    constexpr size_t MAX_ENV_FILE_SIZE = 1024 * 1024;

    constexpr size_t DEFAULT_LOG_ROTATION_SIZE_MB = 100;
    constexpr size_t DEFAULT_LOG_MAX_FILES = 5;

    constexpr size_t DEFAULT_PRIORITY_LIMIT = 5;
    constexpr size_t MAX_EXPLOITABLE_FINDINGS = 10;
    constexpr size_t MAX_DESCRIPTION_SAMPLES = 5;
}

namespace config_defaults {
    constexpr size_t MIN_STRING_LENGTH = limits::DEFAULT_MIN_STRING_LENGTH;
    constexpr size_t MAX_STRING_LENGTH = limits::DEFAULT_MAX_STRING_LENGTH;
    constexpr size_t MAX_BINARY_SCAN_MB = limits::DEFAULT_MAX_BINARY_SCAN_MB;
    constexpr size_t MAX_EXTRACTED_SIZE_MB = limits::DEFAULT_MAX_EXTRACTED_SIZE_MB;
    constexpr size_t MAX_ARCHIVE_ENTRIES = limits::DEFAULT_MAX_ARCHIVE_ENTRIES;
    constexpr size_t MAX_COMPRESSION_RATIO = limits::DEFAULT_MAX_COMPRESSION_RATIO;
    constexpr bool PARALLEL_DETECTORS = false;

    constexpr size_t LOG_ROTATION_SIZE_MB = limits::DEFAULT_LOG_ROTATION_SIZE_MB;
    constexpr size_t LOG_MAX_FILES = limits::DEFAULT_LOG_MAX_FILES;

    constexpr const char* REPORT_DEFAULT_FORMAT = "console";
    constexpr size_t REPORT_PRIORITY_LIMIT = limits::DEFAULT_PRIORITY_LIMIT;
}

}
}
