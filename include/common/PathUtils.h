#pragma once

#include <string>
#include <filesystem>

namespace rebalex {
namespace utils {

class PathUtils {
public:
    // Directory containing the running executable
    static std::filesystem::path getExecutableDir();

    // Absolute paths pass through; relative paths resolve against the working
    // directory first, then against the executable directory.
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);

    static std::filesystem::path getConfigDir();
    static std::filesystem::path getLogsDir();

    // Writes content to a sibling temp file and renames it over the target.
    static bool writeFileAtomically(const std::filesystem::path& target, const std::string& content);
};

} // namespace utils
} // namespace rebalex
