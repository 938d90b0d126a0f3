#include "common/PathUtils.h"

#include <atomic>
#include <fstream>
#include <system_error>
#include <unistd.h>

namespace rebalex {
namespace utils {

namespace {
std::atomic<unsigned long> g_tmp_counter{0};
}

std::filesystem::path PathUtils::getExecutableDir() {
    std::error_code ec;
    auto exe_path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return std::filesystem::current_path();
    }
    return exe_path.parent_path();
}

std::filesystem::path PathUtils::resolveRelativePath(const std::string& relative_path) {
    std::filesystem::path path(relative_path);
    if (path.is_absolute()) {
        return path;
    }
    std::error_code ec;
    auto from_cwd = std::filesystem::current_path(ec) / path;
    if (!ec && std::filesystem::exists(from_cwd, ec)) {
        return from_cwd;
    }
    return getExecutableDir() / path;
}

std::filesystem::path PathUtils::getConfigDir() {
    return getExecutableDir() / "config";
}

std::filesystem::path PathUtils::getLogsDir() {
    return getExecutableDir() / "logs";
}

bool PathUtils::writeFileAtomically(const std::filesystem::path& target, const std::string& content) {
    std::error_code ec;
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            return false;
        }
    }

    auto tmp = target;
    tmp += ".tmp." + std::to_string(::getpid()) + "." + std::to_string(++g_tmp_counter);
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return false;
        }
        out << content;
        out.flush();
        if (!out.good()) {
            return false;
        }
    }

    std::filesystem::rename(tmp, target, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        return false;
    }
    return true;
}

} // namespace utils
} // namespace rebalex
