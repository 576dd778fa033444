#include "utils/FileUtils.hpp"
#include "utils/Logger.hpp"
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace {
    constexpr int MAX_PARENT_LEVELS = 5;

    bool looksLikeProjectRoot(const fs::path& dir) {
        std::error_code ec;
        return fs::is_directory(dir / "data", ec) &&
               fs::is_directory(dir / "include", ec) &&
               fs::is_directory(dir / "src", ec);
    }
}

namespace FileUtils {

bool ensureDirectoryExists(const std::string& path) {
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        return true;
    }
    fs::create_directories(path, ec);
    if (ec) {
        episweep::Logger::getInstance().error("FileUtils::ensureDirectoryExists",
                                              "Could not create directory '" + path + "': " + ec.message());
        return false;
    }
    return true;
}

bool ensureParentDirectoryExists(const std::string& filepath) {
    const fs::path parent = fs::path(filepath).parent_path();
    return parent.empty() || ensureDirectoryExists(parent.string());
}

std::string getProjectRoot() {
    const fs::path start = fs::absolute(fs::current_path()).lexically_normal();
    fs::path dir = start;
    for (int level = 0; level <= MAX_PARENT_LEVELS; ++level) {
        if (looksLikeProjectRoot(dir)) {
            return dir.string();
        }
        if (!dir.has_parent_path() || dir.parent_path() == dir) {
            break;
        }
        dir = dir.parent_path();
    }
    return start.string();
}

std::string joinPaths(const std::string& path1, const std::string& path2) {
    if (path2.empty()) {
        return path1;
    }
    const std::string relative = path2.front() == '/' ? path2.substr(1) : path2;
    return (fs::path(path1) / relative).lexically_normal().string();
}

bool fileExists(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

} // namespace FileUtils
