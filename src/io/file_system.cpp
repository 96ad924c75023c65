#include "licenseheaders/io/file_system.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace licenseheaders {

auto FileSystem::read_file(const std::string& path) -> std::optional<std::string> {
    // Binary mode keeps "\r\n" terminators intact
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    if (file.bad()) {
        return std::nullopt;
    }
    return oss.str();
}

auto FileSystem::write_file(const std::string& path, const std::string& content) -> bool {
    return write_atomic(content, path);
}

auto FileSystem::copy_file(const std::string& from, const std::string& to) -> bool {
    std::error_code ec;
    std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        spdlog::debug("copy {} -> {} failed: {}", from, to, ec.message());
        return false;
    }
    return true;
}

auto FileSystem::file_exists(const std::string& path) -> bool {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

auto FileSystem::list_files(const std::string& root) -> std::vector<std::string> {
    std::vector<std::string> files;
    std::error_code ec;

    auto options = std::filesystem::directory_options::skip_permission_denied;
    std::filesystem::recursive_directory_iterator it(root, options, ec);
    if (ec) {
        spdlog::warn("cannot read directory {}: {}", root, ec.message());
        return files;
    }

    for (; it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            spdlog::warn("error while walking {}: {}", root, ec.message());
            break;
        }
        std::error_code status_ec;
        if (it->is_regular_file(status_ec)) {
            files.push_back(it->path().string());
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

auto FileSystem::write_atomic(const std::string& content, const std::string& path) -> bool {
    // Write to temporary file first for atomic operation
    std::string temp_path = path + ".tmp";

    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            return false;
        }

        file << content;
        if (file.fail()) {
            std::error_code ec;
            std::filesystem::remove(temp_path, ec);
            return false;
        }
    } // File automatically closed here

    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        spdlog::debug("rename {} -> {} failed: {}", temp_path, path, ec.message());
        std::error_code cleanup_ec;
        std::filesystem::remove(temp_path, cleanup_ec);
        return false;
    }
    return true;
}

} // namespace licenseheaders
