#pragma once

#include "licenseheaders/interfaces.hpp"
#include <string>
#include <vector>

namespace licenseheaders {

class FileSystem : public IFileSystem {
public:
    auto read_file(const std::string& path) -> std::optional<std::string> override;
    auto write_file(const std::string& path, const std::string& content) -> bool override;
    auto copy_file(const std::string& from, const std::string& to) -> bool override;
    auto file_exists(const std::string& path) -> bool override;
    auto list_files(const std::string& root) -> std::vector<std::string> override;

private:
    auto write_atomic(const std::string& content, const std::string& path) -> bool;
};

} // namespace licenseheaders
