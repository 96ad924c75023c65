#pragma once

#include <optional>
#include <string>
#include <vector>

namespace licenseheaders {

// Abstract interfaces for dependency injection
class IFileSystem {
public:
    virtual ~IFileSystem() = default;
    virtual auto read_file(const std::string& path) -> std::optional<std::string> = 0;
    virtual auto write_file(const std::string& path, const std::string& content) -> bool = 0;
    virtual auto copy_file(const std::string& from, const std::string& to) -> bool = 0;
    virtual auto file_exists(const std::string& path) -> bool = 0;
    virtual auto list_files(const std::string& root) -> std::vector<std::string> = 0;
};

} // namespace licenseheaders
