#pragma once

#include <cstdlib>
#include <filesystem>

namespace sftpgate::core {
namespace path {

inline const std::filesystem::path kLogDir = std::filesystem::temp_directory_path() / "sftpgate"
                                             / "logs";

inline const std::filesystem::path kConfigDir = []() -> std::filesystem::path {
    const char* home = std::getenv("HOME");
    if (home == nullptr) {
        return std::filesystem::current_path();
    }
    return std::filesystem::path(home) / ".config" / "sftpgate";
}();

inline const std::filesystem::path kDefaultConfigFile = kConfigDir / "config.toml";

} // namespace path
} // namespace sftpgate::core
