#pragma once

#include <cstdlib>
#include <filesystem>

namespace pipecdn::core {
namespace path {

inline std::filesystem::path HomeDir() {
#if defined(_WIN32) || defined(_WIN64)
    const char* home = std::getenv("APPDATA");
#else
    const char* home = std::getenv("HOME");
#endif
    return home ? std::filesystem::path(home) : std::filesystem::temp_directory_path();
}

inline const std::filesystem::path kLogDir = std::filesystem::temp_directory_path() / "PipeCDN"
                                             / "pipecdn" / "logs";

inline const std::filesystem::path kConfigDir =
#if defined(_WIN32) || defined(_WIN64)
    HomeDir() / "PipeCDN" / "pipecdn";
#else
    HomeDir() / ".config" / "PipeCDN" / "pipecdn";
#endif

} // namespace path
} // namespace pipecdn::core
