#pragma once

#include "util/logger.hpp"
#include "util/result.hpp"

#include <optional>
#include <string>

namespace swi::config {

inline constexpr const char* kDefaultConfigPath = "/etc/swi-locator/swi-locator.json";
inline constexpr const char* kDefaultRegistryPath = "/etc/swi-locator/mounts.json";

struct LocatorConfig {
    std::string mount_registry = kDefaultRegistryPath;
    std::string proc_mounts = "/proc/mounts";
    std::string mount_base_dir = "/tmp";
    std::string temp_dir = "/tmp";
    std::string archive_suffix = ".swi";
    bool progress = true;
    std::optional<LogLevel> log_level;

    // Keys absent from the file keep their defaults.
    Result LoadFile(const std::string& path);
};

} // namespace swi::config
