#include "util/config.hpp"

#include "util/json_file.hpp"

namespace swi::config {

namespace {

Result Invalid(const std::string& path, const std::string& err) {
    return Result::Fail(ErrorKind::Io, "config " + path + ": " + err);
}

} // namespace

Result LocatorConfig::LoadFile(const std::string& path) {
    *this = LocatorConfig{};

    nlohmann::json j;
    std::string err;
    if (!json_file::LoadJsonObjectFromFile(path, j, err)) {
        return Result::Fail(ErrorKind::Io, err);
    }

    struct StringKey {
        const char* key;
        std::string* out;
    };
    const StringKey string_keys[] = {
        {"MountRegistry", &mount_registry},
        {"ProcMounts", &proc_mounts},
        {"MountBaseDir", &mount_base_dir},
        {"TempDir", &temp_dir},
        {"ArchiveSuffix", &archive_suffix},
    };
    for (const auto& k : string_keys) {
        json_file::GetStringIfPresent(j, k.key, *k.out, err);
        if (!err.empty()) return Invalid(path, err);
        if (k.out->empty()) return Invalid(path, std::string("'") + k.key + "' must not be empty");
    }

    json_file::GetBoolIfPresent(j, "Progress", progress, err);
    if (!err.empty()) return Invalid(path, err);

    std::string level;
    if (json_file::GetStringIfPresent(j, "LogLevel", level, err)) {
        log_level = ParseLogLevel(level);
        if (!log_level) return Invalid(path, "unknown LogLevel '" + level + "'");
    }
    if (!err.empty()) return Invalid(path, err);

    return Result::Ok();
}

} // namespace swi::config
