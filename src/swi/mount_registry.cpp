#include "swi/mount_registry.hpp"

#include "util/json_file.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

namespace swi {

std::optional<MountRecord> IMountRegistry::Lookup(const std::string& label) const {
    for (auto& record : Records()) {
        if (record.label == label) return std::move(record);
    }
    return std::nullopt;
}

std::optional<RegistryMatch> IMountRegistry::FindByPath(const std::string& path) const {
    std::optional<RegistryMatch> best;
    for (auto& record : Records()) {
        auto remainder = StripDirPrefix(path, record.directory);
        if (!remainder) continue;
        if (best && NormalizeDir(best->record.directory).size() >= NormalizeDir(record.directory).size()) {
            continue;
        }
        best = RegistryMatch{std::move(record), std::move(*remainder)};
    }
    return best;
}

FileMountRegistry::FileMountRegistry(std::string path) : path_(std::move(path)) {}

std::vector<MountRecord> FileMountRegistry::Records() const {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        LogDebug("mount registry %s not present", path_.c_str());
        return {};
    }

    nlohmann::json j;
    std::string err;
    if (!json_file::LoadJsonObjectFromFile(path_, j, err)) {
        LogWarn("mount registry: %s", err.c_str());
        return {};
    }

    auto mounts = j.find("mounts");
    if (mounts == j.end() || !mounts->is_object()) {
        LogWarn("mount registry %s has no 'mounts' object", path_.c_str());
        return {};
    }

    std::vector<MountRecord> out;
    for (const auto& [label, entry] : mounts->items()) {
        if (!entry.is_object()) {
            LogWarn("mount registry: entry '%s' is not an object", label.c_str());
            continue;
        }
        MountRecord record;
        record.label = label;
        if (!json_file::GetStringIfPresent(entry, "dir", record.directory, err) ||
            record.directory.empty()) {
            LogWarn("mount registry: entry '%s' has no usable 'dir'", label.c_str());
            err.clear();
            continue;
        }
        if (!json_file::GetStringIfPresent(entry, "label", record.partition_label, err) ||
            record.partition_label.empty()) {
            err.clear();
            record.partition_label = label;
        }
        out.push_back(std::move(record));
    }
    return out;
}

} // namespace swi
