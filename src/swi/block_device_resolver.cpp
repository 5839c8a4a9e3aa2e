#include "swi/block_device_resolver.hpp"

#include "swi/latest_selector.hpp"
#include "swi/mount_session.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace swi {

namespace {
constexpr const char* kMountPrefix = "swi-mnt-";
} // namespace

BlockDeviceResolver::BlockDeviceResolver(ResolverContext ctx) : ctx_(std::move(ctx)) {}

Result BlockDeviceResolver::Resolve(const DeviceSpecifier& spec, std::string& out_path) const {
    if (IsDevPath(spec.device_or_label)) {
        return Copy(spec.device_or_label, spec.relative_path, std::nullopt, out_path);
    }

    const std::string& label = spec.device_or_label;
    std::optional<std::string> dest_dir;
    std::string partition_label = label;
    if (auto record = ctx_.registry->Lookup(label)) {
        dest_dir = record->directory;
        partition_label = record->partition_label;
    }

    auto device = ctx_.partitions->Find(partition_label);
    if (!device) {
        return Result::Fail(ErrorKind::NotFound, "no block device labelled " + partition_label);
    }
    LogInfo("label %s is %s", label.c_str(), device->c_str());
    return Copy(*device, spec.relative_path, dest_dir, out_path);
}

Result BlockDeviceResolver::Copy(const std::string& device,
                                 const std::string& relative_path,
                                 const std::optional<std::string>& dest_dir,
                                 std::string& out_path) const {
    if (auto live = ctx_.mount_table->FindByDevice(device)) {
        LogDebug("%s already mounted on %s", device.c_str(), live->directory.c_str());
        return Locate(live->directory, relative_path, out_path);
    }

    MountSession session(ctx_.mount_ops);
    auto mount_result =
        MountSession::MountDevice(device, ctx_.options.mount_base_dir, kMountPrefix, MountOptions{}, session);
    if (!mount_result.is_ok())
        return mount_result;

    std::string found;
    auto locate_result = Locate(session.Dir(), relative_path, found);
    if (!locate_result.is_ok())
        return locate_result;

    if (dest_dir && NormalizeDir(*dest_dir) != NormalizeDir(session.Dir())) {
        const auto rel = StripDirPrefix(found, session.Dir());
        if (!rel) {
            return Result::Fail(ErrorKind::Io, found + " is not below " + session.Dir());
        }

        std::error_code ec;
        fs::create_directories(*dest_dir, ec);
        if (ec) {
            return Result::Fail(ErrorKind::Io, "cannot create " + *dest_dir + ": " + ec.message(),
                                ec.value());
        }

        auto move_result = session.MoveTo(*dest_dir);
        if (!move_result.is_ok())
            return move_result;

        out_path = (fs::path(*dest_dir) / *rel).string();
        LogInfo("moved %s to %s", device.c_str(), dest_dir->c_str());
        return Result::Ok();
    }

    // The caller keeps using the files, so the fresh mount stays live.
    session.Disown();
    out_path = std::move(found);
    return Result::Ok();
}

Result BlockDeviceResolver::Locate(const std::string& root,
                                   const std::string& relative_path,
                                   std::string& out_path) const {
    std::string candidate;
    if (auto subdir = LatestSubdir(relative_path)) {
        const std::string dir = subdir->empty() ? root : (fs::path(root) / *subdir).string();
        auto res = SelectLatest(dir, ctx_.options.archive_suffix, *ctx_.inspector, candidate);
        if (!res.is_ok())
            return res;
    } else {
        std::string rel = relative_path;
        while (!rel.empty() && rel.front() == '/') rel.erase(0, 1);
        candidate = (fs::path(root) / rel).string();
    }

    std::error_code ec;
    if (!fs::exists(candidate, ec)) {
        return Result::Fail(ErrorKind::MissingArchive, "missing SWI " + candidate);
    }
    out_path = std::move(candidate);
    return Result::Ok();
}

} // namespace swi
