#include "swi/mount_session.hpp"

#include "util/logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <memory>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace swi {

CommandMountOps::CommandMountOps(std::shared_ptr<const ICommandRunner> runner)
    : runner_(runner ? std::move(runner) : DefaultCommandRunner()) {}

Result CommandMountOps::CreateMountPoint(std::string_view mount_base_dir,
                                         std::string_view mount_prefix,
                                         std::string& out_dir) const {
    const fs::path base = mount_base_dir.empty() ? fs::path("/tmp") : fs::path(mount_base_dir);
    std::error_code ec;
    fs::create_directories(base, ec);

    std::string tmpl = (base / (std::string(mount_prefix) + "XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    char* created = ::mkdtemp(buf.data());
    if (!created) {
        const int err = errno;
        return Result::Fail(ErrorKind::Io, "mkdtemp failed: " + std::string(std::strerror(err)), err);
    }

    out_dir = created;
    return Result::Ok();
}

Result CommandMountOps::Mount(std::string_view device,
                              std::string_view target_dir,
                              const MountOptions& options) const {
    Command cmd;
    cmd.argv = {"mount"};
    if (!options.fs_type.empty()) {
        cmd.argv.insert(cmd.argv.end(), {"-t", options.fs_type});
    }
    if (!options.options.empty()) {
        cmd.argv.insert(cmd.argv.end(), {"-o", options.options});
    }
    cmd.argv.emplace_back(device);
    cmd.argv.emplace_back(target_dir);
    return runner_->Run(cmd, nullptr);
}

Result CommandMountOps::Unmount(std::string_view target_dir) const {
    Command cmd;
    cmd.argv = {"umount", std::string(target_dir)};
    return runner_->Run(cmd, nullptr);
}

Result CommandMountOps::MoveMount(std::string_view from_dir, std::string_view to_dir) const {
    Command cmd;
    cmd.argv = {"mount", "--move", std::string(from_dir), std::string(to_dir)};
    return runner_->Run(cmd, nullptr);
}

void CommandMountOps::RemoveDirectory(std::string_view dir) const {
    std::error_code ec;
    // remove() refuses non-empty directories, which protects a still-mounted tree.
    fs::remove(fs::path(dir), ec);
    if (ec) {
        LogWarn("cannot remove %.*s: %s", (int)dir.size(), dir.data(), ec.message().c_str());
    }
}

std::shared_ptr<const MountSession::ISystemOps> MountSession::DefaultSystemOps() {
    static const std::shared_ptr<const ISystemOps> kDefault =
        std::make_shared<CommandMountOps>(DefaultCommandRunner());
    return kDefault;
}

MountSession::MountSession() : system_ops_(DefaultSystemOps()) {}

MountSession::MountSession(std::shared_ptr<const ISystemOps> system_ops)
    : system_ops_(system_ops ? std::move(system_ops) : DefaultSystemOps()) {}

MountSession::MountSession(MountSession&& other) noexcept
    : system_ops_(std::move(other.system_ops_)), dir_(std::move(other.dir_)),
      mounted_(other.mounted_), owned_(other.owned_) {
    other.mounted_ = false;
    other.owned_ = true;
    other.dir_.clear();
    other.system_ops_ = DefaultSystemOps();
}

MountSession& MountSession::operator=(MountSession&& other) noexcept {
    if (this == &other)
        return *this;
    Cleanup();
    system_ops_ = std::move(other.system_ops_);
    dir_ = std::move(other.dir_);
    mounted_ = other.mounted_;
    owned_ = other.owned_;
    other.mounted_ = false;
    other.owned_ = true;
    other.dir_.clear();
    other.system_ops_ = DefaultSystemOps();
    return *this;
}

MountSession::~MountSession() { Cleanup(); }

Result MountSession::MountDevice(std::string_view device,
                                 std::string_view mount_base_dir,
                                 std::string_view mount_prefix,
                                 const MountOptions& options,
                                 MountSession& out) {
    out.Cleanup();

    auto create_result = out.system_ops_->CreateMountPoint(mount_base_dir, mount_prefix, out.dir_);
    if (!create_result.is_ok()) {
        out.dir_.clear();
        return create_result;
    }

    auto mount_result = out.system_ops_->Mount(device, out.dir_, options);
    if (!mount_result.is_ok()) {
        out.Cleanup();
        return Result::Fail(ErrorKind::TransportFailure,
                            "cannot mount " + std::string(device) + ": " + mount_result.msg,
                            mount_result.err);
    }

    out.mounted_ = true;
    LogDebug("mounted %.*s on %s", (int)device.size(), device.data(), out.dir_.c_str());
    return Result::Ok();
}

Result MountSession::Unmount() {
    if (!owned_ || dir_.empty())
        return Result::Ok();

    if (mounted_) {
        auto unmount_result = system_ops_->Unmount(dir_);
        mounted_ = false;
        if (!unmount_result.is_ok()) {
            // Never delete a directory that may still be a mount point.
            std::string dir = std::move(dir_);
            dir_.clear();
            return Result::Fail(ErrorKind::TransportFailure,
                                "cannot unmount " + dir + ": " + unmount_result.msg,
                                unmount_result.err);
        }
    }

    system_ops_->RemoveDirectory(dir_);
    dir_.clear();
    return Result::Ok();
}

Result MountSession::MoveTo(std::string_view dest_dir) {
    if (!mounted_ || !owned_)
        return Result::Fail(ErrorKind::TransportFailure, "no owned mount to move");

    auto move_result = system_ops_->MoveMount(dir_, dest_dir);
    if (!move_result.is_ok()) {
        return Result::Fail(ErrorKind::TransportFailure,
                            "cannot move mount " + dir_ + " to " + std::string(dest_dir) + ": " +
                                move_result.msg,
                            move_result.err);
    }

    // The temp directory is empty again once the mount has left it.
    system_ops_->RemoveDirectory(dir_);
    dir_ = std::string(dest_dir);
    Disown();
    return Result::Ok();
}

void MountSession::Disown() { owned_ = false; }

void MountSession::Cleanup() {
    if (owned_ && !dir_.empty()) {
        auto res = Unmount();
        if (!res.is_ok()) {
            LogWarn("%s", res.msg.c_str());
        }
    }
    mounted_ = false;
    owned_ = true;
    dir_.clear();
}

} // namespace swi
