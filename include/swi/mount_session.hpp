#pragma once

#include "io/command_runner.hpp"
#include "util/result.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace swi {

struct MountOptions {
    std::string fs_type; // empty: let mount(8) probe
    std::string options; // passed as -o when non-empty
};

// A temporary mount point with a guaranteed release: unmount, then remove the
// directory, exactly once, unless Disown() or MoveTo() handed it elsewhere.
class MountSession {
  public:
    class ISystemOps {
      public:
        virtual ~ISystemOps() = default;
        virtual Result CreateMountPoint(std::string_view mount_base_dir,
                                        std::string_view mount_prefix,
                                        std::string& out_dir) const = 0;
        virtual Result Mount(std::string_view device,
                             std::string_view target_dir,
                             const MountOptions& options) const = 0;
        virtual Result Unmount(std::string_view target_dir) const = 0;
        virtual Result MoveMount(std::string_view from_dir, std::string_view to_dir) const = 0;
        virtual void RemoveDirectory(std::string_view dir) const = 0;
    };

    MountSession();
    explicit MountSession(std::shared_ptr<const ISystemOps> system_ops);
    MountSession(const MountSession&) = delete;
    MountSession& operator=(const MountSession&) = delete;
    MountSession(MountSession&& other) noexcept;
    MountSession& operator=(MountSession&& other) noexcept;
    ~MountSession();

    static Result MountDevice(std::string_view device,
                              std::string_view mount_base_dir,
                              std::string_view mount_prefix,
                              const MountOptions& options,
                              MountSession& out);

    // Releases now. A failed unmount leaves the directory on disk and is not retried.
    Result Unmount();

    // mount --move to `dest_dir`; on success the session no longer owns anything.
    Result MoveTo(std::string_view dest_dir);

    // Leaves the mount live; release becomes a no-op.
    void Disown();

    const std::string& Dir() const { return dir_; }
    bool Mounted() const { return mounted_; }
    bool Owned() const { return owned_; }

  private:
    void Cleanup();

    static std::shared_ptr<const ISystemOps> DefaultSystemOps();

    std::shared_ptr<const ISystemOps> system_ops_;
    std::string dir_;
    bool mounted_ = false;
    bool owned_ = true;
};

// mount(8)/umount(8) through a command runner, mkdtemp() for mount points.
class CommandMountOps final : public MountSession::ISystemOps {
  public:
    explicit CommandMountOps(std::shared_ptr<const ICommandRunner> runner);

    Result CreateMountPoint(std::string_view mount_base_dir,
                            std::string_view mount_prefix,
                            std::string& out_dir) const override;
    Result Mount(std::string_view device,
                 std::string_view target_dir,
                 const MountOptions& options) const override;
    Result Unmount(std::string_view target_dir) const override;
    Result MoveMount(std::string_view from_dir, std::string_view to_dir) const override;
    void RemoveDirectory(std::string_view dir) const override;

  private:
    std::shared_ptr<const ICommandRunner> runner_;
};

} // namespace swi
