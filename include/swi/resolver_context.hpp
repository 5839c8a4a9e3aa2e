#pragma once

#include "io/command_runner.hpp"
#include "swi/archive_inspector.hpp"
#include "swi/mount_registry.hpp"
#include "swi/mount_session.hpp"
#include "swi/mount_table.hpp"
#include "swi/partition_locator.hpp"
#include "util/config.hpp"

#include <memory>
#include <string>

namespace swi {

struct ResolverOptions {
    std::string temp_dir = "/tmp";
    std::string mount_base_dir = "/tmp";
    std::string archive_suffix = ".swi";
    bool progress = true;
};

// The collaborators every transport shares; all are read-only views of
// system state except the runner and mount ops, which act on it.
struct ResolverContext {
    ResolverOptions options;
    std::shared_ptr<const ICommandRunner> runner;
    std::shared_ptr<const MountSession::ISystemOps> mount_ops;
    std::shared_ptr<const IMountRegistry> registry;
    std::shared_ptr<const ILiveMountTable> mount_table;
    std::shared_ptr<const IPartitionLocator> partitions;
    std::shared_ptr<const ArchiveInspector> inspector;

    static ResolverContext FromConfig(const config::LocatorConfig& cfg);
};

} // namespace swi
