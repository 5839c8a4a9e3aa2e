#include "swi/resolver_context.hpp"

namespace swi {

ResolverContext ResolverContext::FromConfig(const config::LocatorConfig& cfg) {
    ResolverContext ctx;
    ctx.options.temp_dir = cfg.temp_dir;
    ctx.options.mount_base_dir = cfg.mount_base_dir;
    ctx.options.archive_suffix = cfg.archive_suffix;
    ctx.options.progress = cfg.progress;

    ctx.runner = DefaultCommandRunner();
    ctx.mount_ops = std::make_shared<CommandMountOps>(ctx.runner);
    ctx.registry = std::make_shared<FileMountRegistry>(cfg.mount_registry);
    ctx.mount_table = std::make_shared<ProcMountTable>(cfg.proc_mounts);
    ctx.partitions = std::make_shared<BlkidPartitionLocator>(ctx.runner);
    ctx.inspector = std::make_shared<ArchiveInspector>();
    return ctx;
}

} // namespace swi
