#pragma once

#include "swi/resolver_context.hpp"
#include "swi/specifier.hpp"
#include "util/result.hpp"

#include <optional>
#include <string>

namespace swi {

class BlockDeviceResolver {
  public:
    explicit BlockDeviceResolver(ResolverContext ctx);

    // `device_or_label` is a /dev node or a label known to the registry or blkid.
    Result Resolve(const DeviceSpecifier& spec, std::string& out_path) const;

    // Finds `relative_path` (or "[dir/]:latest") on `device`, reusing a live
    // mount when there is one. A fresh mount is moved to `dest_dir` when that
    // is given and differs, otherwise it is left mounted where it is.
    Result Copy(const std::string& device,
                const std::string& relative_path,
                const std::optional<std::string>& dest_dir,
                std::string& out_path) const;

  private:
    Result Locate(const std::string& root, const std::string& relative_path, std::string& out_path) const;

    ResolverContext ctx_;
};

} // namespace swi
