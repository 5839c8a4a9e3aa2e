#pragma once

#include <optional>
#include <string>
#include <vector>

namespace swi {

struct MountRecord {
    std::string label;
    std::string directory;
    // Filesystem label handed to the partition locator; defaults to `label`.
    std::string partition_label;
};

struct RegistryMatch {
    MountRecord record;
    std::string remainder; // path below record.directory
};

class IMountRegistry {
  public:
    virtual ~IMountRegistry() = default;
    virtual std::vector<MountRecord> Records() const = 0;

    std::optional<MountRecord> Lookup(const std::string& label) const;
    // Longest registered directory that is a path prefix of `path`.
    std::optional<RegistryMatch> FindByPath(const std::string& path) const;
};

// {"mounts": {"<label>": {"dir": "<path>", "label": "<fs label>"}}}
// Re-read on every call; other system activity may rewrite it at any time.
class FileMountRegistry final : public IMountRegistry {
  public:
    explicit FileMountRegistry(std::string path);
    std::vector<MountRecord> Records() const override;

  private:
    std::string path_;
};

} // namespace swi
