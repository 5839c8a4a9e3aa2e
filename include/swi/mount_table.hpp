#pragma once

#include <optional>
#include <string>
#include <vector>

namespace swi {

struct LiveMount {
    std::string device;
    std::string directory;
};

class ILiveMountTable {
  public:
    virtual ~ILiveMountTable() = default;
    virtual std::vector<LiveMount> Mounts() const = 0;

    // First mount of `device`; device nodes are compared after resolving symlinks.
    std::optional<LiveMount> FindByDevice(const std::string& device) const;
};

// Parses a /proc/mounts style file on every call.
class ProcMountTable final : public ILiveMountTable {
  public:
    explicit ProcMountTable(std::string path = "/proc/mounts");
    std::vector<LiveMount> Mounts() const override;

  private:
    std::string path_;
};

// Decodes the octal escapes (\040, \011, \012, \134) used in /proc/mounts.
std::string UnescapeMountField(const std::string& field);

} // namespace swi
