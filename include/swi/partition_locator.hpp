#pragma once

#include "io/command_runner.hpp"

#include <memory>
#include <optional>
#include <string>

namespace swi {

class IPartitionLocator {
  public:
    virtual ~IPartitionLocator() = default;
    // Device node for a filesystem label, or nullopt when the label is unknown.
    virtual std::optional<std::string> Find(const std::string& label) const = 0;
};

// Asks the block-id index via `blkid -L <label>`.
class BlkidPartitionLocator final : public IPartitionLocator {
  public:
    explicit BlkidPartitionLocator(std::shared_ptr<const ICommandRunner> runner);
    std::optional<std::string> Find(const std::string& label) const override;

  private:
    std::shared_ptr<const ICommandRunner> runner_;
};

} // namespace swi
