#include "swi/partition_locator.hpp"

#include "util/logger.hpp"

#include <utility>

namespace swi {

BlkidPartitionLocator::BlkidPartitionLocator(std::shared_ptr<const ICommandRunner> runner)
    : runner_(runner ? std::move(runner) : DefaultCommandRunner()) {}

std::optional<std::string> BlkidPartitionLocator::Find(const std::string& label) const {
    if (label.empty()) return std::nullopt;

    Command cmd;
    cmd.argv = {"blkid", "-L", label};
    std::string out;
    auto res = runner_->Run(cmd, &out);
    if (!res.is_ok()) {
        // blkid exits 2 for unknown labels; free-form registry labels land here too.
        LogDebug("no partition labelled %s (%s)", label.c_str(), res.msg.c_str());
        return std::nullopt;
    }

    const auto first = out.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return std::nullopt;
    const auto eol = out.find_first_of("\r\n", first);
    std::string device = out.substr(first, eol == std::string::npos ? std::string::npos : eol - first);
    while (!device.empty() && (device.back() == ' ' || device.back() == '\t')) device.pop_back();

    LogDebug("partition %s is %s", label.c_str(), device.c_str());
    return device;
}

} // namespace swi
