#pragma once

#include "util/result.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace swi {

struct Command {
    std::vector<std::string> argv;
    // Added to (or overriding) the inherited environment. Values are never logged.
    std::vector<std::pair<std::string, std::string>> env;
    // When set, the child's stdout is written to this file (truncated first).
    std::string stdout_path;
};

std::string FormatArgv(const std::vector<std::string>& argv);

class ICommandRunner {
  public:
    virtual ~ICommandRunner() = default;

    // Blocks until the child exits. A non-zero exit status is a
    // TransportFailure whose `err` holds the status. When `captured_stdout`
    // is non-null and no stdout_path is set, the child's stdout is collected.
    virtual Result Run(const Command& cmd, std::string* captured_stdout) const = 0;
};

class PosixCommandRunner final : public ICommandRunner {
  public:
    Result Run(const Command& cmd, std::string* captured_stdout) const override;
};

std::shared_ptr<const ICommandRunner> DefaultCommandRunner();

} // namespace swi
