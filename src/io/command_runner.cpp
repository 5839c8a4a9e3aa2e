#include "io/command_runner.hpp"

#include "io/fd.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace swi {

namespace {

class SpawnFileActions {
  public:
    SpawnFileActions() : init_error_(::posix_spawn_file_actions_init(&actions_)) {}
    ~SpawnFileActions() {
        if (init_error_ == 0) ::posix_spawn_file_actions_destroy(&actions_);
    }
    SpawnFileActions(const SpawnFileActions&) = delete;
    SpawnFileActions& operator=(const SpawnFileActions&) = delete;

    posix_spawn_file_actions_t* Get() { return &actions_; }
    int InitError() const { return init_error_; }

  private:
    posix_spawn_file_actions_t actions_;
    int init_error_;
};

std::vector<std::string> BuildEnvironment(const std::vector<std::pair<std::string, std::string>>& extra) {
    std::vector<std::string> out;
    for (char** e = environ; e && *e; ++e) {
        const std::string entry(*e);
        bool overridden = false;
        for (const auto& [key, value] : extra) {
            if (entry.size() > key.size() && entry.compare(0, key.size(), key) == 0 &&
                entry[key.size()] == '=') {
                overridden = true;
                break;
            }
        }
        if (!overridden) out.push_back(entry);
    }
    for (const auto& [key, value] : extra) {
        out.push_back(key + "=" + value);
    }
    return out;
}

std::vector<char*> ToCharArray(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) out.push_back(s.data());
    out.push_back(nullptr);
    return out;
}

Result WaitForChild(pid_t pid, const std::string& name) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            const int err = errno;
            return Result::Fail(ErrorKind::TransportFailure,
                                name + ": waitpid failed: " + std::strerror(err), err);
        }
    }
    if (WIFEXITED(status)) {
        const int code = WEXITSTATUS(status);
        if (code != 0) {
            return Result::Fail(ErrorKind::TransportFailure,
                                name + " exited with status " + std::to_string(code), code);
        }
        return Result::Ok();
    }
    if (WIFSIGNALED(status)) {
        return Result::Fail(ErrorKind::TransportFailure,
                            name + " killed by signal " + std::to_string(WTERMSIG(status)));
    }
    return Result::Fail(ErrorKind::TransportFailure, name + " terminated abnormally");
}

} // namespace

std::string FormatArgv(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& a : argv) {
        if (!out.empty()) out.push_back(' ');
        out += a;
    }
    return out;
}

Result PosixCommandRunner::Run(const Command& cmd, std::string* captured_stdout) const {
    if (cmd.argv.empty()) {
        return Result::Fail(ErrorKind::TransportFailure, "empty command");
    }
    const std::string& name = cmd.argv.front();
    LogDebug("exec: %s%s%s",
             FormatArgv(cmd.argv).c_str(),
             cmd.stdout_path.empty() ? "" : " > ",
             cmd.stdout_path.c_str());

    SpawnFileActions actions;
    if (actions.InitError() != 0) {
        return Result::Fail(ErrorKind::TransportFailure,
                            name + ": posix_spawn_file_actions_init failed: " +
                                std::strerror(actions.InitError()),
                            actions.InitError());
    }
    Fd read_end;
    Fd write_end;
    const bool capture = captured_stdout && cmd.stdout_path.empty();

    if (!cmd.stdout_path.empty()) {
        const int rc = ::posix_spawn_file_actions_addopen(actions.Get(), STDOUT_FILENO,
                                                          cmd.stdout_path.c_str(),
                                                          O_WRONLY | O_CREAT | O_TRUNC, 0600);
        if (rc != 0) {
            return Result::Fail(ErrorKind::TransportFailure,
                                name + ": cannot redirect stdout to " + cmd.stdout_path + ": " +
                                    std::strerror(rc),
                                rc);
        }
    } else if (capture) {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            const int err = errno;
            return Result::Fail(ErrorKind::TransportFailure,
                                name + ": pipe failed: " + std::strerror(err), err);
        }
        read_end.Reset(fds[0]);
        write_end.Reset(fds[1]);
        const int rc = ::posix_spawn_file_actions_adddup2(actions.Get(), write_end.Get(), STDOUT_FILENO);
        if (rc != 0) {
            return Result::Fail(ErrorKind::TransportFailure,
                                name + ": cannot capture stdout: " + std::strerror(rc), rc);
        }
    }

    std::vector<std::string> args = cmd.argv;
    std::vector<std::string> env = BuildEnvironment(cmd.env);
    std::vector<char*> c_args = ToCharArray(args);
    std::vector<char*> c_env = ToCharArray(env);

    pid_t pid = 0;
    const int rc = ::posix_spawnp(&pid, name.c_str(), actions.Get(), nullptr, c_args.data(), c_env.data());
    if (rc != 0) {
        return Result::Fail(ErrorKind::TransportFailure,
                            name + ": spawn failed: " + std::strerror(rc), rc);
    }

    if (capture) {
        write_end.Close();
        captured_stdout->clear();
        char buf[4096];
        while (true) {
            const ssize_t n = ::read(read_end.Get(), buf, sizeof(buf));
            if (n > 0) {
                captured_stdout->append(buf, static_cast<size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR) continue;
            break;
        }
    }

    return WaitForChild(pid, name);
}

std::shared_ptr<const ICommandRunner> DefaultCommandRunner() {
    static const std::shared_ptr<const ICommandRunner> kDefault =
        std::make_shared<PosixCommandRunner>();
    return kDefault;
}

} // namespace swi
