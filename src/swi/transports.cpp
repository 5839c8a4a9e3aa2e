#include "swi/transports.hpp"

#include "io/temp_file.hpp"
#include "swi/download_progress.hpp"
#include "swi/mount_session.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace swi {

namespace {

constexpr const char* kDownloadPrefix = "swi-";

std::string SuffixOf(const std::string& remote_path) {
    return fs::path(remote_path).extension().string();
}

Result CreateDownloadFile(const ResolverContext& ctx, const std::string& remote_path, TempFile& out) {
    return TempFile::Create(ctx.options.temp_dir, kDownloadPrefix, SuffixOf(remote_path), out);
}

} // namespace

UrlTransport::UrlTransport(ResolverContext ctx) : ctx_(std::move(ctx)) {}

Result UrlTransport::Resolve(const UrlSpecifier& spec, std::string& out_path) const {
    std::string remote_path = spec.url;
    const auto query = remote_path.find_first_of("?#");
    if (query != std::string::npos) remote_path.resize(query);

    TempFile tmp;
    auto create_result = CreateDownloadFile(ctx_, remote_path, tmp);
    if (!create_result.is_ok())
        return create_result;

    LogInfo("downloading %s to %s", spec.url.c_str(), tmp.Path().c_str());
    DownloadProgress progress(fs::path(remote_path).filename().string(), ctx_.options.progress);
    auto fetch_result = downloader_.Fetch(spec.url, tmp.GetFd(), &progress);
    if (!fetch_result.is_ok())
        return fetch_result;

    out_path = tmp.Keep();
    return Result::Ok();
}

SshTransport::SshTransport(ResolverContext ctx) : ctx_(std::move(ctx)) {}

Command SshTransport::BuildCommand(const SshSpecifier& spec, const std::string& local_path) {
    Command cmd;
    if (spec.host.password) {
        cmd.argv = {"sshpass", "-e"};
        cmd.env.emplace_back(kPasswordEnv, *spec.host.password);
    }
    cmd.argv.emplace_back("ssh");
    if (spec.host.port) {
        cmd.argv.insert(cmd.argv.end(), {"-p", std::to_string(*spec.host.port)});
    }
    cmd.argv.insert(cmd.argv.end(), {"-o", "StrictHostKeyChecking=no",
                                     "-o", "UserKnownHostsFile=/dev/null"});
    cmd.argv.push_back(spec.host.user ? *spec.host.user + "@" + spec.host.host : spec.host.host);
    cmd.argv.push_back("cat " + ShellQuote(spec.path));
    cmd.stdout_path = local_path;
    return cmd;
}

Result SshTransport::Resolve(const SshSpecifier& spec, std::string& out_path) const {
    TempFile tmp;
    auto create_result = CreateDownloadFile(ctx_, spec.path, tmp);
    if (!create_result.is_ok())
        return create_result;
    tmp.Close();

    LogInfo("copying %s:%s over ssh", spec.host.host.c_str(), spec.path.c_str());
    auto run_result = ctx_.runner->Run(BuildCommand(spec, tmp.Path()), nullptr);
    if (!run_result.is_ok())
        return run_result;

    out_path = tmp.Keep();
    return Result::Ok();
}

TftpTransport::TftpTransport(ResolverContext ctx) : ctx_(std::move(ctx)) {}

Command TftpTransport::BuildCommand(const TftpSpecifier& spec, const std::string& local_path) {
    const std::uint16_t port = spec.host.port.value_or(TftpSpecifier::kDefaultPort);
    Command cmd;
    cmd.argv = {"tftp", "-m", "binary", spec.host.host, std::to_string(port),
                "-c", "get", spec.path, local_path};
    return cmd;
}

Result TftpTransport::Resolve(const TftpSpecifier& spec, std::string& out_path) const {
    TempFile tmp;
    auto create_result = CreateDownloadFile(ctx_, spec.path, tmp);
    if (!create_result.is_ok())
        return create_result;
    tmp.Close();

    LogInfo("fetching %s:%s over tftp", spec.host.host.c_str(), spec.path.c_str());
    auto run_result = ctx_.runner->Run(BuildCommand(spec, tmp.Path()), nullptr);
    if (!run_result.is_ok())
        return run_result;

    out_path = tmp.Keep();
    return Result::Ok();
}

NfsTransport::NfsTransport(ResolverContext ctx) : ctx_(std::move(ctx)) {}

Result NfsTransport::Resolve(const NfsSpecifier& spec, std::string& out_path) const {
    const fs::path remote(spec.path);
    const std::string file = remote.filename().string();
    std::string export_dir = remote.parent_path().string();
    if (export_dir.empty()) export_dir = "/";
    if (file.empty()) {
        return Result::Fail(ErrorKind::InvalidSpecifier, "nfs path names no file: " + spec.path);
    }

    // NFS mounts take the port as an option, not as part of the source.
    MountOptions options{"nfs", "ro,nolock"};
    if (spec.host.port) options.options += ",port=" + std::to_string(*spec.host.port);

    MountSession session(ctx_.mount_ops);
    auto mount_result = MountSession::MountDevice(spec.host.host + ":" + export_dir,
                                                  ctx_.options.mount_base_dir, "swi-nfs-", options,
                                                  session);
    if (!mount_result.is_ok())
        return mount_result;

    TempFile tmp;
    Result copy_result = CreateDownloadFile(ctx_, spec.path, tmp);
    if (copy_result.is_ok()) {
        tmp.Close();
        const fs::path src = fs::path(session.Dir()) / file;
        std::error_code ec;
        fs::copy_file(src, tmp.Path(), fs::copy_options::overwrite_existing, ec);
        if (ec) {
            const ErrorKind kind = ec == std::errc::no_such_file_or_directory ? ErrorKind::MissingArchive
                                                                               : ErrorKind::Io;
            copy_result = Result::Fail(kind, "cannot copy " + src.string() + ": " + ec.message(), ec.value());
        }
    }

    auto unmount_result = session.Unmount();
    if (!copy_result.is_ok()) {
        if (!unmount_result.is_ok()) LogWarn("%s", unmount_result.msg.c_str());
        return copy_result;
    }
    if (!unmount_result.is_ok())
        return unmount_result;

    out_path = tmp.Keep();
    return Result::Ok();
}

LocalPathTransport::LocalPathTransport(ResolverContext ctx)
    : ctx_(ctx), devices_(std::move(ctx)) {}

Result LocalPathTransport::Resolve(const LocalPathSpecifier& spec, std::string& out_path) const {
    std::error_code ec;
    if (fs::exists(spec.path, ec)) {
        out_path = spec.path;
        return Result::Ok();
    }

    auto match = ctx_.registry->FindByPath(spec.path);
    if (!match || match->remainder.empty()) {
        return Result::Fail(ErrorKind::InvalidSpecifier, "invalid specifier: " + spec.path + " does not exist");
    }

    LogDebug("%s is below %s (%s)", spec.path.c_str(), match->record.directory.c_str(),
             match->record.label.c_str());
    return devices_.Resolve(DeviceSpecifier{match->record.label, match->remainder}, out_path);
}

} // namespace swi
