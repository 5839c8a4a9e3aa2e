#pragma once

#include "swi/block_device_resolver.hpp"
#include "swi/http_downloader.hpp"
#include "swi/resolver_context.hpp"
#include "swi/specifier.hpp"
#include "util/result.hpp"

#include <string>

namespace swi {

// Transports that copy the image into a fresh temp file. On success the
// caller owns the file named by `out_path`; on failure nothing is left behind.

class UrlTransport {
  public:
    explicit UrlTransport(ResolverContext ctx);
    Result Resolve(const UrlSpecifier& spec, std::string& out_path) const;

  private:
    ResolverContext ctx_;
    CurlDownloader downloader_;
};

class SshTransport {
  public:
    static constexpr const char* kPasswordEnv = "SSHPASS";

    explicit SshTransport(ResolverContext ctx);
    Result Resolve(const SshSpecifier& spec, std::string& out_path) const;

    // The password, if any, is only ever placed in `cmd.env`.
    static Command BuildCommand(const SshSpecifier& spec, const std::string& local_path);

  private:
    ResolverContext ctx_;
};

class TftpTransport {
  public:
    explicit TftpTransport(ResolverContext ctx);
    Result Resolve(const TftpSpecifier& spec, std::string& out_path) const;

    static Command BuildCommand(const TftpSpecifier& spec, const std::string& local_path);

  private:
    ResolverContext ctx_;
};

class NfsTransport {
  public:
    explicit NfsTransport(ResolverContext ctx);
    Result Resolve(const NfsSpecifier& spec, std::string& out_path) const;

  private:
    ResolverContext ctx_;
};

// Existing paths pass through untouched; paths below a registered mount
// directory are looked up on the device behind it.
class LocalPathTransport {
  public:
    explicit LocalPathTransport(ResolverContext ctx);
    Result Resolve(const LocalPathSpecifier& spec, std::string& out_path) const;

  private:
    ResolverContext ctx_;
    BlockDeviceResolver devices_;
};

} // namespace swi
