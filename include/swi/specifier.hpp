#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace swi {

// [user[:password]@]host[:port]. The host is split at the last ':', so
// IPv6 literals are not supported.
struct HostInfo {
    std::string host;
    std::optional<std::uint16_t> port;
    std::optional<std::string> user;
    std::optional<std::string> password;
};

std::expected<HostInfo, std::string> ParseHostInfo(std::string_view text);

// http://, https://, ftp://; the URL is handed to the downloader as given.
struct UrlSpecifier {
    std::string url;
};

struct SshSpecifier {
    HostInfo host;
    std::string path; // absolute path on the remote host
};

struct TftpSpecifier {
    static constexpr std::uint16_t kDefaultPort = 69;
    HostInfo host;
    std::string path;
};

struct NfsSpecifier {
    HostInfo host;
    std::string path; // export directory + file name
};

// "/dev/sdb1:images/foo.swi" or "ONL-IMAGES::latest".
struct DeviceSpecifier {
    std::string device_or_label;
    std::string relative_path;
};

struct LocalPathSpecifier {
    std::string path;
};

using Specifier = std::variant<UrlSpecifier,
                               SshSpecifier,
                               TftpSpecifier,
                               NfsSpecifier,
                               DeviceSpecifier,
                               LocalPathSpecifier>;

std::expected<Specifier, std::string> ParseSpecifier(std::string_view text);

} // namespace swi
