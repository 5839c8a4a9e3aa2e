#include "swi/specifier.hpp"

#include "util/path_utils.hpp"

#include <charconv>

namespace swi {

namespace {

struct RemotePart {
    HostInfo host;
    std::string path;
};

std::expected<RemotePart, std::string> ParseRemote(std::string_view rest, std::string_view scheme) {
    const auto slash = rest.find('/');
    if (slash == std::string_view::npos) {
        return std::unexpected(std::string(scheme) + " specifier needs host/path");
    }
    auto host = ParseHostInfo(rest.substr(0, slash));
    if (!host) return std::unexpected(host.error());

    RemotePart out;
    out.host = std::move(*host);
    out.path = std::string(rest.substr(slash));
    if (out.path == "/") {
        return std::unexpected(std::string(scheme) + " specifier has an empty path");
    }
    return out;
}

} // namespace

std::expected<HostInfo, std::string> ParseHostInfo(std::string_view text) {
    HostInfo info;
    std::string_view hostport = text;

    const auto at = text.rfind('@');
    if (at != std::string_view::npos) {
        const std::string_view userinfo = text.substr(0, at);
        hostport = text.substr(at + 1);
        const auto colon = userinfo.find(':');
        if (colon == std::string_view::npos) {
            info.user = std::string(userinfo);
        } else {
            info.user = std::string(userinfo.substr(0, colon));
            info.password = std::string(userinfo.substr(colon + 1));
        }
        if (info.user->empty()) info.user.reset();
    }

    const auto colon = hostport.rfind(':');
    if (colon != std::string_view::npos) {
        const std::string_view port = hostport.substr(colon + 1);
        unsigned value = 0;
        const auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
        if (port.empty() || ec != std::errc() || ptr != port.data() + port.size() ||
            value == 0 || value > 65535) {
            return std::unexpected("invalid port '" + std::string(port) + "'");
        }
        info.port = static_cast<std::uint16_t>(value);
        hostport = hostport.substr(0, colon);
    }

    if (hostport.empty()) {
        return std::unexpected(std::string("missing host in '") + std::string(text) + "'");
    }
    info.host = std::string(hostport);
    return info;
}

std::expected<Specifier, std::string> ParseSpecifier(std::string_view text) {
    if (text.empty()) {
        return std::unexpected("empty specifier");
    }

    const auto sep = text.find("://");
    if (sep != std::string_view::npos) {
        const std::string_view scheme = text.substr(0, sep);
        const std::string_view rest = text.substr(sep + 3);

        if (scheme == "http" || scheme == "https" || scheme == "ftp") {
            if (rest.empty()) return std::unexpected("missing host in " + std::string(text));
            return UrlSpecifier{std::string(text)};
        }
        if (scheme == "scp" || scheme == "ssh") {
            auto remote = ParseRemote(rest, scheme);
            if (!remote) return std::unexpected(remote.error());
            return SshSpecifier{std::move(remote->host), std::move(remote->path)};
        }
        if (scheme == "tftp") {
            auto remote = ParseRemote(rest, scheme);
            if (!remote) return std::unexpected(remote.error());
            return TftpSpecifier{std::move(remote->host), std::move(remote->path)};
        }
        if (scheme == "nfs") {
            auto remote = ParseRemote(rest, scheme);
            if (!remote) return std::unexpected(remote.error());
            return NfsSpecifier{std::move(remote->host), std::move(remote->path)};
        }
        return std::unexpected("unsupported scheme '" + std::string(scheme) + "'");
    }

    if (text.front() == '/') {
        const auto colon = text.find(':');
        if (IsDevPath(text) && colon != std::string_view::npos) {
            const std::string_view rel = text.substr(colon + 1);
            if (rel.empty()) return std::unexpected("missing path after device in " + std::string(text));
            return DeviceSpecifier{std::string(text.substr(0, colon)), std::string(rel)};
        }
        return LocalPathSpecifier{std::string(text)};
    }

    const auto colon = text.find(':');
    if (colon == std::string_view::npos || colon == 0 || colon + 1 == text.size()) {
        return std::unexpected("expected scheme://, label:path or an absolute path");
    }
    return DeviceSpecifier{std::string(text.substr(0, colon)), std::string(text.substr(colon + 1))};
}

} // namespace swi
