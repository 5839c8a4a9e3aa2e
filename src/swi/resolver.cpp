#include "swi/resolver.hpp"

#include "swi/specifier.hpp"
#include "util/logger.hpp"

#include <variant>

namespace swi {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

} // namespace

std::string RedactSpecifier(std::string_view specifier) {
    const auto sep = specifier.find("://");
    if (sep == std::string_view::npos) return std::string(specifier);

    // The user name holds no '/', so the user:password colon precedes the
    // first '/'. The password itself may contain '/' or '@' and ends at the
    // last '@' before the final path component.
    const auto begin = sep + 3;
    const std::string_view rest = specifier.substr(begin);
    const auto colon = rest.find(':');
    if (colon == std::string_view::npos || colon > rest.find('/')) return std::string(specifier);

    const auto last_slash = rest.rfind('/');
    const std::string_view userinfo_area = last_slash == std::string_view::npos ? rest : rest.substr(0, last_slash);
    const auto at = userinfo_area.rfind('@');
    if (at == std::string_view::npos || at < colon) return std::string(specifier);

    std::string out(specifier.substr(0, begin + colon + 1));
    out += "***";
    out += specifier.substr(begin + at);
    return out;
}

SwiResolver::SwiResolver(ResolverContext ctx)
    : url_(ctx), ssh_(ctx), tftp_(ctx), nfs_(ctx), devices_(ctx), local_(std::move(ctx)) {}

Result SwiResolver::Resolve(std::string_view specifier, std::string& out_path) const {
    const std::string shown = RedactSpecifier(specifier);

    auto parsed = ParseSpecifier(specifier);
    if (!parsed) {
        LogError("invalid specifier '%s': %s", shown.c_str(), parsed.error().c_str());
        return Result::Fail(ErrorKind::InvalidSpecifier, parsed.error());
    }

    std::string path;
    Result res = std::visit(
        Overloaded{
            [&](const UrlSpecifier& s) { return url_.Resolve(s, path); },
            [&](const SshSpecifier& s) { return ssh_.Resolve(s, path); },
            [&](const TftpSpecifier& s) { return tftp_.Resolve(s, path); },
            [&](const NfsSpecifier& s) { return nfs_.Resolve(s, path); },
            [&](const DeviceSpecifier& s) { return devices_.Resolve(s, path); },
            [&](const LocalPathSpecifier& s) { return local_.Resolve(s, path); },
        },
        *parsed);

    if (!res.is_ok()) {
        LogError("cannot resolve '%s': %s: %s", shown.c_str(), ToString(res.kind), res.msg.c_str());
        return res;
    }
    if (path.empty()) {
        LogError("cannot resolve '%s': no path produced", shown.c_str());
        return Result::Fail(ErrorKind::NotFound, "no path produced for " + shown);
    }

    LogInfo("resolved '%s' to %s", shown.c_str(), path.c_str());
    out_path = std::move(path);
    return Result::Ok();
}

} // namespace swi
