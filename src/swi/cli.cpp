#include "swi/cli.hpp"

#include "swi/resolver.hpp"
#include "util/config.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <filesystem>
#include <getopt.h>
#include <optional>
#include <string>
#include <system_error>

namespace swi {

namespace {

void PrintUsage(const char* argv0) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [-c <config>] [-v|-q] <specifier>\n"
        "\n"
        "Specifiers:\n"
        "  http://host/path.swi, https://..., ftp://...\n"
        "  scp://[user[:password]@]host[:port]/path.swi   (ssh:// is the same)\n"
        "  tftp://host[:port]/path.swi\n"
        "  nfs://host/export/path.swi\n"
        "  /dev/sdb1:images/foo.swi, LABEL:images/foo.swi, LABEL::latest\n"
        "  /absolute/path.swi\n"
        "\n"
        "Options:\n"
        "  -c, --config    JSON config file (default %s)\n"
        "  -v, --verbose   Debug logging\n"
        "  -q, --quiet     Errors only\n"
        "  -h, --help      Show this help\n",
        argv0, config::kDefaultConfigPath);
}

} // namespace

int RunCli(int argc, char** argv, std::FILE* out) {
    std::string config_path = config::kDefaultConfigPath;
    bool explicit_config = false;
    std::optional<LogLevel> cli_level;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"verbose", no_argument, nullptr, 'v'},
        {"quiet", no_argument, nullptr, 'q'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    optind = 0; // restart getopt; RunCli may be called more than once per process
    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "+hc:vq", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'c':
                config_path = optarg;
                explicit_config = true;
                break;

            case 'v':
                cli_level = LogLevel::Debug;
                break;

            case 'q':
                cli_level = LogLevel::Error;
                break;

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (optind + 1 != argc) {
        PrintUsage(argv[0]);
        return 2;
    }
    const std::string specifier = argv[optind];

    config::LocatorConfig cfg;
    std::error_code ec;
    if (explicit_config || std::filesystem::exists(config_path, ec)) {
        auto load_result = cfg.LoadFile(config_path);
        if (!load_result.is_ok()) {
            LogError("%s", load_result.msg.c_str());
            return 2;
        }
    }

    if (cli_level) {
        Logger::Instance().SetLevel(*cli_level);
    } else if (cfg.log_level) {
        Logger::Instance().SetLevel(*cfg.log_level);
    }

    SwiResolver resolver(ResolverContext::FromConfig(cfg));
    std::string path;
    auto res = resolver.Resolve(specifier, path);
    if (!res.is_ok()) {
        return 1;
    }

    std::fprintf(out, "%s\n", path.c_str());
    std::fflush(out);
    return 0;
}

} // namespace swi
