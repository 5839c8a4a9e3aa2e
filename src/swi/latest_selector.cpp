#include "swi/latest_selector.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace swi {

namespace {

std::string FormatKey(const VersionKey& key) {
    if (!key.time) return "unknown";
    const auto days = std::chrono::floor<std::chrono::days>(*key.time);
    const std::chrono::year_month_day ymd{days};
    const std::chrono::hh_mm_ss hms{*key.time - days};
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u.%02ld:%02ld",
                  static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()),
                  static_cast<long>(hms.hours().count()),
                  static_cast<long>(hms.minutes().count()));
    return buf;
}

} // namespace

std::vector<ArchiveCandidate> RankCandidates(std::vector<ArchiveCandidate> candidates) {
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const ArchiveCandidate& a, const ArchiveCandidate& b) {
                         return RankLess(a.key, b.key);
                     });
    return candidates;
}

Result SelectLatest(const std::string& dir,
                    const std::string& suffix,
                    const ArchiveInspector& inspector,
                    std::string& out_path) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return Result::Fail(ErrorKind::NotFound,
                            "cannot list " + dir + ": " + ec.message(), ec.value());
    }

    std::vector<ArchiveCandidate> candidates;
    for (const auto& entry : it) {
        const std::string name = entry.path().filename().string();
        if (!EndsWith(name, suffix)) continue;
        std::error_code type_ec;
        if (entry.is_directory(type_ec)) continue;

        ArchiveCandidate c;
        c.path = entry.path().string();
        c.key = inspector.Inspect(c.path);
        LogDebug("candidate %s: %s (%s)",
                 c.path.c_str(), FormatKey(c.key).c_str(), ToString(c.key.source));
        candidates.push_back(std::move(c));
    }

    if (candidates.empty()) {
        return Result::Fail(ErrorKind::MissingArchive, "no *" + suffix + " files in " + dir);
    }

    auto ranked = RankCandidates(std::move(candidates));
    out_path = ranked.back().path;
    LogInfo("latest SWI in %s is %s", dir.c_str(), out_path.c_str());
    return Result::Ok();
}

} // namespace swi
