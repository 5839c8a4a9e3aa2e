#pragma once

#include "swi/archive_inspector.hpp"
#include "util/result.hpp"

#include <string>
#include <vector>

namespace swi {

struct ArchiveCandidate {
    std::string path;
    VersionKey key;
};

// Candidates sorted ascending by RankLess; equal keys keep their input order.
std::vector<ArchiveCandidate> RankCandidates(std::vector<ArchiveCandidate> candidates);

// Picks the newest file in `dir` whose name ends with `suffix`. Among equal
// keys the one listed last by the directory wins.
Result SelectLatest(const std::string& dir,
                    const std::string& suffix,
                    const ArchiveInspector& inspector,
                    std::string& out_path);

} // namespace swi
