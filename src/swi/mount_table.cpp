#include "swi/mount_table.hpp"

#include "util/logger.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace swi {

namespace {

std::string Canonical(const std::string& path) {
    std::error_code ec;
    const fs::path p = fs::canonical(path, ec);
    return ec ? path : p.string();
}

bool IsOctal(char c) { return c >= '0' && c <= '7'; }

} // namespace

std::string UnescapeMountField(const std::string& field) {
    std::string out;
    out.reserve(field.size());
    for (size_t i = 0; i < field.size(); ++i) {
        if (field[i] == '\\' && i + 3 < field.size() && IsOctal(field[i + 1]) &&
            IsOctal(field[i + 2]) && IsOctal(field[i + 3])) {
            out.push_back(static_cast<char>(((field[i + 1] - '0') << 6) |
                                            ((field[i + 2] - '0') << 3) |
                                            (field[i + 3] - '0')));
            i += 3;
            continue;
        }
        out.push_back(field[i]);
    }
    return out;
}

std::optional<LiveMount> ILiveMountTable::FindByDevice(const std::string& device) const {
    const std::string wanted = Canonical(device);
    for (auto& m : Mounts()) {
        if (m.device == device || Canonical(m.device) == wanted) return std::move(m);
    }
    return std::nullopt;
}

ProcMountTable::ProcMountTable(std::string path) : path_(std::move(path)) {}

std::vector<LiveMount> ProcMountTable::Mounts() const {
    std::ifstream is(path_);
    if (!is.good()) {
        LogWarn("cannot read mount table %s", path_.c_str());
        return {};
    }

    std::vector<LiveMount> out;
    std::string line;
    while (std::getline(is, line)) {
        std::istringstream fields(line);
        std::string device;
        std::string dir;
        if (!(fields >> device >> dir)) continue;
        out.push_back(LiveMount{UnescapeMountField(device), UnescapeMountField(dir)});
    }
    return out;
}

} // namespace swi
