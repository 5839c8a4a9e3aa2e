#include "swi/archive_inspector.hpp"

#include "util/logger.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace swi {

namespace {

constexpr const char* kManifestEntry = "manifest.json";
constexpr const char* kVersionEntry = "version";

struct ArchiveReadDeleter {
    void operator()(archive* a) const { archive_read_free(a); }
};
using ArchiveReadPtr = std::unique_ptr<archive, ArchiveReadDeleter>;

std::string EntryName(archive_entry* entry) {
    const char* raw = archive_entry_pathname(entry);
    std::string name = raw ? raw : "";
    while (name.rfind("./", 0) == 0) name.erase(0, 2);
    return name;
}

bool ReadEntry(archive* a, std::string& out) {
    out.clear();
    char buf[8192];
    while (true) {
        const la_ssize_t n = archive_read_data(a, buf, sizeof(buf));
        if (n == 0) return true;
        if (n < 0) return false;
        out.append(buf, static_cast<size_t>(n));
    }
}

std::optional<Timestamp> ModificationTime(const std::string& path) {
    std::error_code ec;
    const auto ftime = fs::last_write_time(path, ec);
    if (ec) return std::nullopt;
    return std::chrono::floor<std::chrono::seconds>(std::chrono::file_clock::to_sys(ftime));
}

class ManifestSource final : public ArchiveInspector::IVersionSource {
  public:
    VersionSource Kind() const override { return VersionSource::Manifest; }

    std::optional<Timestamp> Probe(const ArchiveSnapshot& snapshot) const override {
        if (!snapshot.manifest_json) return std::nullopt;

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(*snapshot.manifest_json);
        } catch (const nlohmann::json::parse_error& e) {
            LogDebug("%s: unparsable manifest.json: %s", snapshot.path.c_str(), e.what());
            return std::nullopt;
        }
        if (!j.is_object()) return std::nullopt;
        auto version = j.find("version");
        if (version == j.end() || !version->is_object()) return std::nullopt;

        if (auto ts = Field(*version, "BUILD_TIMESTAMP", TimestampFormat::Colon)) return ts;
        return Field(*version, "FNAME_BUILD_TIMESTAMP", TimestampFormat::Compact);
    }

  private:
    static std::optional<Timestamp> Field(const nlohmann::json& version,
                                          const char* key,
                                          TimestampFormat format) {
        auto it = version.find(key);
        if (it == version.end() || !it->is_string()) return std::nullopt;
        return ParseTimestamp(it->get<std::string>(), format);
    }
};

class LegacyVersionFileSource final : public ArchiveInspector::IVersionSource {
  public:
    VersionSource Kind() const override { return VersionSource::LegacyVersionFile; }

    std::optional<Timestamp> Probe(const ArchiveSnapshot& snapshot) const override {
        if (!snapshot.version_text) return std::nullopt;
        return ExtractTimestamp(*snapshot.version_text);
    }
};

class FileNameSource final : public ArchiveInspector::IVersionSource {
  public:
    VersionSource Kind() const override { return VersionSource::FileName; }

    std::optional<Timestamp> Probe(const ArchiveSnapshot& snapshot) const override {
        return ExtractTimestamp(snapshot.path);
    }
};

class ModificationTimeSource final : public ArchiveInspector::IVersionSource {
  public:
    VersionSource Kind() const override { return VersionSource::ModificationTime; }

    std::optional<Timestamp> Probe(const ArchiveSnapshot& snapshot) const override {
        return snapshot.mtime;
    }
};

} // namespace

const char* ToString(VersionSource source) {
    switch (source) {
        case VersionSource::Manifest:          return "manifest";
        case VersionSource::LegacyVersionFile: return "version-file";
        case VersionSource::FileName:          return "file-name";
        case VersionSource::ModificationTime:  return "mtime";
        case VersionSource::None:              return "none";
    }
    return "none";
}

bool RankLess(const VersionKey& lhs, const VersionKey& rhs) {
    auto tier = [](const VersionKey& k) {
        if (!k.time) return 0;
        return k.IsEmbedded() ? 2 : 1;
    };
    const int lt = tier(lhs);
    const int rt = tier(rhs);
    if (lt != rt) return lt < rt;
    if (lt == 0) return false;
    return *lhs.time < *rhs.time;
}

std::vector<std::unique_ptr<ArchiveInspector::IVersionSource>> CreateDefaultVersionSources() {
    std::vector<std::unique_ptr<ArchiveInspector::IVersionSource>> out;
    out.emplace_back(std::make_unique<ManifestSource>());
    out.emplace_back(std::make_unique<LegacyVersionFileSource>());
    out.emplace_back(std::make_unique<FileNameSource>());
    out.emplace_back(std::make_unique<ModificationTimeSource>());
    return out;
}

ArchiveInspector::ArchiveInspector() : sources_(CreateDefaultVersionSources()) {}

ArchiveInspector::ArchiveInspector(std::vector<std::unique_ptr<IVersionSource>> sources)
    : sources_(std::move(sources)) {}

ArchiveSnapshot ArchiveInspector::Snapshot(const std::string& path) {
    ArchiveSnapshot snap;
    snap.path = path;
    snap.mtime = ModificationTime(path);

    ArchiveReadPtr a(archive_read_new());
    if (!a) return snap;
    archive_read_support_format_zip(a.get());

    if (archive_read_open_filename(a.get(), path.c_str(), 10240) != ARCHIVE_OK) {
        LogDebug("%s: not a zip archive: %s", path.c_str(), archive_error_string(a.get()));
        return snap;
    }

    archive_entry* entry = nullptr;
    bool first = true;
    while (true) {
        const int rc = archive_read_next_header(a.get(), &entry);
        if (rc == ARCHIVE_EOF) break;
        if (rc != ARCHIVE_OK && rc != ARCHIVE_WARN) {
            if (first) {
                LogDebug("%s: not a zip archive: %s", path.c_str(), archive_error_string(a.get()));
                return snap;
            }
            LogWarn("%s: archive read stopped early: %s", path.c_str(), archive_error_string(a.get()));
            break;
        }
        first = false;
        snap.is_archive = true;

        const std::string name = EntryName(entry);
        std::optional<std::string>* slot = nullptr;
        if (name == kManifestEntry) {
            slot = &snap.manifest_json;
        } else if (name == kVersionEntry) {
            slot = &snap.version_text;
        }
        if (!slot || slot->has_value()) continue;

        std::string contents;
        if (ReadEntry(a.get(), contents)) {
            *slot = std::move(contents);
        } else {
            LogWarn("%s: cannot read entry %s: %s",
                    path.c_str(), name.c_str(), archive_error_string(a.get()));
        }
    }

    // An empty but well-formed zip still counts as an archive.
    if (first) snap.is_archive = true;
    return snap;
}

VersionKey ArchiveInspector::KeyOf(const ArchiveSnapshot& snapshot) const {
    for (const auto& source : sources_) {
        if (!snapshot.is_archive && source->Kind() != VersionSource::ModificationTime) continue;
        if (auto ts = source->Probe(snapshot)) {
            return VersionKey{source->Kind(), ts};
        }
    }
    return VersionKey{};
}

VersionKey ArchiveInspector::Inspect(const std::string& path) const {
    return KeyOf(Snapshot(path));
}

} // namespace swi
