#pragma once

#include "swi/version_key.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace swi {

// Where a version key came from, most trusted first.
enum class VersionSource : int {
    Manifest = 0,
    LegacyVersionFile,
    FileName,
    ModificationTime,
    None,
};

const char* ToString(VersionSource source);

struct VersionKey {
    VersionSource source = VersionSource::None;
    std::optional<Timestamp> time;

    // Keys read from the archive or its name, as opposed to filesystem time.
    bool IsEmbedded() const {
        return time.has_value() && source != VersionSource::ModificationTime &&
               source != VersionSource::None;
    }
};

// Strict weak order: absent < modification time < embedded, then by time.
bool RankLess(const VersionKey& lhs, const VersionKey& rhs);

// Everything the version sources may look at, read in a single pass.
struct ArchiveSnapshot {
    std::string path;
    bool is_archive = false;
    std::optional<std::string> manifest_json;
    std::optional<std::string> version_text;
    std::optional<Timestamp> mtime;
};

class ArchiveInspector {
  public:
    class IVersionSource {
      public:
        virtual ~IVersionSource() = default;
        virtual VersionSource Kind() const = 0;
        virtual std::optional<Timestamp> Probe(const ArchiveSnapshot& snapshot) const = 0;
    };

    ArchiveInspector();
    explicit ArchiveInspector(std::vector<std::unique_ptr<IVersionSource>> sources);

    // Never fails: unreadable or non-zip files yield a snapshot with is_archive == false.
    static ArchiveSnapshot Snapshot(const std::string& path);

    // Consults the sources in order and returns the first hit. For files that
    // are not zip archives only the modification time is consulted.
    VersionKey KeyOf(const ArchiveSnapshot& snapshot) const;
    VersionKey Inspect(const std::string& path) const;

  private:
    std::vector<std::unique_ptr<IVersionSource>> sources_;
};

// Manifest, legacy version file, file name, modification time.
std::vector<std::unique_ptr<ArchiveInspector::IVersionSource>> CreateDefaultVersionSources();

} // namespace swi
