#pragma once

#include <chrono>
#include <optional>
#include <string_view>

namespace swi {

using Timestamp = std::chrono::sys_seconds;

enum class TimestampFormat {
    Colon,   // YYYY-MM-DD.HH:MM, used in manifests and version markers
    Compact, // YYYY-MM-DD.HHMM, used in file names
};

// Parses `text` exactly; invalid calendar values yield nullopt.
std::optional<Timestamp> ParseTimestamp(std::string_view text, TimestampFormat format);

// Finds the first Colon-form timestamp in `text`, else the first Compact-form one.
std::optional<Timestamp> ExtractTimestamp(std::string_view text);

} // namespace swi
