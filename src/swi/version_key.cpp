#include "swi/version_key.hpp"

#include <cctype>
#include <string>

namespace swi {

namespace {

constexpr std::string_view kColonPattern = "dddd-dd-dd.dd:dd";
constexpr std::string_view kCompactPattern = "dddd-dd-dd.dddd";

std::string_view PatternFor(TimestampFormat format) {
    return format == TimestampFormat::Colon ? kColonPattern : kCompactPattern;
}

bool MatchesAt(std::string_view text, size_t pos, std::string_view pattern) {
    if (text.size() - pos < pattern.size()) return false;
    for (size_t i = 0; i < pattern.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(text[pos + i]);
        if (pattern[i] == 'd') {
            if (!std::isdigit(c)) return false;
        } else if (c != static_cast<unsigned char>(pattern[i])) {
            return false;
        }
    }
    return true;
}

int Digits(std::string_view s, size_t pos, size_t n) {
    int v = 0;
    for (size_t i = 0; i < n; ++i) v = v * 10 + (s[pos + i] - '0');
    return v;
}

} // namespace

std::optional<Timestamp> ParseTimestamp(std::string_view text, TimestampFormat format) {
    const std::string_view pattern = PatternFor(format);
    if (text.size() != pattern.size() || !MatchesAt(text, 0, pattern)) return std::nullopt;

    using namespace std::chrono;
    const year_month_day ymd{year{Digits(text, 0, 4)},
                             month{static_cast<unsigned>(Digits(text, 5, 2))},
                             day{static_cast<unsigned>(Digits(text, 8, 2))}};
    if (!ymd.ok()) return std::nullopt;

    const int hh = Digits(text, 11, 2);
    const int mm = format == TimestampFormat::Colon ? Digits(text, 14, 2) : Digits(text, 13, 2);
    if (hh > 23 || mm > 59) return std::nullopt;

    return Timestamp{sys_days{ymd}} + hours{hh} + minutes{mm};
}

std::optional<Timestamp> ExtractTimestamp(std::string_view text) {
    for (TimestampFormat format : {TimestampFormat::Colon, TimestampFormat::Compact}) {
        const std::string_view pattern = PatternFor(format);
        for (size_t pos = 0; pos + pattern.size() <= text.size(); ++pos) {
            if (MatchesAt(text, pos, pattern)) {
                return ParseTimestamp(text.substr(pos, pattern.size()), format);
            }
        }
    }
    return std::nullopt;
}

} // namespace swi
