#include "swi/download_progress.hpp"

#include <unistd.h>
#include <utility>

namespace swi {

namespace {
std::FILE* g_progress_stream = nullptr;
} // namespace

DownloadProgress::DownloadProgress(std::string label, bool enabled, std::FILE* out)
    : label_(std::move(label)), out_(out),
      active_(enabled && out != nullptr && ::isatty(::fileno(out)) == 1) {}

DownloadProgress::~DownloadProgress() { Finish(); }

std::string DownloadProgress::FormatLine(const std::string& label,
                                         std::uint64_t done,
                                         std::uint64_t total,
                                         unsigned spinner_step) {
    static constexpr char kSpinner[] = {'|', '/', '-', '\\'};
    char buf[128];
    if (total > 0) {
        std::uint64_t pct = (done * 100ULL) / total;
        if (pct > 100) pct = 100;
        std::snprintf(buf, sizeof(buf), " %3d%% (%llu/%llu bytes)",
                      static_cast<int>(pct),
                      static_cast<unsigned long long>(done),
                      static_cast<unsigned long long>(total));
    } else {
        std::snprintf(buf, sizeof(buf), " %c %llu bytes",
                      kSpinner[spinner_step % 4],
                      static_cast<unsigned long long>(done));
    }
    return "[" + label + "]" + buf;
}

void DownloadProgress::Update(std::uint64_t done, std::uint64_t total) {
    if (!active_) return;
    last_done_ = done;
    last_total_ = total;

    const auto now = std::chrono::steady_clock::now();
    if (last_draw_ != std::chrono::steady_clock::time_point{} && now - last_draw_ < kMinInterval) {
        return;
    }
    last_draw_ = now;

    const std::string line = FormatLine(label_, done, total, spinner_step_++);
    std::fprintf(out_, "\r%s", line.c_str());
    std::fflush(out_);
    g_progress_stream = out_;
}

void DownloadProgress::Finish() {
    if (!active_) return;
    if (last_draw_ != std::chrono::steady_clock::time_point{}) {
        const std::string line = FormatLine(label_, last_done_, last_total_, spinner_step_);
        std::fprintf(out_, "\r%s\n", line.c_str());
        std::fflush(out_);
    }
    if (g_progress_stream == out_) g_progress_stream = nullptr;
    active_ = false;
}

bool IsProgressLineActive() { return g_progress_stream != nullptr; }

void ClearProgressLine() {
    if (g_progress_stream) {
        std::fprintf(g_progress_stream, "\n");
        g_progress_stream = nullptr;
    }
}

} // namespace swi
