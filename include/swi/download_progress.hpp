#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <string>

namespace swi {

// Single-line download progress on a terminal: a percentage when the size is
// known, a spinner otherwise. Silent when the stream is not a terminal.
class DownloadProgress {
  public:
    static constexpr std::chrono::milliseconds kMinInterval{250};

    DownloadProgress(std::string label, bool enabled, std::FILE* out = stderr);
    ~DownloadProgress();
    DownloadProgress(const DownloadProgress&) = delete;
    DownloadProgress& operator=(const DownloadProgress&) = delete;

    void Update(std::uint64_t done, std::uint64_t total);
    void Finish();

    bool Active() const { return active_; }

    static std::string FormatLine(const std::string& label,
                                  std::uint64_t done,
                                  std::uint64_t total,
                                  unsigned spinner_step);

  private:
    std::string label_;
    std::FILE* out_;
    bool active_;
    unsigned spinner_step_ = 0;
    std::uint64_t last_done_ = 0;
    std::uint64_t last_total_ = 0;
    std::chrono::steady_clock::time_point last_draw_{};
};

bool IsProgressLineActive();
void ClearProgressLine();

} // namespace swi
