#pragma once

#include "swi/download_progress.hpp"
#include "util/result.hpp"

#include <string>

namespace swi {

// libcurl transfer of any URL curl understands (http, https, ftp, file).
class CurlDownloader {
  public:
    Result Fetch(const std::string& url, int out_fd, DownloadProgress* progress) const;
};

} // namespace swi
