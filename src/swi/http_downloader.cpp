#include "swi/http_downloader.hpp"

#include "io/fd.hpp"
#include "util/logger.hpp"

#include <curl/curl.h>
#include <memory>
#include <span>
#include <string>

namespace swi {

namespace {

struct CurlEasyDeleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
};
using CurlPtr = std::unique_ptr<CURL, CurlEasyDeleter>;

struct TransferState {
    int fd = -1;
    Result write_result = Result::Ok();
    DownloadProgress* progress = nullptr;
};

size_t WriteToFd(char* data, size_t size, size_t nmemb, void* userp) {
    auto* state = static_cast<TransferState*>(userp);
    const size_t total = size * nmemb;
    state->write_result = WriteAll(state->fd, std::span<const char>(data, total));
    if (!state->write_result.is_ok())
        return 0; // makes curl abort with CURLE_WRITE_ERROR
    return total;
}

int OnTransferInfo(void* userp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t, curl_off_t) {
    auto* state = static_cast<TransferState*>(userp);
    if (state->progress) {
        state->progress->Update(static_cast<std::uint64_t>(dlnow),
                                static_cast<std::uint64_t>(dltotal));
    }
    return 0;
}

} // namespace

Result CurlDownloader::Fetch(const std::string& url, int out_fd, DownloadProgress* progress) const {
    CurlPtr curl(curl_easy_init());
    if (!curl) {
        return Result::Fail(ErrorKind::TransportFailure, "curl_easy_init failed");
    }

    TransferState state;
    state.fd = out_fd;
    state.progress = progress;
    char errbuf[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteToFd);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, OnTransferInfo);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &state);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);

    LogDebug("fetch %s", url.c_str());
    const CURLcode rc = curl_easy_perform(curl.get());
    if (progress) progress->Finish();

    if (rc != CURLE_OK) {
        std::string why = errbuf[0] != '\0' ? errbuf : curl_easy_strerror(rc);
        if (!state.write_result.is_ok()) {
            why += " (" + state.write_result.msg + ")";
        }
        return Result::Fail(ErrorKind::TransportFailure, "download " + url + " failed: " + why,
                            static_cast<int>(rc));
    }

    return SyncFd(out_fd);
}

} // namespace swi
