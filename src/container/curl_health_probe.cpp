#include <examforge/container/health_probe.hpp>
#include <examforge/logging.hpp>

#include <curl/curl.h>
#include <gsl/util>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>

namespace examforge {

namespace {

std::size_t discard_body(char* /*ptr*/, std::size_t size, std::size_t nmemb, void* /*userdata*/) {
    return size * nmemb;
}

} // namespace

CurlHealthProbe::CurlHealthProbe() {
    // curl_global_init is not thread safe; it only needs to happen once per process
    static std::once_flag curl_initialized;
    std::call_once(curl_initialized, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

bool CurlHealthProbe::check(const std::string& url, std::chrono::milliseconds timeout) {
    CURL* curl = curl_easy_init();
    if (curl == nullptr) {
        LOG_WARN("curl_easy_init failed");
        return false;
    }
    auto cleanup = gsl::finally([curl] { curl_easy_cleanup(curl); });

    // curl treats a timeout of 0 as "no timeout"
    const long timeout_ms = std::max<long>(gsl::narrow_cast<long>(timeout.count()), 1L);

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, discard_body);

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        LOG_TRACE("Health check of {} failed: {}", url, curl_easy_strerror(res));
        return false;
    }

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    LOG_TRACE("Health check of {} returned HTTP {}", url, status);

    return status == 200;
}

} // namespace examforge
