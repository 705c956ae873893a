#include "http_client.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <stdexcept>

CurlHttpClient::CurlHttpClient() {
    curl_version_info_data* info = curl_version_info(CURLVERSION_NOW);
    if (!info) {
        throw std::runtime_error("Failed to query CURL version");
    }
    spdlog::debug("Using libcurl {}", info->version);
}

CurlHttpClient::~CurlHttpClient() = default;

size_t CurlHttpClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

int CurlHttpClient::progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* cancelled = static_cast<std::atomic<bool>*>(clientp);
    // Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK
    return cancelled->load() ? 1 : 0;
}

void CurlHttpClient::cancel_all() {
    cancelled_ = true;
}

void CurlHttpClient::reset_cancel() {
    cancelled_ = false;
}

HttpResponse CurlHttpClient::perform(const std::string& url, const std::string* body, int timeout_ms) {
    HttpResponse response;

    if (cancelled_) {
        response.error = "Transfer cancelled";
        return response;
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        response.error = "Failed to initialize CURL";
        return response;
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &cancelled_);

    struct curl_slist* headers = NULL;
    if (body) {
        headers = curl_slist_append(headers, "Content-Type: application/json");
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    }

    auto started = std::chrono::steady_clock::now();
    CURLcode res = curl_easy_perform(curl);
    response.elapsed_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - started).count();

    if (res == CURLE_OK) {
        response.transport_ok = true;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    } else {
        response.timed_out = (res == CURLE_OPERATION_TIMEDOUT);
        response.error = curl_easy_strerror(res);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    return response;
}

HttpResponse CurlHttpClient::post_json(const std::string& url, const std::string& body, int timeout_ms) {
    return perform(url, &body, timeout_ms);
}

HttpResponse CurlHttpClient::get(const std::string& url, int timeout_ms) {
    return perform(url, nullptr, timeout_ms);
}
