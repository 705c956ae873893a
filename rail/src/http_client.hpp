#pragma once

#include <string>
#include <atomic>
#include <curl/curl.h>

struct HttpResponse {
    bool transport_ok = false;
    bool timed_out = false;
    long status = 0;
    std::string body;
    std::string error;
    double elapsed_ms = 0.0;
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse post_json(const std::string& url, const std::string& body, int timeout_ms) = 0;
    virtual HttpResponse get(const std::string& url, int timeout_ms) = 0;
};

// One easy handle per request so probes can run from several threads at once.
class CurlHttpClient : public HttpClient {
public:
    CurlHttpClient();
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse post_json(const std::string& url, const std::string& body, int timeout_ms) override;
    HttpResponse get(const std::string& url, int timeout_ms) override;

    // Aborts in-flight transfers and fails new ones until reset_cancel()
    void cancel_all();
    void reset_cancel();

private:
    std::atomic<bool> cancelled_{false};

    HttpResponse perform(const std::string& url, const std::string* body, int timeout_ms);

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
    static int progress_callback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                                 curl_off_t ultotal, curl_off_t ulnow);
};
