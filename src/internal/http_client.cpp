#include "http_client.hpp"

#include "toolrelay/exceptions.hpp"

#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace toolrelay::http
{

namespace
{

size_t write_to_string(void* ptr, size_t size, size_t nmemb, void* userdata)
{
    size_t total = size * nmemb;
    auto* out = static_cast<std::string*>(userdata);
    out->append(static_cast<const char*>(ptr), total);
    return total;
}

void ensure_curl_initialized()
{
    static std::once_flag flag;
    std::call_once(flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct CurlDeleter
{
    void operator()(CURL* c) const
    {
        curl_easy_cleanup(c);
    }
};

struct SlistDeleter
{
    void operator()(curl_slist* l) const
    {
        curl_slist_free_all(l);
    }
};

} // namespace

std::string join_url(const std::string& base_url, const std::string& path)
{
    std::string base = base_url;
    while (!base.empty() && base.back() == '/')
        base.pop_back();
    if (path.empty())
        return base;
    if (path.front() == '/')
        return base + path;
    return base + "/" + path;
}

Response post_json(const std::string& url, const std::vector<std::string>& headers,
                   const std::string& body, int timeout_ms)
{
    ensure_curl_initialized();

    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl)
        throw ModelError("curl_easy_init failed");

    curl_slist* raw_headers = nullptr;
    for (const auto& h : headers)
        raw_headers = curl_slist_append(raw_headers, h.c_str());
    std::unique_ptr<curl_slist, SlistDeleter> hdrs(raw_headers);

    Response response;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, hdrs.get());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &write_to_string);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms > 0 ? timeout_ms : 0));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK)
        throw ModelError("POST " + url + " failed: " + curl_easy_strerror(rc));

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status_code);
    return response;
}

} // namespace toolrelay::http
