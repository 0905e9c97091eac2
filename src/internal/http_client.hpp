// Minimal JSON-over-HTTP POST used by the chat backends

#pragma once

#include <string>
#include <vector>

namespace toolrelay::http
{

struct Response
{
    long status_code = 0;
    std::string body;
};

/// Join a base URL and a path, tolerating duplicate or missing slashes
std::string join_url(const std::string& base_url, const std::string& path);

/// POST body to url with the given header lines ("Name: value").
/// @param timeout_ms Whole-request timeout; 0 disables it
/// @throws ModelError on transport failures (HTTP error statuses are returned)
Response post_json(const std::string& url, const std::vector<std::string>& headers,
                   const std::string& body, int timeout_ms);

} // namespace toolrelay::http
