#pragma once

#include <memory>
#include <string>

#include "httplib.h"

namespace courier::utils {

struct ParsedUrl {
    bool https = true;
    std::string host;
    int port = 443;
    std::string base_path;

    std::string SchemeHostPort() const;
};

ParsedUrl ParseUrl(const std::string& url);

// Client for the scheme, host and port of base_url with both connect and
// read timeouts set to timeout_s.
std::unique_ptr<httplib::Client> MakeHttpClient(const ParsedUrl& url, int timeout_s);

std::string HttpErrorToString(httplib::Error error);

// 408, 429 and 5xx are worth another attempt.
bool IsRetryableHttpStatus(int status);

}  // namespace courier::utils
