#include "utils/http_client.hpp"

namespace courier::utils {

std::string ParsedUrl::SchemeHostPort() const {
    return std::string(https ? "https://" : "http://") + host + ":" + std::to_string(port);
}

ParsedUrl ParseUrl(const std::string& url) {
    ParsedUrl parsed{};
    std::string working = url;
    if (working.rfind("https://", 0) == 0) {
        parsed.https = true;
        working = working.substr(8);
    } else if (working.rfind("http://", 0) == 0) {
        parsed.https = false;
        parsed.port = 80;
        working = working.substr(7);
    }

    const auto slash_pos = working.find('/');
    std::string host_port = working;
    if (slash_pos != std::string::npos) {
        host_port = working.substr(0, slash_pos);
        parsed.base_path = working.substr(slash_pos);
    }

    const auto colon_pos = host_port.find(':');
    if (colon_pos != std::string::npos) {
        parsed.host = host_port.substr(0, colon_pos);
        try {
            parsed.port = std::stoi(host_port.substr(colon_pos + 1));
        } catch (const std::exception&) {
            // keep the scheme default
        }
    } else {
        parsed.host = host_port;
    }

    if (!parsed.base_path.empty() && parsed.base_path.back() == '/') {
        parsed.base_path.pop_back();
    }

    return parsed;
}

std::unique_ptr<httplib::Client> MakeHttpClient(const ParsedUrl& url, int timeout_s) {
    auto client = std::make_unique<httplib::Client>(url.SchemeHostPort());
    client->set_connection_timeout(timeout_s);
    client->set_read_timeout(timeout_s);
    client->set_write_timeout(timeout_s);
    return client;
}

std::string HttpErrorToString(httplib::Error error) {
    return httplib::to_string(error);
}

bool IsRetryableHttpStatus(int status) {
    return status == 408 || status == 429 || status >= 500;
}

}  // namespace courier::utils
