/**
 * HttpTransport.h - Raw HTTP GET seam
 *
 * The request executor only needs status, a couple of headers and the body
 * of a single GET. Production uses the AWS SDK HTTP client
 * (AwsHttpTransport); tests script responses with a fake.
 */

#pragma once

#include <map>
#include <string>

struct HttpGetRequest {
    std::string url;
    std::map<std::string, std::string> headers;
};

struct HttpGetResponse {
    // 0 when the request never produced an HTTP status (DNS, connect,
    // timeout, reset); transport_error then describes the failure.
    int status = 0;
    std::string body;
    // Header names are lower-cased
    std::map<std::string, std::string> headers;
    std::string transport_error;

    bool has_status() const { return status > 0; }

    const std::string* header(const std::string& lower_name) const {
        auto it = headers.find(lower_name);
        return it == headers.end() ? nullptr : &it->second;
    }
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // Must be safe to call concurrently from many workers
    virtual HttpGetResponse get(const HttpGetRequest& request) = 0;
};
