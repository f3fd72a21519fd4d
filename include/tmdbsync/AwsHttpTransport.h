/**
 * AwsHttpTransport.h - HttpTransport over the AWS SDK HTTP client
 */

#pragma once

#include <memory>
#include <aws/core/http/HttpClient.h>
#include "tmdbsync/HttpTransport.h"

class AwsHttpTransport : public HttpTransport {
public:
    // `client` usually comes from HttpRuntime::instance().get_http_client()
    explicit AwsHttpTransport(std::shared_ptr<Aws::Http::HttpClient> client);

    HttpGetResponse get(const HttpGetRequest& request) override;

private:
    std::shared_ptr<Aws::Http::HttpClient> client_;
};
