/**
 * AwsHttpTransport.cpp - Implementation
 */

#include "tmdbsync/AwsHttpTransport.h"
#include <sstream>
#include <stdexcept>
#include <aws/core/http/HttpClientFactory.h>
#include <aws/core/http/HttpRequest.h>
#include <aws/core/http/HttpResponse.h>
#include <aws/core/utils/StringUtils.h>
#include <aws/core/utils/stream/ResponseStream.h>

AwsHttpTransport::AwsHttpTransport(std::shared_ptr<Aws::Http::HttpClient> client)
    : client_(std::move(client)) {
    if (!client_) {
        throw std::invalid_argument("AwsHttpTransport requires an initialized HTTP client");
    }
}

HttpGetResponse AwsHttpTransport::get(const HttpGetRequest& request) {
    HttpGetResponse out;

    auto http_request = Aws::Http::CreateHttpRequest(
        Aws::String(request.url.c_str()),
        Aws::Http::HttpMethod::HTTP_GET,
        Aws::Utils::Stream::DefaultResponseStreamFactoryMethod
    );
    for (const auto& [name, value] : request.headers) {
        http_request->SetHeaderValue(Aws::String(name.c_str()), Aws::String(value.c_str()));
    }

    auto http_response = client_->MakeRequest(http_request);
    if (!http_response) {
        out.transport_error = "no response object";
        return out;
    }

    if (http_response->HasClientError()) {
        out.transport_error = http_response->GetClientErrorMessage().c_str();
        if (out.transport_error.empty()) out.transport_error = "transport failure";
        return out;
    }

    int code = static_cast<int>(http_response->GetResponseCode());
    if (code <= 0) {
        out.transport_error = "request not made";
        return out;
    }
    out.status = code;

    for (const auto& [name, value] : http_response->GetHeaders()) {
        out.headers[Aws::Utils::StringUtils::ToLower(name.c_str()).c_str()] = value.c_str();
    }

    std::ostringstream body;
    body << http_response->GetResponseBody().rdbuf();
    out.body = body.str();
    return out;
}
