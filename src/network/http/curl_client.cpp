#include "curl_client.hpp"
#include <algorithm>
#include <cctype>
#include <string_view>
#include "../../core/types/constants.hpp"

namespace Harvester {
namespace Network {
namespace Http {

namespace {

constexpr std::string_view CONTENT_TYPE_HEADER = "content-type:";

std::string_view trim_view(std::string_view s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos)
        return {};
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

bool istarts_with(std::string_view text, std::string_view prefix) {
    if (text.size() < prefix.size())
        return false;
    return std::equal(prefix.begin(), prefix.end(), text.begin(), [](char c1, char c2) {
        return std::tolower(static_cast<unsigned char>(c1))
            == std::tolower(static_cast<unsigned char>(c2));
    });
}

ErrorType map_curl_code(CURLcode code) {
    switch (code) {
        case CURLE_COULDNT_RESOLVE_PROXY: return ErrorType::Proxy;
        case CURLE_OPERATION_TIMEDOUT: return ErrorType::Timeout;
        default: return ErrorType::Network;
    }
}

}  // namespace

size_t CurlClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* ctx = static_cast<RequestContext*>(userp);
    if (!ctx || !ctx->body)
        return 0;
    size_t total = size * nmemb;
    ctx->body->append(static_cast<const char*>(contents), total);
    return total;
}

size_t CurlClient::header_callback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto*            ctx = static_cast<RequestContext*>(userp);
    std::string_view header(buffer, size * nitems);
    if (ctx && ctx->content_type && istarts_with(header, CONTENT_TYPE_HEADER))
        *ctx->content_type = std::string(trim_view(header.substr(CONTENT_TYPE_HEADER.size())));
    return size * nitems;
}

CurlClient::CurlClient() : curl_(curl_easy_init()), user_agent_(Core::Constants::USER_AGENT) {
}

void CurlClient::set_proxy(const std::string& proxy) {
    proxy_ = proxy;
}

void CurlClient::set_timeout(std::chrono::milliseconds timeout) {
    timeout_ = timeout;
}

void CurlClient::set_user_agent(const std::string& user_agent) {
    user_agent_ = user_agent;
}

Response CurlClient::create_error_response(const std::string& msg) const {
    Response r;
    r.error      = msg;
    r.error_type = ErrorType::Network;
    return r;
}

Response CurlClient::perform(const Request& req) {
    if (!curl_)
        return create_error_response("Failed to initialize CURL handle");

    std::string    body;
    std::string    content_type;
    RequestContext ctx{&body, &content_type};
    CURL*          curl = curl_.get();

    curl_easy_reset(curl);
    curl_easy_setopt(curl, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, req.follow_location ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(req.timeout.count()));
    if (!req.user_agent.empty())
        curl_easy_setopt(curl, CURLOPT_USERAGENT, req.user_agent.c_str());
    if (req.method == HttpMethod::HEAD)
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    else
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    if (!proxy_.empty())
        curl_easy_setopt(curl, CURLOPT_PROXY, proxy_.c_str());

    curl_slist* raw = nullptr;
    for (const auto& h : req.extra_headers)
        raw = curl_slist_append(raw, h.c_str());
    std::unique_ptr<curl_slist, SlistDeleter> headers(raw);
    if (raw)
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, raw);

    CURLcode code = curl_easy_perform(curl);

    Response response;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    char* effective = nullptr;
    curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effective);
    response.effective_url = effective ? std::string(effective) : req.url;
    response.content_type  = content_type;

    if (code != CURLE_OK) {
        response.error       = curl_easy_strerror(code);
        response.error_type  = map_curl_code(code);
        response.status_code = 0;
        return response;
    }

    response.body    = std::move(body);
    response.success = response.status_code >= 200 && response.status_code < 400;
    if (!response.success)
        response.error = "HTTP " + std::to_string(response.status_code);
    return response;
}

Response CurlClient::get(const std::string& url) {
    Request req;
    req.url        = url;
    req.timeout    = timeout_;
    req.user_agent = user_agent_;
    return perform(req);
}

Response CurlClient::head(const std::string& url) {
    Request req;
    req.method     = HttpMethod::HEAD;
    req.url        = url;
    req.timeout    = std::min(timeout_, std::chrono::milliseconds(5000));
    req.user_agent = user_agent_;
    return perform(req);
}

}  // namespace Http
}  // namespace Network
}  // namespace Harvester
