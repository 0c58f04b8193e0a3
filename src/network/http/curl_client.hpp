#pragma once
#include <chrono>
#include <curl/curl.h>
#include <memory>
#include <string>
#include <vector>
#include "http_client.hpp"

namespace Harvester {
namespace Network {
namespace Http {

/**
 * @brief Blocking libcurl client for one-shot probes outside the engine.
 *
 * Not an HttpClient: it never runs on the io_context.
 */
class CurlClient {
public:
    enum class HttpMethod { GET, HEAD };

    CurlClient();
    ~CurlClient() = default;
    CurlClient(const CurlClient&)            = delete;
    CurlClient& operator=(const CurlClient&) = delete;

    void set_proxy(const std::string& proxy);
    void set_timeout(std::chrono::milliseconds timeout);
    void set_user_agent(const std::string& user_agent);

    Response get(const std::string& url);
    Response head(const std::string& url);

private:
    struct Request {
        HttpMethod                method = HttpMethod::GET;
        std::string               url;
        std::chrono::milliseconds timeout{10000};
        bool                      follow_location = true;
        std::vector<std::string>  extra_headers;
        std::string               user_agent;
    };

    struct RequestContext {
        std::string* body         = nullptr;
        std::string* content_type = nullptr;
    };

    struct CurlDeleter {
        void operator()(CURL* curl) const noexcept {
            if (curl)
                curl_easy_cleanup(curl);
        }
    };

    struct SlistDeleter {
        void operator()(curl_slist* list) const noexcept {
            curl_slist_free_all(list);
        }
    };

    std::unique_ptr<CURL, CurlDeleter> curl_;
    std::string                        proxy_;
    std::chrono::milliseconds          timeout_{10000};
    std::string                        user_agent_;

    Response perform(const Request& req);
    Response create_error_response(const std::string& msg) const;

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userp);
};

}  // namespace Http
}  // namespace Network
}  // namespace Harvester
