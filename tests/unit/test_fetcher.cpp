#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <gtest/gtest.h>
#include <memory>
#include <vector>
#include "../../src/core/logger/logger.hpp"
#include "../../src/network/fetch/client_fetcher.hpp"

using namespace Harvester;
using namespace Harvester::Network;
using namespace Harvester::Network::Fetch;
using Proxy::Pool::ProxyLease;
namespace net = boost::asio;

namespace {

struct ClientSettings {
    std::string proxy;
    std::string user_agent;
    std::string accept_language;
    std::string url;
};

class RecordingClient : public Http::HttpClient {
public:
    RecordingClient(std::shared_ptr<std::vector<ClientSettings>> log, Http::Response reply)
        : log_(std::move(log)), reply_(std::move(reply)) {
    }

    void set_proxy(const std::string& proxy) override {
        current_.proxy = proxy;
    }
    void set_user_agent(const std::string& user_agent) override {
        current_.user_agent = user_agent;
    }
    void set_accept_language(const std::string& language) override {
        current_.accept_language = language;
    }

    net::awaitable<Http::Response> get(const std::string& url) override {
        current_.url = url;
        log_->push_back(current_);
        co_return reply_;
    }

private:
    std::shared_ptr<std::vector<ClientSettings>> log_;
    Http::Response                               reply_;
    ClientSettings                               current_;
};

// Never answers until cancelled.
class StalledClient : public Http::HttpClient {
public:
    explicit StalledClient(std::shared_ptr<bool> cancelled) : cancelled_(std::move(cancelled)) {
    }

    void set_proxy(const std::string&) override {
    }

    net::awaitable<Http::Response> get(const std::string& url) override {
        net::steady_timer timer(co_await net::this_coro::executor);
        timer_ = &timer;
        timer.expires_after(std::chrono::hours(1));
        boost::system::error_code ec;
        co_await timer.async_wait(net::redirect_error(net::use_awaitable, ec));
        timer_ = nullptr;

        Http::Response response;
        response.effective_url = url;
        response.error         = "cancelled";
        response.error_type    = Http::ErrorType::Network;
        co_return response;
    }

    void cancel() override {
        *cancelled_ = true;
        if (timer_)
            timer_->cancel();
    }

private:
    std::shared_ptr<bool> cancelled_;
    net::steady_timer*    timer_ = nullptr;
};

Http::Response reply(long status, const std::string& body, Http::ErrorType error = Http::ErrorType::None) {
    Http::Response response;
    response.status_code = status;
    response.body        = body;
    response.error_type  = error;
    response.success     = error == Http::ErrorType::None && status >= 200 && status < 400;
    if (error != Http::ErrorType::None)
        response.error = "simulated";
    return response;
}

class FetcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        Core::Logger::set_level(Core::LOG_NONE);
        log_ = std::make_shared<std::vector<ClientSettings>>();
        config_.suggest_endpoint = "http://suggest.local/complete";
    }
    void TearDown() override {
        Core::Logger::set_level(Core::LOG_DEFAULT);
    }

    std::unique_ptr<ClientFetcher> fetcher_for(Http::Response response) {
        auto log = log_;
        return std::make_unique<ClientFetcher>(config_, [log, response](Engine::Purpose) {
            return std::make_unique<RecordingClient>(log, response);
        });
    }

    static FetchResult run(Fetcher& fetcher, const Engine::FetchTask& task, const ProxyLease& lease) {
        net::io_context ioc;
        FetchResult     result;
        net::co_spawn(
            ioc,
            [&]() -> net::awaitable<void> { result = co_await fetcher.fetch(task, lease); },
            [](std::exception_ptr e) {
                if (e)
                    std::rethrow_exception(e);
            });
        ioc.run();
        return result;
    }

    Engine::RunConfig                            config_;
    std::shared_ptr<std::vector<ClientSettings>> log_;
};

}  // namespace

TEST_F(FetcherTest, AcceptLanguageHeader) {
    EXPECT_EQ(ClientFetcher::accept_language("en", "us"), "en-US,en;q=0.9");
    EXPECT_EQ(ClientFetcher::accept_language("de", ""), "de");
}

TEST_F(FetcherTest, ConfiguresClientPerRequest) {
    auto fetcher = fetcher_for(reply(200, "[\"x\",[]]"));
    auto result  = run(*fetcher, Engine::FetchTask::suggest("cat food"), ProxyLease{"http://p1:8080"});

    EXPECT_TRUE(result.ok);
    EXPECT_EQ(result.proxy, "http://p1:8080");
    ASSERT_EQ(log_->size(), 1);
    const auto& sent = log_->front();
    EXPECT_EQ(sent.proxy, "http://p1:8080");
    EXPECT_EQ(sent.user_agent, config_.user_agent);
    EXPECT_EQ(sent.accept_language, "en-US,en;q=0.9");
    EXPECT_EQ(sent.url, "http://suggest.local/complete?client=chrome&hl=en&gl=us&q=cat+food");
}

TEST_F(FetcherTest, RotatesUserAgentsWhenUnset) {
    config_.user_agent = "";
    auto fetcher       = fetcher_for(reply(200, "ok"));
    auto task          = Engine::FetchTask::scrape("x");
    const auto& agents = Core::get_user_agents();

    task.sequence = 1;
    run(*fetcher, task, ProxyLease{});
    EXPECT_EQ(log_->back().user_agent, agents[1 % agents.size()]);
    EXPECT_EQ(log_->back().proxy, "");
}

TEST_F(FetcherTest, ClassifiesResponses) {
    auto task = Engine::FetchTask::scrape("x");

    EXPECT_EQ(run(*fetcher_for(reply(0, "", Http::ErrorType::Timeout)), task, {}).error, Core::ErrorKind::Timeout);
    EXPECT_EQ(run(*fetcher_for(reply(0, "", Http::ErrorType::Proxy)), task, {}).error, Core::ErrorKind::Network);
    EXPECT_EQ(run(*fetcher_for(reply(429, "")), task, {}).error, Core::ErrorKind::Blocked);
    EXPECT_EQ(run(*fetcher_for(reply(200, "<div class=\"g-recaptcha\">")), task, {}).error,
              Core::ErrorKind::Blocked);

    auto server_error = run(*fetcher_for(reply(503, "unavailable")), task, {});
    EXPECT_FALSE(server_error.ok);
    EXPECT_EQ(server_error.error, Core::ErrorKind::Network);
    EXPECT_EQ(server_error.message, "HTTP 503");

    auto fine = run(*fetcher_for(reply(200, "<html></html>")), task, {});
    EXPECT_TRUE(fine.ok);
    EXPECT_EQ(fine.body, "<html></html>");
    EXPECT_EQ(fine.proxy, "direct");
}

TEST_F(FetcherTest, ReportsOneOutcomeToThePool) {
    Proxy::Pool::PoolOptions options;
    options.quarantine_threshold = 2;
    Proxy::Pool::ProxyPool pool({"http://p1"}, options);
    auto                   task = Engine::FetchTask::scrape("x");

    auto ok = fetcher_for(reply(200, "fine"));
    ok->bind_pool(&pool);
    run(*ok, task, ProxyLease{"http://p1"});
    EXPECT_EQ(pool.find("http://p1")->successes, 1);

    // A 500 from the origin still travelled through the proxy.
    auto http_error = fetcher_for(reply(500, ""));
    http_error->bind_pool(&pool);
    run(*http_error, task, ProxyLease{"http://p1"});
    EXPECT_EQ(pool.find("http://p1")->consecutive_failures, 0);
    EXPECT_EQ(pool.find("http://p1")->successes, 2);

    auto bad_gateway = fetcher_for(reply(502, "Bad Gateway"));
    bad_gateway->bind_pool(&pool);
    run(*bad_gateway, task, ProxyLease{"http://p1"});
    EXPECT_EQ(pool.find("http://p1")->consecutive_failures, 1);
    EXPECT_EQ(pool.find("http://p1")->successes, 2);

    auto fine_again = fetcher_for(reply(200, "fine"));
    fine_again->bind_pool(&pool);
    run(*fine_again, task, ProxyLease{"http://p1"});
    EXPECT_EQ(pool.find("http://p1")->consecutive_failures, 0);

    auto timeout = fetcher_for(reply(0, "", Http::ErrorType::Timeout));
    timeout->bind_pool(&pool);
    EXPECT_FALSE(run(*timeout, task, ProxyLease{"http://p1"}).proxy_quarantined);
    EXPECT_TRUE(run(*timeout, task, ProxyLease{"http://p1"}).proxy_quarantined);
    EXPECT_TRUE(pool.is_quarantined("http://p1"));
}

TEST_F(FetcherTest, ProxyGeneratedStatusesQuarantine) {
    Proxy::Pool::PoolOptions options;
    options.quarantine_threshold = 2;
    Proxy::Pool::ProxyPool pool({"http://p1", "http://p2"}, options);
    auto                   task = Engine::FetchTask::scrape("x");

    auto unauthorised = fetcher_for(reply(407, "Proxy Authentication Required"));
    unauthorised->bind_pool(&pool);
    EXPECT_FALSE(run(*unauthorised, task, ProxyLease{"http://p1"}).proxy_quarantined);
    EXPECT_TRUE(run(*unauthorised, task, ProxyLease{"http://p1"}).proxy_quarantined);

    EXPECT_TRUE(Fetcher::is_proxy_failure(0));
    EXPECT_TRUE(Fetcher::is_proxy_failure(504));
    EXPECT_FALSE(Fetcher::is_proxy_failure(404));
    EXPECT_FALSE(Fetcher::is_proxy_failure(500));
}

TEST_F(FetcherTest, StalledClientHitsTheDeadline) {
    config_.request_timeout_ms = 200;
    auto          cancelled    = std::make_shared<bool>(false);
    ClientFetcher fetcher(config_, [cancelled](Engine::Purpose) { return std::make_unique<StalledClient>(cancelled); });

    auto start   = std::chrono::steady_clock::now();
    auto result  = run(fetcher, Engine::FetchTask::suggest("cat"), ProxyLease{});
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, Core::ErrorKind::Timeout);
    EXPECT_TRUE(*cancelled);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST_F(FetcherTest, SilentSocksProxyTimesOut) {
    // The kernel completes the connect from the listen backlog; nothing ever replies.
    net::io_context        listener_context;
    net::ip::tcp::acceptor silent(listener_context, {net::ip::address_v4::loopback(), 0});
    std::string proxy = "socks5://127.0.0.1:" + std::to_string(silent.local_endpoint().port());

    config_.suggest_endpoint   = "http://suggest.local/complete";
    config_.connect_timeout_ms = 200;
    config_.request_timeout_ms = 300;
    Proxy::Pool::ProxyPool pool({proxy}, Proxy::Pool::PoolOptions{});
    ClientFetcher          fetcher(config_);
    fetcher.bind_pool(&pool);

    auto start   = std::chrono::steady_clock::now();
    auto result  = run(fetcher, Engine::FetchTask::suggest("cat"), ProxyLease{proxy});
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, Core::ErrorKind::Timeout);
    EXPECT_LT(elapsed, std::chrono::seconds(3));
    EXPECT_EQ(pool.find(proxy)->consecutive_failures, 1);
}

TEST_F(FetcherTest, DirectLeaseIsNotReported) {
    Proxy::Pool::ProxyPool pool({"http://p1"}, Proxy::Pool::PoolOptions{});
    auto                   blocked = fetcher_for(reply(429, ""));
    blocked->bind_pool(&pool);
    auto result = run(*blocked, Engine::FetchTask::scrape("x"), ProxyLease{});
    EXPECT_EQ(result.error, Core::ErrorKind::Blocked);
    EXPECT_FALSE(result.proxy_quarantined);
    EXPECT_FALSE(pool.is_quarantined("http://p1"));
}
