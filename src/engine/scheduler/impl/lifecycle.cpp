#include <csignal>
#include "../../../core/logger/logger.hpp"
#include "../scheduler.hpp"

namespace Harvester {
namespace Engine {

using namespace Harvester::Core;

void Scheduler::init_io_services() {
    if (ioc_.stopped())
        ioc_.restart();
    work_guard_ =
        std::make_unique<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
            ioc_.get_executor());
    for (int i = 0; i < io_thread_count_; ++i) {
        io_threads_.emplace_back([this]() {
            try {
                ioc_.run();
            } catch (const std::exception& e) {
                Logger::error("IO thread exception: " + std::string(e.what()));
            }
        });
    }
}

void Scheduler::init_signals() {
    signals_.clear();
    signals_.add(SIGINT);
    signals_.add(SIGTERM);
    signals_.async_wait([this](const boost::system::error_code& error, int signal_number) {
        if (!error)
            request_stop("signal " + std::to_string(signal_number));
    });
}

void Scheduler::spawn_workers() {
    live_workers_ = max_concurrency_;
    for (int i = 0; i < max_concurrency_; ++i)
        boost::asio::co_spawn(ioc_, worker_loop(i), boost::asio::detached);
}

void Scheduler::await_completion() {
    std::unique_lock<std::mutex> lock(done_mutex_);
    done_cv_.wait(lock, [this] { return done_.load(); });
}

void Scheduler::trigger_done() {
    {
        std::lock_guard<std::mutex> lock(done_mutex_);
        done_ = true;
    }
    done_cv_.notify_all();
}

void Scheduler::shutdown() {
    boost::system::error_code ec;
    signals_.cancel(ec);
    signals_.clear(ec);

    work_guard_.reset();
    ioc_.stop();

    for (auto& t : io_threads_) {
        if (t.get_id() == std::this_thread::get_id())
            continue;
        if (t.joinable())
            t.join();
    }
    io_threads_.clear();
}

}  // namespace Engine
}  // namespace Harvester
