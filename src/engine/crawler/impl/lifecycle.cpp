#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include "../../../core/logger/logger.hpp"
#include "../crawler.hpp"

namespace Spoor {
namespace Engine {

Crawler::~Crawler() {
    shutdown();
}

void Crawler::init_io_services() {
    if (ioc_.stopped())
        ioc_.restart();
    work_guard_ =
        std::make_unique<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
            ioc_.get_executor());
    for (int i = 0; i < config_.threads; ++i) {
        io_threads_.emplace_back([this]() {
            try {
                ioc_.run();
            } catch (const std::exception& e) {
                Logger::error("IO Thread Exception: " + std::string(e.what()));
            }
        });
    }
    Logger::info("Started " + std::to_string(config_.threads) + " IO threads, "
                 + std::to_string(config_.workers) + " workers.");
}

void Crawler::init_signals() {
    if (!config_.handle_signals)
        return;

    signals_.add(SIGINT);
    signals_.add(SIGTERM);
    signals_.async_wait([this](const boost::system::error_code& error, int signal_number) {
        if (!error) {
            Logger::info("Signal " + std::to_string(signal_number) + " received. Stopping...");
            cancel();
        }
    });
}

void Crawler::spawn_workers() {
    live_workers_ = config_.workers;
    for (int i = 0; i < config_.workers; ++i) {
        boost::asio::co_spawn(ioc_, worker_loop(), boost::asio::detached);
    }
}

void Crawler::await_completion() {
    std::unique_lock<std::mutex> lock(done_mutex_);
    done_cv_.wait(lock, [this] { return done_.load(); });
}

void Crawler::trigger_done() {
    {
        std::lock_guard<std::mutex> lock(done_mutex_);
        done_ = true;
    }
    done_cv_.notify_all();
}

void Crawler::worker_exited() {
    if (live_workers_.fetch_sub(1) == 1)
        trigger_done();
}

void Crawler::shutdown() {
    if (is_shutdown_.exchange(true))
        return;
    if (io_threads_.empty())
        return;

    boost::system::error_code ec;
    signals_.cancel(ec);
    work_guard_.reset();
    ioc_.stop();

    for (auto& t : io_threads_) {
        if (t.get_id() == std::this_thread::get_id())
            continue;
        if (t.joinable())
            t.join();
    }
    io_threads_.clear();
    Logger::info("Crawler: Shutdown complete.");
}

}  // namespace Engine
}  // namespace Spoor
