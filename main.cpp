#include <chrono>
#include <csignal>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <elio/elio.hpp>
#include <elio/time/timer.hpp>

#include "xferq/base/config.h"
#include "xferq/base/logger.h"
#include "xferq/control/record_store.h"
#include "xferq/control/transfer_controller.h"
#include "xferq/queue/download_queue_manager.h"
#include "xferq/transport/simulated_transport.h"

using namespace xferq;

static volatile std::sig_atomic_t g_running = 1;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = 0;
    }
}

class XferqApplication {
public:
    ~XferqApplication() {
        if (downloads_) downloads_->dispose();
        if (controller_) controller_->shutdown();
    }

    bool initialize(int argc, char* argv[]) {
        Config::instance().load_from_env();
        if (!Config::instance().parse_command_line(argc, argv)) {
            return false;
        }
        if (!Config::instance().validate()) {
            exit_code_ = 2;
            return false;
        }

        urls_ = Config::instance().positional();
        if (urls_.empty()) {
            std::cerr << "No URLs given; see --help" << std::endl;
            exit_code_ = 2;
            return false;
        }

        const auto& config = Config::instance().get();
        Config::instance().print();

        transport_ = std::make_shared<SimulatedTransport>(config.simulation);
        controller_ = std::make_shared<TransferController>(
            transport_, make_record_store(config.controller.record_store_path), config.controller);
        controller_->initialize();

        downloads_ = std::make_unique<DownloadQueueManager>(
            controller_, QueueOptions::from_config(config.queue),
            [this](std::chrono::milliseconds delay, std::function<void()> callback) {
                auto now = std::chrono::steady_clock::now();
                auto room = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::time_point::max() - now);
                auto due = delay < room ? now + delay : std::chrono::steady_clock::time_point::max();
                timers_.push_back({due, std::move(callback)});
            },
            config.transfer);

        updates_ = controller_->item_updates().listen([this](const TransferItem& item) { report(item); });

        Logger::instance().info("xferq initialized, {} URL(s) to fetch", urls_.size());
        return true;
    }

    int run() {
        const auto tick = std::chrono::milliseconds(Config::instance().get().simulation.tick_ms);

        downloads_->add_urls(urls_);
        downloads_->wait_for_all([this](std::vector<QueueResult> results) {
            results_ = std::move(results);
            finished_ = true;
        });

        elio::run([this, tick]() -> elio::coro::task<void> {
            while (!finished_) {
                if (!g_running && !interrupted_) {
                    interrupted_ = true;
                    Logger::instance().warning("Interrupted, cancelling all transfers");
                    downloads_->cancel_all();
                }
                transport_->tick();
                run_due_timers();
                co_await elio::time::sleep_for(tick);
            }
            co_return;
        }());

        return summarize();
    }

    int exit_code() const { return exit_code_; }

private:
    struct Timer {
        std::chrono::steady_clock::time_point due;
        std::function<void()> callback;
    };

    void run_due_timers() {
        auto now = std::chrono::steady_clock::now();
        std::vector<std::function<void()>> due;
        for (auto it = timers_.begin(); it != timers_.end();) {
            if (it->due <= now) {
                due.push_back(std::move(it->callback));
                it = timers_.erase(it);
            } else {
                ++it;
            }
        }
        for (auto& callback : due) {
            callback();
        }
    }

    void report(const TransferItem& item) {
        auto progress = item.to_progress();
        if (item.is_final() || item.status != last_status_[item.key()]) {
            Logger::instance().info("{} [{}] {} / {}", item.key(), to_string(item.status),
                                    progress.bytes_transferred_text(), progress.total_bytes_text());
        } else {
            Logger::instance().debug("{} {} at {}, eta {}", item.key(), progress.progress_text(),
                                     progress.speed_text(), progress.eta_text());
        }
        last_status_[item.key()] = item.status;
    }

    int summarize() {
        size_t failures = 0;
        for (const auto& result : results_) {
            if (auto* ok = std::get_if<TransferSuccess>(&result.result)) {
                Logger::instance().info("OK      {} -> {}", result.transfer_id, ok->local_path);
            } else if (auto* failed = std::get_if<TransferFailure>(&result.result)) {
                ++failures;
                Logger::instance().error("FAILED  {}: {}", result.transfer_id, failed->message);
            } else {
                ++failures;
                Logger::instance().warning("CANCEL  {}", result.transfer_id);
            }
        }
        Logger::instance().info("{} of {} transfer(s) succeeded", results_.size() - failures, results_.size());
        return failures == 0 ? 0 : 1;
    }

    std::vector<std::string> urls_;
    std::shared_ptr<SimulatedTransport> transport_;
    std::shared_ptr<TransferController> controller_;
    std::unique_ptr<DownloadQueueManager> downloads_;
    Subscription updates_;
    std::vector<Timer> timers_;
    std::map<std::string, TaskStatus> last_status_;
    std::vector<QueueResult> results_;
    bool finished_ = false;
    bool interrupted_ = false;
    int exit_code_ = 0;
};

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        XferqApplication app;
        if (!app.initialize(argc, argv)) {
            return app.exit_code() != 0 ? app.exit_code() : Config::instance().exit_code();
        }
        return app.run();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
