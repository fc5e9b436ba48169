#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>
#include "test_support.h"
#include "xferq/base/error_code.h"
#include "xferq/queue/download_queue_manager.h"
#include "xferq/queue/upload_queue_manager.h"
#include "xferq/transport/simulated_transport.h"

using namespace xferq;
using xferq::test::MockTransport;
using xferq::test::unverified_cache_config;

namespace {

QueueOptions two_slots() {
    QueueOptions options;
    options.max_concurrent = 2;
    return options;
}

struct Fixture {
    std::shared_ptr<MockTransport> transport = std::make_shared<MockTransport>();
    std::shared_ptr<TransferController> controller =
        std::make_shared<TransferController>(transport, std::make_shared<MemoryRecordStore>(),
                                             unverified_cache_config());
    DownloadQueueManager downloads{controller, two_slots()};
};

} // anonymous namespace

TEST_CASE("Download progress flows from transport items to the queue", "[download][progress]") {
    Fixture f;
    const std::string url = "https://example.com/data.csv";
    auto transfer = f.downloads.add_url(url);

    REQUIRE(transfer->id() == url);
    REQUIRE(transfer->metadata().at("task_id") == transfer->task().task_id);
    REQUIRE(transfer->task().directory == "downloads");
    REQUIRE(f.transport->count("enqueue") == 1);
    REQUIRE(transfer->is_running());

    f.transport->complete_next(true);

    std::vector<std::size_t> map_sizes;
    auto sub = f.downloads.progress_stream().listen(
        [&](const TransportQueueManager::ProgressMap& progress) { map_sizes.push_back(progress.size()); });

    f.transport->emit(transfer->task(), TaskStatus::running, 0.5);
    REQUIRE(transfer->progress() == 0.5);
    REQUIRE(f.downloads.active_progress().count(url) == 1);
    REQUIRE(f.downloads.item(url)->status == TaskStatus::running);

    f.transport->emit(transfer->task(), TaskStatus::complete, 1.0);
    REQUIRE(transfer->status() == QueuedTransferStatus::completed);
    auto result = transfer->future().get();
    REQUIRE(std::get<TransferSuccess>(result.result).local_path == transfer->task().local_path());
    REQUIRE(f.downloads.active_progress().empty());
    REQUIRE(map_sizes == std::vector<std::size_t>{1, 0});
}

TEST_CASE("A finished URL is served from the cache by another queue", "[download][cache]") {
    Fixture f;
    f.transport->auto_answer = true;
    const std::string url = "https://example.com/once.bin";
    auto transfer = f.downloads.add_url(url);
    f.transport->emit(transfer->task(), TaskStatus::complete, 1.0);

    DownloadQueueManager other(f.controller);
    auto again = other.add_url(url);
    REQUIRE(again->status() == QueuedTransferStatus::completed);
    REQUIRE(std::get<TransferSuccess>(again->future().get().result).local_path == transfer->task().local_path());
    REQUIRE(f.transport->count("enqueue") == 1);
}

TEST_CASE("Transport failures keep their code and HTTP status", "[download][failure]") {
    Fixture f;
    f.transport->auto_answer = true;
    auto transfer = f.downloads.add_url("https://example.com/missing");

    TransferItem item;
    item.task = transfer->task();
    item.status = TaskStatus::failed;
    item.exception = TransferException{"", std::string("SERVER_ERROR"), 404};
    f.transport->emit(item);

    auto failure = std::get<TransferFailure>(transfer->future().get().result);
    REQUIRE(failure.message == "Download failed");
    REQUIRE(failure.code == std::optional<std::string>("SERVER_ERROR"));
    REQUIRE(failure.http_status == 404);
    REQUIRE_FALSE(failure.recoverable);
}

TEST_CASE("Rejected downloads fail with TRANSPORT_REJECTED", "[download][failure]") {
    Fixture f;
    f.transport->auto_answer = false;
    auto transfer = f.downloads.add_url("https://example.com/nope");

    auto failure = std::get<TransferFailure>(transfer->future().get().result);
    REQUIRE(failure.code == std::optional<std::string>("TRANSPORT_REJECTED"));
    REQUIRE_FALSE(f.controller->is_active(transfer->task().key()));
}

TEST_CASE("Cancelling a running download cancels it at the transport", "[download][cancel]") {
    Fixture f;
    f.transport->auto_answer = true;
    auto transfer = f.downloads.add_url("https://example.com/long");
    f.transport->emit(transfer->task(), TaskStatus::running, 0.2);

    REQUIRE(f.downloads.cancel(transfer->id()));
    REQUIRE(f.transport->count("cancel") == 1);
    REQUIRE(transfer->future().get().is_cancelled());
    REQUIRE(f.downloads.active_progress().empty());
}

TEST_CASE("Cancelling while the controller is still busy cancels the started transfer", "[download][cancel]") {
    Fixture f;
    auto transfer = f.downloads.add_url("https://example.com/slow-start");
    REQUIRE(f.transport->outstanding() == 1);

    REQUIRE(f.downloads.cancel(transfer->id()));
    f.transport->complete_next(true);
    REQUIRE(f.transport->count("cancel") == 1);
    REQUIRE(transfer->future().get().is_cancelled());
}

TEST_CASE("pause_download and resume_download reach the transport", "[download][control]") {
    Fixture f;
    f.transport->auto_answer = true;
    auto transfer = f.downloads.add_url("https://example.com/pausable");

    std::optional<bool> paused, resumed;
    f.downloads.pause_download(transfer->id(), [&](bool ok) { paused = ok; });
    f.downloads.resume_download(transfer->id(), [&](bool ok) { resumed = ok; });
    REQUIRE(paused == true);
    REQUIRE(resumed == true);
    REQUIRE(f.transport->count("pause") == 1);
    REQUIRE(f.transport->count("resume") == 1);
}

TEST_CASE("wait_for and wait_for_all report results", "[download][wait]") {
    Fixture f;
    f.transport->auto_answer = true;
    REQUIRE_THROWS_AS(f.downloads.wait_for("unknown", [](const QueueResult&) {}), XferqError);

    auto transfers = f.downloads.add_urls({"https://example.com/1", "https://example.com/2"});

    std::optional<QueueResult> first;
    f.downloads.wait_for(transfers[0]->id(), [&](const QueueResult& result) { first = result; });
    std::optional<std::vector<QueueResult>> all;
    f.downloads.wait_for_all([&](std::vector<QueueResult> results) { all = std::move(results); });

    f.transport->emit(transfers[0]->task(), TaskStatus::complete, 1.0);
    REQUIRE(first.has_value());
    REQUIRE(first->is_success());
    REQUIRE_FALSE(all.has_value());

    f.transport->emit(transfers[1]->task(), TaskStatus::canceled);
    REQUIRE(all.has_value());
    REQUIRE(all->size() == 2);
}

TEST_CASE("Upload queue keys transfers by task id", "[upload]") {
    auto transport = std::make_shared<MockTransport>();
    transport->auto_answer = true;
    auto controller = std::make_shared<TransferController>(transport, nullptr);
    UploadQueueManager uploads(controller);

    auto a = uploads.add_file("https://example.com/upload", "/tmp/a.txt", {{"kind", "report"}});
    auto b = uploads.add_file("https://example.com/upload", "/tmp/b.txt");
    REQUIRE(a->id() != b->id());
    REQUIRE(a->id() == a->task().task_id);
    REQUIRE(a->task().fields.at("kind") == "report");
    REQUIRE(transport->count("enqueue") == 2);

    transport->emit(a->task(), TaskStatus::complete, 1.0);
    REQUIRE(std::get<TransferSuccess>(a->future().get().result).local_path == "/tmp/a.txt");

    REQUIRE_THROWS_AS(uploads.add_task(TransferTask::download("https://example.com/x")), XferqError);
}

TEST_CASE("Simulated transport runs downloads to completion", "[download][simulation]") {
    SimulationConfig sim;
    sim.bytes_per_tick = 400;
    sim.default_size = 1000;
    auto transport = std::make_shared<SimulatedTransport>(sim);
    auto controller = std::make_shared<TransferController>(transport, nullptr);

    QueueOptions options;
    options.max_concurrent = 1;
    DownloadQueueManager downloads(controller, options);

    auto good = downloads.add_url("https://example.com/ok.bin");
    auto bad = downloads.add_url("https://example.com/fail.bin");

    for (int i = 0; i < 20 && !(good->is_resolved() && bad->is_resolved()); ++i) {
        transport->tick();
    }

    REQUIRE(good->future().get().is_success());
    auto failure = std::get<TransferFailure>(bad->future().get().result);
    REQUIRE(failure.code == std::optional<std::string>("NETWORK_ERROR"));
    REQUIRE(transport->idle());
    REQUIRE(controller->cached_path("https://example.com/ok.bin").has_value());
}

TEST_CASE("A download finished before the transport confirms it frees its slot", "[download][ordering]") {
    auto transport = std::make_shared<MockTransport>();
    auto controller = std::make_shared<TransferController>(transport, nullptr, unverified_cache_config());
    QueueOptions options;
    options.max_concurrent = 1;
    DownloadQueueManager downloads(controller, options);

    auto first = downloads.add_url("https://example.com/fast.bin");
    auto second = downloads.add_url("https://example.com/next.bin");
    REQUIRE(transport->count("enqueue") == 1);

    transport->emit(first->task(), TaskStatus::complete, 1.0);
    transport->complete_next(true);

    REQUIRE(first->status() == QueuedTransferStatus::completed);
    REQUIRE(std::get<TransferSuccess>(first->future().get().result).local_path == first->task().local_path());
    REQUIRE(second->is_running());
    REQUIRE(transport->count("enqueue") == 2);
    REQUIRE(downloads.queue().running_count() == 1);
    REQUIRE(downloads.active_progress().empty());
}

TEST_CASE("A download failed before the transport confirms it keeps its failure", "[download][ordering]") {
    Fixture f;
    auto transfer = f.downloads.add_url("https://example.com/broken.bin");

    TransferItem item;
    item.task = transfer->task();
    item.status = TaskStatus::failed;
    item.exception = TransferException{"connection reset", std::string("NETWORK_ERROR"), std::nullopt};
    f.transport->emit(item);
    f.transport->complete_next(true);

    auto failure = std::get<TransferFailure>(transfer->future().get().result);
    REQUIRE(failure.message == "connection reset");
    REQUIRE(failure.code == std::optional<std::string>("NETWORK_ERROR"));
    REQUIRE(f.downloads.queue().running_count() == 0);
}
