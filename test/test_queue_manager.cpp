#include <catch2/catch_test_macros.hpp>
#include <stdexcept>
#include <string>
#include <vector>
#include "test_support.h"
#include "xferq/queue/transfer_queue_manager.h"

using namespace xferq;
using xferq::test::ManualScheduler;
using xferq::test::ScriptedExecutor;

using Queue = TransferQueueManager<std::string>;

namespace {

QueueOptions options_with(int max_concurrent, bool auto_start = true) {
    QueueOptions options;
    options.max_concurrent = max_concurrent;
    options.auto_start = auto_start;
    return options;
}

} // anonymous namespace

TEST_CASE("Higher priority is admitted first, equal priority in FIFO order", "[queue][priority]") {
    ScriptedExecutor<std::string> executor;
    Queue queue(executor.function(), options_with(1, false));

    queue.add("a", std::string("a"), TransferPriority::normal);
    queue.add("b", std::string("b"), TransferPriority::low);
    queue.add("c", std::string("c"), TransferPriority::high);
    queue.add("d", std::string("d"), TransferPriority::high);
    REQUIRE(executor.started.empty());
    REQUIRE(queue.pending_count() == 4);

    queue.start();
    executor.complete("c");
    executor.complete("d");
    executor.complete("a");
    executor.complete("b");

    REQUIRE(executor.started == std::vector<std::string>{"c", "d", "a", "b"});
    REQUIRE(queue.running_count() == 0);
}

TEST_CASE("Running transfers never exceed max_concurrent", "[queue][concurrency]") {
    ScriptedExecutor<std::string> executor;
    Queue queue(executor.function(), options_with(2));

    std::vector<Queue::TransferPtr> transfers;
    for (int i = 0; i < 5; ++i) {
        auto id = "t" + std::to_string(i);
        transfers.push_back(queue.add(id, id));
    }

    REQUIRE(queue.running_count() == 2);
    REQUIRE(queue.pending_count() == 3);
    REQUIRE(transfers[2]->queue_position() == 2);
    REQUIRE(transfers[4]->queue_position() == 4);
    REQUIRE(queue.state().is_full());

    executor.complete("t0");
    REQUIRE(queue.running_count() == 2);
    REQUIRE(executor.started.back() == "t2");
    REQUIRE(transfers[3]->queue_position() == 2);

    queue.set_max_concurrent(4);
    REQUIRE(queue.running_count() == 4);
    REQUIRE_THROWS_AS(queue.set_max_concurrent(0), XferqError);
}

TEST_CASE("A late high priority task jumps the waiting line but not running work", "[queue][priority]") {
    ScriptedExecutor<std::string> executor;
    Queue queue(executor.function(), options_with(1));

    queue.add("T1", std::string("T1"));
    queue.add("T2", std::string("T2"));
    queue.add("T3", std::string("T3"), TransferPriority::high);

    REQUIRE(executor.started == std::vector<std::string>{"T1"});
    executor.complete("T1");
    executor.complete("T3");
    REQUIRE(executor.started == std::vector<std::string>{"T1", "T3", "T2"});
}

TEST_CASE("Adding an existing id returns the same transfer", "[queue][dedup]") {
    ScriptedExecutor<std::string> executor;
    Queue queue(executor.function(), options_with(1));

    auto first = queue.add("payload-1", std::string("x"));
    auto second = queue.add("payload-2", std::string("x"));

    REQUIRE(first == second);
    REQUIRE(second->task() == "payload-1");
    REQUIRE(queue.total_count() == 1);
    REQUIRE(executor.start_count("x") == 1);
}

TEST_CASE("Completion resolves the future with the local path", "[queue][result]") {
    ScriptedExecutor<std::string> executor;
    Queue queue(executor.function(), options_with(1));
    auto transfer = queue.add("job", std::string("job"));

    std::vector<double> seen;
    auto sub = transfer->progress_stream().listen([&](const TransferProgress& p) { seen.push_back(p.progress()); });

    TransferProgress half;
    half.bytes_transferred = 50;
    half.total_bytes = 100;
    executor.streams.at("job").add(half);
    REQUIRE(transfer->progress() == 0.5);

    executor.streams.at("job").add(TransferProgress::completed(100, {{kLocalPathKey, "/tmp/job"}}));

    REQUIRE(transfer->status() == QueuedTransferStatus::completed);
    REQUIRE(transfer->is_resolved());
    auto result = transfer->future().get();
    REQUIRE(result.is_success());
    REQUIRE(std::get<TransferSuccess>(result.result).local_path == "/tmp/job");
    REQUIRE(std::get<TransferSuccess>(result.result).file_size == 100);
    REQUIRE(seen == std::vector<double>{0.5, 1.0});
}

TEST_CASE("Automatic retry stops after max_retries", "[queue][retry]") {
    ScriptedExecutor<std::string> executor;
    QueueOptions options = options_with(1);
    options.auto_retry = true;
    options.max_retries = 2;
    Queue queue(executor.function(), options);

    // Status of the transfer at each state change, consecutive repeats folded
    std::vector<QueuedTransferStatus> statuses;
    auto sub = queue.state_stream().listen([&](const Queue::State&) {
        auto current = queue.get("job");
        if (!current) return;
        if (statuses.empty() || statuses.back() != current->status()) statuses.push_back(current->status());
    });

    auto transfer = queue.add("job", std::string("job"));
    executor.fail("job");
    REQUIRE(queue.retry_count("job") == 1);
    REQUIRE(transfer->is_running());
    executor.fail("job");
    REQUIRE(queue.retry_count("job") == 2);
    executor.fail("job");

    REQUIRE(executor.start_count("job") == 3);
    REQUIRE(transfer->status() == QueuedTransferStatus::failed);
    REQUIRE(transfer->future().get().error() == std::optional<std::string>("boom"));
    REQUIRE(queue.retry_count("job") == 0);

    // A later failure gets its own retry budget
    REQUIRE(queue.retry("job"));
    REQUIRE(queue.retry_count("job") == 0);
    executor.fail("job");
    REQUIRE(queue.retry_count("job") == 1);
    REQUIRE_FALSE(transfer->is_resolved());
    executor.fail("job");
    REQUIRE(queue.retry_count("job") == 2);
    executor.fail("job");

    REQUIRE(executor.start_count("job") == 6);
    REQUIRE(transfer->status() == QueuedTransferStatus::failed);
    REQUIRE(statuses == std::vector<QueuedTransferStatus>{
                            QueuedTransferStatus::queued, QueuedTransferStatus::running,
                            QueuedTransferStatus::failed, QueuedTransferStatus::running,
                            QueuedTransferStatus::failed});
}

TEST_CASE("Non-recoverable failures are not retried automatically", "[queue][retry]") {
    ScriptedExecutor<std::string> executor;
    QueueOptions options = options_with(1);
    options.auto_retry = true;
    Queue queue(executor.function(), options);

    auto transfer = queue.add("job", std::string("job"));
    executor.fail("job", "FORBIDDEN");
    REQUIRE(transfer->status() == QueuedTransferStatus::failed);
    REQUIRE(executor.start_count("job") == 1);

    auto failure = std::get<TransferFailure>(transfer->future().get().result);
    REQUIRE_FALSE(failure.recoverable);
    REQUIRE(failure.code == std::optional<std::string>("FORBIDDEN"));
}

TEST_CASE("Backoff parks the transfer until the delay elapses", "[queue][retry][backoff]") {
    ScriptedExecutor<std::string> executor;
    ManualScheduler scheduler;
    QueueOptions options = options_with(1);
    options.auto_retry = true;
    options.max_retries = 3;
    options.retry_base_delay = std::chrono::milliseconds(100);
    options.backoff_multiplier = 2.0;
    Queue queue(executor.function(), options, scheduler.defer_function());

    auto transfer = queue.add("job", std::string("job"));
    queue.add("other", std::string("other"));
    executor.fail("job");

    // The free slot goes to the next pending transfer meanwhile
    REQUIRE(queue.waiting_retry_count() == 1);
    REQUIRE(transfer->status() == QueuedTransferStatus::queued);
    REQUIRE(executor.started.back() == "other");
    executor.complete("other");

    scheduler.advance(std::chrono::milliseconds(99));
    REQUIRE(executor.start_count("job") == 1);
    scheduler.advance(std::chrono::milliseconds(1));
    REQUIRE(executor.start_count("job") == 2);
    REQUIRE(queue.waiting_retry_count() == 0);

    executor.fail("job");
    scheduler.advance(std::chrono::milliseconds(100));
    REQUIRE(executor.start_count("job") == 2);
    scheduler.advance(std::chrono::milliseconds(100));
    REQUIRE(executor.start_count("job") == 3);
}

TEST_CASE("Cancelling a waiting transfer resolves it without running", "[queue][cancel]") {
    ScriptedExecutor<std::string> executor;
    Queue queue(executor.function(), options_with(1));

    queue.add("a", std::string("a"));
    auto waiting = queue.add("b", std::string("b"));

    REQUIRE(queue.cancel("b"));
    REQUIRE(waiting->is_resolved());
    REQUIRE(waiting->future().get().is_cancelled());
    REQUIRE(waiting->cancellation_token().is_cancelled());
    REQUIRE(queue.pending_count() == 0);
    REQUIRE(executor.start_count("b") == 0);

    REQUIRE_FALSE(queue.cancel("b"));
    REQUIRE_FALSE(queue.cancel("missing"));
}

TEST_CASE("Cancelling a running transfer frees its slot", "[queue][cancel]") {
    ScriptedExecutor<std::string> executor;
    Queue queue(executor.function(), options_with(1));

    auto running = queue.add("a", std::string("a"));
    queue.add("b", std::string("b"));

    REQUIRE(queue.cancel("a"));
    REQUIRE(running->status() == QueuedTransferStatus::cancelled);
    REQUIRE(executor.started == std::vector<std::string>{"a", "b"});

    // Late events from the cancelled executor are ignored
    executor.streams.at("a").add(TransferProgress::completed(10));
    REQUIRE(running->status() == QueuedTransferStatus::cancelled);
}

TEST_CASE("Token cancelled from outside stops consumption", "[queue][cancel]") {
    ScriptedExecutor<std::string> executor;
    Queue queue(executor.function(), options_with(1));
    auto transfer = queue.add("a", std::string("a"));

    transfer->cancellation_token().cancel(std::string("caller gave up"));
    executor.streams.at("a").add(TransferProgress::initial(10));

    REQUIRE(transfer->status() == QueuedTransferStatus::cancelled);
    auto cancelled = std::get<TransferCancelled>(transfer->future().get().result);
    REQUIRE(cancelled.reason == std::optional<std::string>("caller gave up"));
}

TEST_CASE("Executor errors become failures", "[queue][failure]") {
    Queue queue([](const Queue::TransferPtr&) -> UnicastStream<TransferProgress> {
        throw std::runtime_error("cannot start");
    }, options_with(1));

    auto transfer = queue.add("a", std::string("a"));
    REQUIRE(transfer->status() == QueuedTransferStatus::failed);
    REQUIRE(transfer->future().get().error() == std::optional<std::string>("cannot start"));
    REQUIRE(queue.running_count() == 0);
}

TEST_CASE("A stream that ends early fails with UNEXPECTED_END", "[queue][failure]") {
    ScriptedExecutor<std::string> executor;
    Queue queue(executor.function(), options_with(1));
    auto transfer = queue.add("a", std::string("a"));

    TransferProgress half;
    half.bytes_transferred = 5;
    half.total_bytes = 10;
    executor.streams.at("a").add(half);
    executor.streams.at("a").close();

    auto failure = std::get<TransferFailure>(transfer->future().get().result);
    REQUIRE(failure.code == std::optional<std::string>("UNEXPECTED_END"));
    REQUIRE(failure.bytes_transferred == 5);
}

TEST_CASE("Manual retry gives a failed transfer a fresh future", "[queue][retry]") {
    ScriptedExecutor<std::string> executor;
    Queue queue(executor.function(), options_with(1));
    auto transfer = queue.add("a", std::string("a"));
    executor.fail("a");
    auto old_future = transfer->future();
    REQUIRE(old_future.get().is_failure());

    REQUIRE(queue.retry("a"));
    REQUIRE(transfer->is_running());
    REQUIRE_FALSE(transfer->is_resolved());

    executor.complete("a");
    REQUIRE(transfer->future().get().is_success());
    REQUIRE(old_future.get().is_failure());
    REQUIRE_FALSE(queue.retry("a"));
}

TEST_CASE("Priority changes apply only while queued", "[queue][priority]") {
    ScriptedExecutor<std::string> executor;
    Queue queue(executor.function(), options_with(1));
    auto running = queue.add("a", std::string("a"));
    auto old_handle = queue.add("b", std::string("b"));
    queue.add("c", std::string("c"));

    REQUIRE_FALSE(queue.change_priority("a", TransferPriority::urgent));
    REQUIRE(queue.move_to_front("c"));
    REQUIRE(queue.get("c")->priority() == TransferPriority::urgent);
    REQUIRE(queue.pending_transfers().front()->id() == "c");

    executor.complete("a");
    REQUIRE(executor.started.back() == "c");
    REQUIRE(old_handle->queue_position() == 1);
}

TEST_CASE("pause stops admissions and resume_all restarts them", "[queue][pause]") {
    ScriptedExecutor<std::string> executor;
    Queue queue(executor.function(), options_with(1));
    auto a = queue.add("a", std::string("a"));
    queue.add("b", std::string("b"));

    queue.pause_all();
    REQUIRE(queue.is_paused());
    REQUIRE(a->is_paused());
    executor.complete("a");
    REQUIRE(queue.running_count() == 0);
    REQUIRE(executor.start_count("b") == 0);

    queue.resume_all();
    REQUIRE(executor.start_count("b") == 1);
}

TEST_CASE("remove and clear_finished drop transfers", "[queue][remove]") {
    ScriptedExecutor<std::string> executor;
    Queue queue(executor.function(), options_with(2));
    auto a = queue.add("a", std::string("a"));
    queue.add("b", std::string("b"));
    executor.complete("b");

    REQUIRE(queue.remove("a"));
    REQUIRE(a->is_resolved());
    REQUIRE(a->future().get().is_cancelled());
    REQUIRE(queue.total_count() == 1);

    queue.clear_finished();
    REQUIRE(queue.total_count() == 0);
    REQUIRE_FALSE(queue.remove("a"));
}

TEST_CASE("State stream reports every change and closes on dispose", "[queue][state]") {
    ScriptedExecutor<std::string> executor;
    Queue queue(executor.function(), options_with(1));

    std::vector<std::string> states;
    bool closed = false;
    auto sub = queue.state_stream().listen(
        [&](const Queue::State& state) { states.push_back(state.to_string()); }, [&]() { closed = true; });

    auto a = queue.add("a", std::string("a"));
    REQUIRE_FALSE(states.empty());
    REQUIRE(states.back() == "TransferQueueState(running: 1/1, pending: 0, paused: false)");

    queue.dispose();
    REQUIRE(closed);
    REQUIRE(a->future().get().is_cancelled());
    REQUIRE_THROWS_AS(queue.add("x", std::string("x")), XferqError);
}

TEST_CASE("Nothing is emitted after the terminal event", "[queue][result]") {
    ScriptedExecutor<std::string> executor;
    Queue queue(executor.function(), options_with(1));
    auto transfer = queue.add("job", std::string("job"));

    std::vector<TransferStatus> seen;
    int done = 0;
    int results = 0;
    auto sub = transfer->progress_stream().listen([&](const TransferProgress& p) { seen.push_back(p.status); },
                                                  [&]() { ++done; });
    transfer->on_result([&](const QueueResult&) { ++results; });

    auto stream = executor.streams.at("job");
    stream.add(TransferProgress::completed(100));
    stream.add(TransferProgress::failed("late", "NETWORK_ERROR"));
    stream.add(TransferProgress::completed(100));
    stream.close();
    REQUIRE_FALSE(queue.cancel("job"));
    REQUIRE_FALSE(queue.retry("job"));

    REQUIRE(seen == std::vector<TransferStatus>{TransferStatus::completed});
    REQUIRE(done == 1);
    REQUIRE(results == 1);
    REQUIRE(transfer->future().get().is_success());
}

TEST_CASE("cancel_all survives result callbacks that remove transfers", "[queue][cancel][backoff]") {
    ScriptedExecutor<std::string> executor;
    ManualScheduler scheduler;
    QueueOptions options = options_with(2);
    options.auto_retry = true;
    options.retry_base_delay = std::chrono::milliseconds(100);
    Queue queue(executor.function(), options, scheduler.defer_function());

    auto a = queue.add("a", std::string("a"));
    auto b = queue.add("b", std::string("b"));
    executor.fail("a");
    executor.fail("b");
    REQUIRE(queue.waiting_retry_count() == 2);

    // Cleans up as soon as the first transfer resolves
    a->on_result([&](const QueueResult&) {
        queue.remove("a");
        queue.remove("b");
    });
    queue.cancel_all();

    REQUIRE(a->future().get().is_cancelled());
    REQUIRE(b->future().get().is_cancelled());
    REQUIRE(queue.total_count() == 0);
    REQUIRE(queue.waiting_retry_count() == 0);

    scheduler.advance(std::chrono::milliseconds(1000));
    REQUIRE(executor.start_count("a") == 1);
    REQUIRE(executor.start_count("b") == 1);
}
