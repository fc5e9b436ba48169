#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>
#include "xferq/base/error_code.h"
#include "xferq/base/stream.h"

using namespace xferq;

TEST_CASE("Broadcast stream delivers to every listener in order", "[stream][broadcast]") {
    BroadcastStream<int> stream;
    std::vector<int> first, second;
    int done = 0;

    auto a = stream.listen([&](const int& v) { first.push_back(v); }, [&]() { ++done; });
    auto b = stream.listen([&](const int& v) { second.push_back(v); }, [&]() { ++done; });

    stream.add(1);
    stream.add(2);
    b.cancel();
    stream.add(3);
    stream.close();
    stream.close();

    REQUIRE(first == std::vector<int>{1, 2, 3});
    REQUIRE(second == std::vector<int>{1, 2});
    REQUIRE(done == 1);
    REQUIRE(stream.listener_count() == 0);

    // Late listeners only see the close
    bool late_done = false;
    stream.listen([](const int&) { FAIL("no data after close"); }, [&]() { late_done = true; });
    REQUIRE(late_done);
}

TEST_CASE("Broadcast stream queues adds made from a listener", "[stream][broadcast]") {
    BroadcastStream<int> stream;
    std::vector<std::string> log;

    auto a = stream.listen([&](const int& v) {
        log.push_back("a" + std::to_string(v));
        if (v == 1) stream.add(2);
    });
    auto b = stream.listen([&](const int& v) { log.push_back("b" + std::to_string(v)); });

    stream.add(1);
    REQUIRE(log == std::vector<std::string>{"a1", "b1", "a2", "b2"});
}

TEST_CASE("Unicast stream buffers until listened", "[stream][unicast]") {
    UnicastStream<int> stream;
    stream.add(1);
    stream.add(2);
    stream.add_error("bad");
    stream.close();
    stream.add(3);

    std::vector<int> values;
    std::string error;
    bool done = false;
    auto sub = stream.listen([&](const int& v) { values.push_back(v); }, [&](const std::string& e) { error = e; },
                             [&]() { done = true; });

    REQUIRE(values == std::vector<int>{1, 2});
    REQUIRE(error == "bad");
    REQUIRE(done);
}

TEST_CASE("Unicast stream accepts a single listener", "[stream][unicast]") {
    UnicastStream<int> stream;
    auto sub = stream.listen([](const int&) {}, nullptr, nullptr);
    REQUIRE_THROWS_AS(stream.listen([](const int&) {}, nullptr, nullptr), XferqError);
}

TEST_CASE("Cancelled unicast subscription drops pending events", "[stream][unicast]") {
    UnicastStream<int> stream;
    std::vector<int> values;
    Subscription sub;
    sub = stream.listen(
        [&](const int& v) {
            values.push_back(v);
            sub.cancel();
        },
        nullptr, nullptr);

    stream.add(1);
    stream.add(2);
    REQUIRE(values == std::vector<int>{1});
    REQUIRE_FALSE(sub.active());
}
