#include <catch2/catch_test_macros.hpp>

#include "core/background_task.hpp"
#include "core/bounded_queue.hpp"
#include "core/cancellation.hpp"

#include <QAtomicInt>
#include <QThread>

#include <memory>

using namespace relayscout;

TEST_CASE("CancelToken: cancel is shared between copies", "[cancellation]") {
    CancelToken token;
    auto copy = token;

    REQUIRE_FALSE(copy.is_cancelled());
    token.cancel();
    REQUIRE(copy.is_cancelled());
    REQUIRE_FALSE(copy.deadline_exceeded());
}

TEST_CASE("CancelToken: deadline ends the token", "[cancellation]") {
    auto token = CancelToken::with_timeout(Millis{30});
    REQUIRE(token.deadline().has_value());

    REQUIRE(token.wait_for(Millis{2000}));
    REQUIRE(token.is_cancelled());
    REQUIRE(token.deadline_exceeded());
    REQUIRE(token.remaining(Millis{500}) == Millis{0});
}

TEST_CASE("CancelToken: child ends with its parent", "[cancellation]") {
    CancelToken parent;
    auto child = parent.child_with_timeout(Millis{60000});

    REQUIRE_FALSE(child.is_cancelled());
    parent.cancel();
    REQUIRE(child.is_cancelled());
}

TEST_CASE("CancelToken: child deadline does not end the parent", "[cancellation]") {
    CancelToken parent;
    auto child = parent.child_with_timeout(Millis{10});

    REQUIRE(child.wait_for(Millis{2000}));
    REQUIRE_FALSE(parent.is_cancelled());
}

TEST_CASE("CancelToken: remaining falls back without a deadline", "[cancellation]") {
    CancelToken token;
    REQUIRE(token.remaining(Millis{123}) == Millis{123});
    REQUIRE_FALSE(token.wait_for(Millis{5}));
}

TEST_CASE("BoundedQueue: drops when full", "[bounded_queue]") {
    BoundedQueue<int> queue(2);

    REQUIRE(queue.try_push(1));
    REQUIRE(queue.try_push(2));
    REQUIRE_FALSE(queue.try_push(3));
    REQUIRE(queue.dropped() == 1);
    REQUIRE(queue.size() == 2);

    REQUIRE(queue.try_pop() == 1);
    REQUIRE(queue.try_pop() == 2);
    REQUIRE_FALSE(queue.try_pop().has_value());
}

TEST_CASE("BoundedQueue: close rejects pushes and drains", "[bounded_queue]") {
    BoundedQueue<int> queue(4);
    REQUIRE(queue.try_push(7));
    queue.close();

    REQUIRE_FALSE(queue.try_push(8));
    REQUIRE_FALSE(queue.is_drained());
    REQUIRE(queue.pop_for(Millis{10}) == 7);
    REQUIRE(queue.is_drained());
    REQUIRE_FALSE(queue.pop_for(Millis{1000}).has_value());
}

TEST_CASE("CancelToken: wait_until returns at once for a past time point", "[cancellation]") {
    CancelToken token;
    const auto start = CancelToken::Clock::now();
    REQUIRE_FALSE(token.wait_until(start - Millis{100}));
    REQUIRE(CancelToken::Clock::now() - start < Millis{50});

    REQUIRE_FALSE(token.wait_until(CancelToken::Clock::now() + Millis{20}));
    REQUIRE(CancelToken::Clock::now() - start >= Millis{20});

    token.cancel();
    REQUIRE(token.wait_until(CancelToken::Clock::now() + Millis{5000}));
}

TEST_CASE("BoundedQueue: pop_for wakes on push from another thread", "[bounded_queue]") {
    BoundedQueue<int> queue(4);
    std::unique_ptr<QThread> producer(QThread::create([&queue] {
        QThread::msleep(20);
        queue.try_push(5);
    }));
    producer->start();

    auto item = queue.pop_for(Millis{5000});
    producer->wait();
    REQUIRE(item == 5);
}

TEST_CASE("BackgroundTask: stop cancels and joins the body", "[background_task]") {
    BackgroundTask task;
    QAtomicInt finished{0};

    REQUIRE(task.start([&finished](const CancelToken& token) {
        while (!token.wait_for(Millis{10})) {
        }
        finished.storeRelaxed(1);
    }));
    REQUIRE(task.is_running());
    REQUIRE_FALSE(task.start([](const CancelToken&) {}));

    task.stop();
    REQUIRE(finished.loadRelaxed() == 1);
    REQUIRE_FALSE(task.is_running());

    // Restartable after stop.
    REQUIRE(task.start([](const CancelToken&) {}));
    task.stop();
}
