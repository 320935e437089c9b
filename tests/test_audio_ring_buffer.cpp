#include <catch2/catch_test_macros.hpp>

#include <thread>

#include "AudioRingBuffer.h"

TEST_CASE("Ring buffer keeps order", "[ring]") {
    AudioRingBuffer ring{4};
    ring.push("a");
    ring.push("b");

    AudioRingBuffer::Chunk chunk;
    REQUIRE(ring.pop(chunk));
    CHECK(chunk == "a");
    REQUIRE(ring.pop(chunk));
    CHECK(chunk == "b");
    CHECK(ring.dropped() == 0);
}

TEST_CASE("Ring buffer drops the oldest chunk when full", "[ring]") {
    AudioRingBuffer ring{2};
    ring.push("1");
    ring.push("2");
    ring.push("3");
    CHECK(ring.dropped() == 1);

    ring.stop();
    AudioRingBuffer::Chunk chunk;
    REQUIRE(ring.pop(chunk));
    CHECK(chunk == "2");
    REQUIRE(ring.pop(chunk));
    CHECK(chunk == "3");
    CHECK_FALSE(ring.pop(chunk));
}

TEST_CASE("Ring buffer wakes up a waiting consumer", "[ring]") {
    AudioRingBuffer ring;
    size_t received = 0;

    std::thread consumer{[&] {
        AudioRingBuffer::Chunk chunk;
        while (ring.pop(chunk)) {
            received += static_cast<size_t>(chunk.size());
        }
    }};

    for (int i = 0; i < 100; ++i) {
        ring.push(QByteArray(10, 'x'));
    }
    ring.stop();
    consumer.join();

    CHECK(received + ring.dropped() * 10 == 1000);
}
