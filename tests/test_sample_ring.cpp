#include <catch2/catch_test_macros.hpp>

#include "sample_ring.hpp"

#include <cstdint>
#include <numeric>
#include <span>
#include <thread>
#include <vector>

TEST_CASE("SampleRing", "[sample_ring]") {
    constexpr size_t cap = 256;
    SampleRing ring(cap);

    SECTION("WriteAndRead") {
        std::vector<int16_t> data(64);
        std::iota(data.begin(), data.end(), int16_t(-32));

        REQUIRE(ring.write(data) == 64);
        REQUIRE(ring.available() == 64);

        std::vector<int16_t> out(64);
        REQUIRE(ring.read(out) == 64);
        REQUIRE(out == data);
        REQUIRE(ring.available() == 0);
    }

    SECTION("Wraparound") {
        std::vector<int16_t> fill(200, 1);
        REQUIRE(ring.write(fill) == 200);
        REQUIRE(ring.drain_all() == fill);

        // Next write crosses the end of the buffer
        std::vector<int16_t> wrap(128);
        std::iota(wrap.begin(), wrap.end(), int16_t(1000));
        REQUIRE(ring.write(wrap) == 128);
        REQUIRE(ring.drain_all() == wrap);
    }

    SECTION("OverflowCountsDropped") {
        std::vector<int16_t> big(cap + 100, 5);

        REQUIRE(ring.write(big) == cap);
        REQUIRE(ring.available() == cap);
        REQUIRE(ring.dropped() == 100);

        // A full ring drops everything
        std::vector<int16_t> more(10, 6);
        REQUIRE(ring.write(more) == 0);
        REQUIRE(ring.dropped() == 110);
    }

    SECTION("ResetClearsState") {
        std::vector<int16_t> big(cap + 1, 0);
        ring.write(big);
        ring.reset();
        REQUIRE(ring.available() == 0);
        REQUIRE(ring.dropped() == 0);
        REQUIRE(ring.drain_all().empty());
    }

    SECTION("ProducerConsumerPreservesOrder") {
        constexpr int total = 20000;
        std::vector<int16_t> received;
        received.reserve(total);

        std::thread producer([&ring] {
            int16_t next = 0;
            while (next < total) {
                int16_t sample = next;
                if (ring.write(std::span<const int16_t>(&sample, 1)) == 1) ++next;
            }
        });

        while (received.size() < static_cast<size_t>(total)) {
            auto chunk = ring.drain_all();
            received.insert(received.end(), chunk.begin(), chunk.end());
        }
        producer.join();

        std::vector<int16_t> expected(total);
        std::iota(expected.begin(), expected.end(), int16_t(0));
        REQUIRE(received == expected);
    }
}
