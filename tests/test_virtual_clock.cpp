// Copyright © 2026 The Tickwork Authors
//
// This file is part of Tickwork.
//
// Tickwork is free software: you can redistribute it and/or modify it under the terms of the
// GNU General Public License as published by the Free Software Foundation, either version 3 of the
// License, or (at your option) any later version. Tickwork is distributed in the hope that it will
// be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
// FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
// You should have received a copy of the GNU General Public License along with Tickwork.
// If not, see <https://www.gnu.org/licenses/>.

#include <catch2/catch_test_macros.hpp>
#include <tickwork/VirtualClock.hpp>

#include <chrono>
#include <stdexcept>

using namespace tickwork;
using namespace std::chrono_literals;

TEST_CASE("VirtualClock converts wall time to owed cycles", "[clock][advance]") {
    VirtualClock clock(700);

    SECTION("one second owes exactly the rate") {
        CHECK(clock.advance(1s) == 700);
    }

    SECTION("owed cycles are not elapsed until committed") {
        CHECK(clock.advance(1s) == 700);
        CHECK(clock.cycles() == 0);
        clock.commit(700);
        CHECK(clock.cycles() == 700);
        CHECK(clock.elapsed_virtual_time() == 1s);
    }

    SECTION("zero and negative intervals owe nothing") {
        CHECK(clock.advance(0ns) == 0);
        CHECK(clock.advance(-5ms) == 0);
        CHECK(clock.remainder() == 0);
    }
}

TEST_CASE("VirtualClock carries fractional cycles", "[clock][remainder]") {
    SECTION("sub-cycle intervals accumulate") {
        VirtualClock clock(3);  // 0.3 cycles per 100ms
        uint64_t total = 0;
        std::vector<uint64_t> per_tick;
        for (int i = 0; i < 10; ++i) {
            per_tick.push_back(clock.advance(100ms));
            total += per_tick.back();
        }
        CHECK(total == 3);
        CHECK(per_tick[0] == 0);
        CHECK(per_tick[1] == 0);
        CHECK(per_tick[2] == 0);
        CHECK(per_tick[3] == 1);
    }

    SECTION("any split of an interval owes the same as the whole") {
        const Duration total = 1234567891ns;
        for (uint64_t rate : {1ULL, 60ULL, 500ULL, 700ULL, 44100ULL, 2000000ULL, 1000000000ULL}) {
            VirtualClock whole(rate);
            const uint64_t expected = whole.advance(total);
            for (int64_t split : {0LL, 1LL, 999LL, 16666667LL, 617283945LL, 1234567890LL}) {
                VirtualClock parts(rate);
                const uint64_t sum = parts.advance(Duration(split)) + parts.advance(total - Duration(split));
                INFO("rate " << rate << " split " << split);
                CHECK(sum == expected);
                CHECK(parts.remainder() == whole.remainder());
            }
        }
    }

    SECTION("sixty frame ticks match one second within a cycle") {
        for (uint64_t rate : {500ULL, 700ULL, 48000ULL, 1000000ULL}) {
            VirtualClock once(rate);
            VirtualClock framed(rate);
            const uint64_t single = once.advance(1s);

            const auto frame = std::chrono::duration_cast<Duration>(1s) / 60;
            uint64_t sum = 0;
            for (int i = 0; i < 60; ++i) {
                sum += framed.advance(frame);
            }
            INFO("rate " << rate);
            CHECK(single == rate);
            CHECK(sum <= single);
            CHECK(single - sum <= 1);
        }
    }

    SECTION("long intervals at high rates do not overflow") {
        VirtualClock clock(VirtualClock::MAX_RATE);
        CHECK(clock.advance(std::chrono::hours(1)) == 3600ULL * VirtualClock::MAX_RATE);
    }
}

TEST_CASE("VirtualClock conversions", "[clock][convert]") {
    VirtualClock clock(700);

    CHECK(clock.cycles_to_duration(700) == 1s);
    CHECK(clock.cycles_to_duration(0) == 0ns);
    CHECK(clock.cycles_to_duration(1) == 1428571ns);
    CHECK(clock.duration_to_cycles(1s) == 700);
    CHECK(clock.duration_to_cycles(2ms) == 1);
    CHECK(clock.duration_to_cycles(-1s) == 0);
}

TEST_CASE("VirtualClock reset and restore", "[clock][lifecycle]") {
    VirtualClock clock(500);
    clock.advance(3ms);
    clock.commit(10);
    REQUIRE(clock.remainder() != 0);

    SECTION("reset zeroes cycles and remainder") {
        clock.reset();
        CHECK(clock.cycles() == 0);
        CHECK(clock.remainder() == 0);
        CHECK(clock.rate() == 500);
    }

    SECTION("set_rate discards the remainder") {
        clock.set_rate(1000);
        CHECK(clock.rate() == 1000);
        CHECK(clock.remainder() == 0);
        CHECK(clock.cycles() == 10);
    }

    SECTION("restore sets both counters") {
        clock.restore(1234, 999);
        CHECK(clock.cycles() == 1234);
        CHECK(clock.remainder() == 999);
    }

    SECTION("invalid rates are rejected") {
        CHECK_THROWS_AS(VirtualClock(0), std::invalid_argument);
        CHECK_THROWS_AS(clock.set_rate(VirtualClock::MAX_RATE + 1), std::invalid_argument);
    }
}
