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
#include <tickwork/AudioSampleQueue.hpp>

#include <array>
#include <stdexcept>
#include <vector>

using namespace tickwork;

TEST_CASE("BoundedQueue basic operations", "[audio][queue]") {
    BoundedQueue<int> queue(4);

    CHECK(queue.empty());
    CHECK(queue.capacity() == 4);
    CHECK(queue.available() == 4);
    CHECK_FALSE(queue.pop());
    CHECK_FALSE(queue.front());

    CHECK_FALSE(queue.push(1));
    CHECK_FALSE(queue.push(2));
    CHECK(queue.size() == 2);
    CHECK(*queue.front() == 1);
    CHECK(*queue.back() == 2);
    CHECK(*queue.peek(1) == 2);
    CHECK_FALSE(queue.peek(2));

    CHECK(*queue.pop() == 1);
    CHECK(*queue.pop() == 2);
    CHECK(queue.empty());
}

TEST_CASE("BoundedQueue drops the oldest item when full", "[audio][queue][overflow]") {
    BoundedQueue<int> queue(3);
    for (int k = 1; k <= 3; ++k) {
        CHECK_FALSE(queue.push(k));
    }
    CHECK(queue.full());

    CHECK(queue.push(4));
    CHECK(queue.push(5));
    CHECK(queue.size() == 3);
    CHECK(queue.overflow_count() == 2);

    std::array<int, 3> out{};
    CHECK(queue.pop_into(out) == 3);
    CHECK(out == std::array<int, 3>{3, 4, 5});

    SECTION("push_many reports drops") {
        std::vector<int> items{10, 11, 12, 13, 14};
        CHECK(queue.push_many(items) == 2);
        CHECK(queue.overflow_count() == 4);
        CHECK(*queue.front() == 12);
    }

    SECTION("clear keeps counters unless asked") {
        queue.push(1);
        queue.clear();
        CHECK(queue.empty());
        CHECK(queue.overflow_count() == 2);
        queue.clear(true);
        CHECK(queue.overflow_count() == 0);
    }
}

TEST_CASE("BoundedQueue wraps around its storage", "[audio][queue]") {
    BoundedQueue<int> queue(4);
    int next = 0;
    int expected = 0;
    for (int round = 0; round < 10; ++round) {
        queue.push(next++);
        queue.push(next++);
        queue.push(next++);
        for (int k = 0; k < 3; ++k) {
            CHECK(*queue.pop() == expected++);
        }
    }
    CHECK(queue.overflow_count() == 0);
}

TEST_CASE("BoundedQueue conditional and bulk pops", "[audio][queue]") {
    BoundedQueue<TimedSample> queue(8);
    queue.push({100, 0.1f});
    queue.push({200, 0.2f});
    queue.push({300, 0.3f});

    auto before = [](int64_t t) {
        return [t](const TimedSample& s) { return s.time_ns <= t; };
    };

    CHECK(queue.pop_front_if(before(150))->time_ns == 100);
    CHECK_FALSE(queue.pop_front_if(before(150)));
    CHECK(queue.size() == 2);

    std::array<TimedSample, 5> out{};
    CHECK(queue.pop_into(out) == 2);
    CHECK(out[0].time_ns == 200);
    CHECK(out[1].value == 0.3f);
    CHECK(queue.empty());
}

TEST_CASE("BoundedQueue rejects zero capacity", "[audio][queue]") {
    CHECK_THROWS_AS(BoundedQueue<float>(0), std::invalid_argument);
}
