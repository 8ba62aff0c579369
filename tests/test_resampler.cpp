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
#include <catch2/catch_approx.hpp>
#include <tickwork/Resampler.hpp>

#include <array>
#include <stdexcept>
#include <vector>

using namespace tickwork;
using Catch::Approx;

namespace {

constexpr int64_t kMs = 1'000'000;

ResamplerConfig at_1khz() {
    ResamplerConfig config;
    config.host_sample_rate = 1000;
    return config;
}

} // anonymous namespace

TEST_CASE("Resampler interpolates between source samples", "[audio][resampler]") {
    AudioSampleQueue queue(16);
    queue.push({0, 0.0f});
    queue.push({2 * kMs, 1.0f});
    queue.push({4 * kMs, 0.0f});

    Resampler resampler(at_1khz());
    CHECK(resampler.nominal_step_ns() == Approx(1e6));

    std::array<float, 8> out{};

    SECTION("stops at the first underrun without holding") {
        CHECK(resampler.produce(queue, out, false) == 4);
        CHECK(out[0] == Approx(0.0f));
        CHECK(out[1] == Approx(0.5f));
        CHECK(out[2] == Approx(1.0f));
        CHECK(out[3] == Approx(0.5f));
        CHECK(resampler.underrun_count() == 0);
        CHECK(resampler.cursor_ns() == Approx(4e6));
        CHECK(queue.empty());
    }

    SECTION("holds the last source value on underrun") {
        std::array<float, 6> held{};
        CHECK(resampler.produce(queue, held, true) == 6);
        CHECK(held[3] == Approx(0.5f));
        CHECK(held[4] == Approx(0.0f));
        CHECK(held[5] == Approx(0.0f));
        CHECK(resampler.underrun_count() == 2);

        // The cursor waits for the backend instead of skipping ahead
        CHECK(resampler.cursor_ns() == Approx(4e6));
    }

    SECTION("resumes from the held position when audio arrives") {
        resampler.produce(queue, out, false);
        queue.push({6 * kMs, 1.0f});
        std::array<float, 2> more{};
        CHECK(resampler.produce(queue, more, false) == 2);
        CHECK(more[0] == Approx(0.0f));
        CHECK(more[1] == Approx(0.5f));
    }
}

TEST_CASE("Resampler before any source audio", "[audio][resampler]") {
    AudioSampleQueue queue(4);
    Resampler resampler(at_1khz());
    std::array<float, 3> out{1.0f, 1.0f, 1.0f};

    CHECK(resampler.produce(queue, out, false) == 0);
    CHECK_FALSE(resampler.started());

    CHECK(resampler.produce(queue, out, true) == 3);
    CHECK(out == std::array<float, 3>{0.0f, 0.0f, 0.0f});
    CHECK(resampler.underrun_count() == 3);
}

TEST_CASE("Resampler reproduces a constant signal", "[audio][resampler]") {
    AudioSampleQueue queue(256);
    for (int64_t k = 0; k < 100; ++k) {
        queue.push({k * 1'428'571, 0.3f});  // 700Hz source
    }

    ResamplerConfig config;
    config.host_sample_rate = 48000;
    Resampler resampler(config);
    std::vector<float> out(4096);
    // ~141ms of source audio is more than the buffer holds
    const size_t produced = resampler.produce(queue, out, false);
    CHECK(produced == out.size());
    for (size_t k = 0; k < produced; ++k) {
        CHECK(out[k] == Approx(0.3f));
    }
}

TEST_CASE("Resampler drift correction", "[audio][resampler][drift]") {
    ResamplerConfig config = at_1khz();
    config.drift_correction = true;
    config.target_fill = 100.0;
    config.gain = 0.05;
    config.max_adjust = 0.005;
    Resampler resampler(config);
    AudioSampleQueue queue(4);
    std::span<float> nothing;

    SECTION("too much buffered speeds consumption up, clamped") {
        resampler.set_downstream_fill(100000);
        resampler.produce(queue, nothing, false);
        CHECK(resampler.step_ns() == Approx(1e6 * 1.005));
    }

    SECTION("too little buffered slows consumption down, clamped") {
        resampler.set_downstream_fill(0);
        resampler.produce(queue, nothing, false);
        CHECK(resampler.step_ns() == Approx(1e6 * 0.995));
    }

    SECTION("on target leaves the nominal step") {
        resampler.set_downstream_fill(100);
        resampler.produce(queue, nothing, false);
        CHECK(resampler.step_ns() == Approx(1e6));
    }

    SECTION("pending source audio counts towards the fill") {
        queue.push({0, 0.0f});
        queue.push({50 * kMs, 0.0f});
        CHECK(resampler.pending_host_samples(queue) == Approx(50.0));
        resampler.set_downstream_fill(50);
        resampler.produce(queue, nothing, false);
        CHECK(resampler.step_ns() == Approx(1e6));
    }

    SECTION("reset restores the nominal step") {
        resampler.set_downstream_fill(0);
        resampler.produce(queue, nothing, false);
        resampler.reset();
        CHECK(resampler.step_ns() == Approx(1e6));
        CHECK(resampler.underrun_count() == 0);
    }
}

TEST_CASE("Resampler rejects invalid configuration", "[audio][resampler]") {
    ResamplerConfig config;
    config.host_sample_rate = 0;
    CHECK_THROWS_AS(Resampler(config), std::invalid_argument);

    config = ResamplerConfig{};
    config.target_fill = 0.0;
    CHECK_THROWS_AS(Resampler(config), std::invalid_argument);

    config = ResamplerConfig{};
    config.target_fill = 100.0;
    config.max_latency = 50.0;
    CHECK_THROWS_AS(Resampler(config), std::invalid_argument);
}
