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

#include "tickwork/Resampler.hpp"
#include "tickwork/Types.hpp"

#include <algorithm>
#include <stdexcept>

namespace tickwork {

Resampler::Resampler(ResamplerConfig config)
    : config_(config)
    , nominal_step_ns_(0.0)
    , step_ns_(0.0)
{
    if (config_.host_sample_rate == 0) {
        throw std::invalid_argument("Host sample rate must be non-zero");
    }
    if (config_.target_fill <= 0.0) {
        throw std::invalid_argument("Resampler target fill must be positive");
    }
    if (config_.max_latency != 0.0 && config_.max_latency < config_.target_fill) {
        throw std::invalid_argument("Resampler latency cap must not be below the target fill");
    }
    nominal_step_ns_ = static_cast<double>(kNanosPerSecond) / config_.host_sample_rate;
    step_ns_ = nominal_step_ns_;
}

void Resampler::reset() {
    started_ = false;
    cursor_ns_ = 0.0;
    previous_ = TimedSample{};
    downstream_fill_ = 0;
    step_ns_ = nominal_step_ns_;
    underruns_ = 0;
    skipped_ = 0;
}

bool Resampler::next(AudioSampleQueue& source, float& out) {
    if (!started_) {
        auto first = source.pop();
        if (!first) {
            return false;
        }
        previous_ = *first;
        cursor_ns_ = static_cast<double>(first->time_ns);
        started_ = true;
    }

    const double cursor = cursor_ns_;
    auto at_or_before_cursor = [cursor](const TimedSample& s) {
        return static_cast<double>(s.time_ns) <= cursor;
    };
    while (auto consumed = source.pop_front_if(at_or_before_cursor)) {
        previous_ = *consumed;
    }

    // upcoming->time_ns > cursor >= previous_.time_ns, so the span is positive
    auto upcoming = source.front();
    if (!upcoming) {
        return false;
    }
    const double span = static_cast<double>(upcoming->time_ns - previous_.time_ns);
    const double t = (cursor - static_cast<double>(previous_.time_ns)) / span;
    out = previous_.value + static_cast<float>((upcoming->value - previous_.value) * t);
    cursor_ns_ += step_ns_;
    return true;
}

size_t Resampler::produce(AudioSampleQueue& source, std::span<float> out, bool hold_on_underrun) {
    catch_up(source);
    if (config_.drift_correction) {
        update_ratio(source);
    }

    size_t produced = 0;
    while (produced < out.size()) {
        float value = 0.0f;
        if (!next(source, value)) {
            break;
        }
        out[produced++] = value;
    }

    if (!hold_on_underrun || produced == out.size()) {
        return produced;
    }

    const float held = held_value();
    std::fill(out.begin() + static_cast<std::ptrdiff_t>(produced), out.end(), held);
    underruns_ += out.size() - produced;
    return out.size();
}

double Resampler::pending_host_samples(const AudioSampleQueue& source) const {
    auto newest = source.back();
    if (!newest) {
        return 0.0;
    }
    double from_ns = cursor_ns_;
    if (!started_) {
        auto oldest = source.front();
        from_ns = oldest ? static_cast<double>(oldest->time_ns) : from_ns;
    }
    const double pending_ns = std::max(0.0, static_cast<double>(newest->time_ns) - from_ns);
    return pending_ns / nominal_step_ns_;
}

void Resampler::catch_up(AudioSampleQueue& source) {
    if (config_.max_latency <= 0.0) {
        return;
    }
    auto newest = source.back();
    if (!newest) {
        return;
    }
    const double downstream = static_cast<double>(downstream_fill_);
    if (pending_host_samples(source) + downstream <= config_.max_latency) {
        return;
    }

    // Latency is above the cap, so the oldest queued sample lies before the new cursor
    const double keep = std::max(0.0, config_.target_fill - downstream);
    const double cursor = static_cast<double>(newest->time_ns) - keep * nominal_step_ns_;
    if (!started_) {
        auto first = source.pop();
        previous_ = *first;
        started_ = true;
        ++skipped_;
    }
    cursor_ns_ = std::max(cursor_ns_, cursor);

    const double target = cursor_ns_;
    auto at_or_before_cursor = [target](const TimedSample& s) {
        return static_cast<double>(s.time_ns) <= target;
    };
    while (auto consumed = source.pop_front_if(at_or_before_cursor)) {
        previous_ = *consumed;
        ++skipped_;
    }
}

void Resampler::update_ratio(const AudioSampleQueue& source) {
    const double fill = pending_host_samples(source) + static_cast<double>(downstream_fill_);
    const double error = (fill - config_.target_fill) / config_.target_fill;
    const double adjust = std::clamp(config_.gain * error, -config_.max_adjust, config_.max_adjust);
    // More audio buffered than wanted: consume faster
    step_ns_ = nominal_step_ns_ * (1.0 + adjust);
}

} // namespace tickwork
