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

#ifndef TICKWORK_RESAMPLER_HPP
#define TICKWORK_RESAMPLER_HPP

#include "AudioSampleQueue.hpp"

#include <cstddef>
#include <cstdint>
#include <span>

namespace tickwork {

struct ResamplerConfig {
    uint32_t host_sample_rate = 48000;

    // Adaptive ratio: nudge the consumption rate so the amount of buffered
    // audio settles around target_fill host samples.
    bool drift_correction = false;
    double target_fill = 2048.0;
    double gain = 0.05;
    double max_adjust = 0.005;      // +/- 0.5%

    // Latency cap in host samples, counting downstream fill. When the
    // queued audio runs further ahead of the cursor than this, the cursor
    // skips forward to leave target_fill samples of latency. Zero disables.
    double max_latency = 0.0;
};

// Converts time-stamped backend samples into a host-rate stream.
//
// A cursor walks virtual time in steps of 1/host_rate seconds. For each
// output sample every source sample at or before the cursor is consumed,
// and the output is linearly interpolated between the last consumed source
// sample and the next pending one.
//
// When the next source sample has not arrived yet (underrun) the most recent
// source sample is repeated and the cursor does not move, so no audio is
// skipped once the backend catches up. Before the first source sample the
// output is silence.
class Resampler {
public:
    explicit Resampler(ResamplerConfig config = {});

    // Produce up to out.size() samples. If hold_on_underrun is false,
    // production stops at the first underrun and the count so far is
    // returned; otherwise the remainder is filled with the held value.
    size_t produce(AudioSampleQueue& source, std::span<float> out, bool hold_on_underrun);

    // Host samples currently buffered downstream, for drift correction.
    void set_downstream_fill(size_t samples) { downstream_fill_ = samples; }

    // Pending source audio expressed in host samples.
    double pending_host_samples(const AudioSampleQueue& source) const;

    void reset();

    uint64_t underrun_count() const { return underruns_; }
    uint64_t skipped_count() const { return skipped_; }
    double step_ns() const { return step_ns_; }
    double nominal_step_ns() const { return nominal_step_ns_; }
    double cursor_ns() const { return cursor_ns_; }
    float held_value() const { return started_ ? previous_.value : 0.0f; }
    bool started() const { return started_; }
    const ResamplerConfig& config() const { return config_; }

private:
    // One output sample; false on underrun (nothing written)
    bool next(AudioSampleQueue& source, float& out);
    void update_ratio(const AudioSampleQueue& source);
    void catch_up(AudioSampleQueue& source);

    ResamplerConfig config_;
    double nominal_step_ns_;
    double step_ns_;

    bool started_ = false;
    double cursor_ns_ = 0.0;
    TimedSample previous_{};
    size_t downstream_fill_ = 0;
    uint64_t underruns_ = 0;
    uint64_t skipped_ = 0;
};

} // namespace tickwork

#endif // TICKWORK_RESAMPLER_HPP
