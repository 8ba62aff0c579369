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

#ifndef TICKWORK_AUDIO_PIPELINE_HPP
#define TICKWORK_AUDIO_PIPELINE_HPP

#include "AudioSampleQueue.hpp"
#include "Resampler.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <vector>

namespace tickwork {

struct AudioConfig {
    size_t queue_capacity = 8192;           // Backend samples awaiting resampling
    uint32_t host_sample_rate = 48000;
    size_t output_capacity = 5000;          // Host-rate samples ready for the sink
    bool drift_correction = false;
    size_t target_latency_samples = 2048;   // Drift correction and catch-up set point
    size_t max_latency_samples = 9600;      // Skip ahead beyond this; zero disables
};

struct AudioStats {
    uint64_t overflow = 0;      // Backend samples dropped because the queue was full
    uint64_t underrun = 0;      // Host samples synthesized by holding
    uint64_t skipped = 0;       // Backend samples dropped to bound latency
    size_t queued = 0;          // Backend samples pending
    size_t buffered = 0;        // Host samples ready
    size_t latency = 0;         // Host samples between the sink and the newest backend sample
};

// Decouples the backend's native audio rate from the host output rate.
//
// Producer side (tick thread): push() time-stamped samples, then refill()
// to convert as much as possible into the host-rate buffer without
// underrunning.
//
// Consumer side (audio sink thread): pull() reads host-rate samples. If the
// buffer is short it resamples on demand and, if the backend is behind,
// holds the last sample rather than emitting a gap.
class AudioPipeline {
public:
    explicit AudioPipeline(AudioConfig config = {});

    AudioPipeline(const AudioPipeline&) = delete;
    AudioPipeline& operator=(const AudioPipeline&) = delete;

    // --- Producer interface ---

    void push(TimedSample sample);
    void refill();

    // --- Consumer interface ---

    std::vector<float> pull(size_t count);
    size_t pull_into(std::span<float> out);

    // Flush all audio and restart the resampler. Counters are cleared.
    void reset();

    AudioStats stats() const;
    const AudioConfig& config() const { return config_; }

    const AudioSampleQueue& queue() const { return queue_; }

private:
    void note_underruns(uint64_t before, uint64_t after);
    void note_skipped(uint64_t before, uint64_t after);

    AudioConfig config_;
    AudioSampleQueue queue_;
    ResampledBuffer output_;

    // Guards resampler_ and scratch_; taken by both refill() and pull()
    mutable std::mutex resample_mutex_;
    Resampler resampler_;
    std::vector<float> scratch_;
};

} // namespace tickwork

#endif // TICKWORK_AUDIO_PIPELINE_HPP
