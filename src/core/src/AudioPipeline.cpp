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

#include "tickwork/AudioPipeline.hpp"
#include "tickwork/Log.hpp"

#include <algorithm>

namespace tickwork {

namespace {

// Warn on the first event and then once per this many
constexpr uint64_t kWarnInterval = 4096;

bool crosses_warning(uint64_t before, uint64_t after) {
    if (after == before) {
        return false;
    }
    return before == 0 || before / kWarnInterval != after / kWarnInterval;
}

ResamplerConfig resampler_config(const AudioConfig& config) {
    ResamplerConfig rc;
    rc.host_sample_rate = config.host_sample_rate;
    rc.drift_correction = config.drift_correction;
    rc.target_fill = static_cast<double>(std::max<size_t>(config.target_latency_samples, 1));
    rc.max_latency = static_cast<double>(config.max_latency_samples);
    return rc;
}

} // anonymous namespace

AudioPipeline::AudioPipeline(AudioConfig config)
    : config_(config)
    , queue_(config.queue_capacity)
    , output_(config.output_capacity)
    , resampler_(resampler_config(config))
{
}

void AudioPipeline::push(TimedSample sample) {
    if (queue_.push(sample)) {
        const uint64_t overflow = queue_.overflow_count();
        if (crosses_warning(overflow - 1, overflow)) {
            TICKWORK_LOG_WARN("audio", "Sample queue overrun, " << overflow
                              << " backend samples dropped so far");
        }
    }
}

void AudioPipeline::refill() {
    std::lock_guard<std::mutex> lock(resample_mutex_);
    const size_t space = output_.available();
    if (space == 0) {
        return;
    }
    resampler_.set_downstream_fill(output_.size());
    scratch_.resize(space);
    const uint64_t skipped = resampler_.skipped_count();
    const size_t produced = resampler_.produce(queue_, scratch_, false);
    output_.push_many(std::span<const float>(scratch_.data(), produced));
    note_skipped(skipped, resampler_.skipped_count());
}

std::vector<float> AudioPipeline::pull(size_t count) {
    std::vector<float> samples(count);
    pull_into(samples);
    return samples;
}

size_t AudioPipeline::pull_into(std::span<float> out) {
    std::lock_guard<std::mutex> lock(resample_mutex_);
    const size_t buffered = output_.pop_into(out);
    if (buffered == out.size()) {
        return buffered;
    }

    // Short: resample the rest directly, holding on underrun
    const uint64_t before = resampler_.underrun_count();
    const uint64_t skipped = resampler_.skipped_count();
    resampler_.set_downstream_fill(0);
    resampler_.produce(queue_, out.subspan(buffered), true);
    note_underruns(before, resampler_.underrun_count());
    note_skipped(skipped, resampler_.skipped_count());
    return out.size();
}

void AudioPipeline::note_underruns(uint64_t before, uint64_t after) {
    if (crosses_warning(before, after)) {
        TICKWORK_LOG_WARN("audio", "Audio underrun, " << after
                          << " host samples held so far");
    }
}

void AudioPipeline::note_skipped(uint64_t before, uint64_t after) {
    if (after != before) {
        TICKWORK_LOG_WARN("audio", "Audio latency above " << config_.max_latency_samples
                          << " host samples, skipped " << (after - before) << " backend samples");
    }
}

void AudioPipeline::reset() {
    std::lock_guard<std::mutex> lock(resample_mutex_);
    queue_.clear(true);
    output_.clear(true);
    resampler_.reset();
}

AudioStats AudioPipeline::stats() const {
    AudioStats stats;
    stats.overflow = queue_.overflow_count();
    stats.queued = queue_.size();
    stats.buffered = output_.size();
    std::lock_guard<std::mutex> lock(resample_mutex_);
    stats.underrun = resampler_.underrun_count();
    stats.skipped = resampler_.skipped_count();
    stats.latency = output_.size()
        + static_cast<size_t>(resampler_.pending_host_samples(queue_));
    return stats;
}

} // namespace tickwork
