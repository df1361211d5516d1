// This is copyrighted software. More information is at the end of this file.
#include <audioconv/sdk/envelope.hh>
#include <audioconv/error.hh>

#include <algorithm>
#include <cmath>
#include <vector>

namespace {
    std::size_t seconds_to_samples(double seconds, audioconv::sample_rate_t rate) {
        return static_cast<std::size_t>(std::floor(seconds * rate));
    }

    bool frame_has_signal(const audioconv::pcm_data& samples, std::size_t frame, float threshold) {
        for (std::size_t ch = 0; ch < samples.channel_count(); ++ch) {
            if (std::fabs(samples.channel(ch)[frame]) > threshold) {
                return true;
            }
        }
        return false;
    }

    audioconv::pcm_data slice_frames(const audioconv::pcm_data& samples,
                                     std::size_t first, std::size_t last) {
        std::vector<audioconv::buffer<float>> out;
        out.reserve(samples.channel_count());
        for (std::size_t ch = 0; ch < samples.channel_count(); ++ch) {
            out.push_back(samples.channel(ch).slice(first, last));
        }
        return audioconv::pcm_data(std::move(out));
    }
}

namespace audioconv {
    pcm_data trim(pcm_data samples, double start_seconds,
                  double end_seconds, sample_rate_t rate) {
        if (start_seconds < 0.0 || end_seconds < 0.0) {
            throw validation_error("Trim times must not be negative");
        }
        const auto first = seconds_to_samples(start_seconds, rate);
        const auto last = seconds_to_samples(end_seconds, rate);
        return slice_frames(samples, first, last);
    }

    pcm_data trim_silence(pcm_data samples, float threshold) {
        const auto frames = samples.frames();
        std::size_t first = 0;
        while (first < frames && !frame_has_signal(samples, first, threshold)) {
            ++first;
        }
        if (first == frames) {
            return samples;
        }
        std::size_t last = frames;
        while (last > first && !frame_has_signal(samples, last - 1, threshold)) {
            --last;
        }
        if (first == 0 && last == frames) {
            return samples;
        }
        return slice_frames(samples, first, last);
    }

    pcm_data apply_fades(pcm_data samples, double fade_in_seconds,
                         double fade_out_seconds, sample_rate_t rate) {
        if (fade_in_seconds < 0.0 || fade_out_seconds < 0.0) {
            throw validation_error("Fade durations must not be negative");
        }
        const auto fade_in = seconds_to_samples(fade_in_seconds, rate);
        const auto fade_out = seconds_to_samples(fade_out_seconds, rate);
        if (fade_in == 0 && fade_out == 0) {
            return samples;
        }

        std::vector<buffer<float>> out;
        out.reserve(samples.channel_count());
        for (std::size_t ch = 0; ch < samples.channel_count(); ++ch) {
            const auto& src = samples.channel(ch);
            const auto len = src.size();
            auto dst = src.clone();

            const auto in_end = std::min(fade_in, len);
            for (std::size_t i = 0; i < in_end; ++i) {
                dst[i] = static_cast<float>(src[i] * (static_cast<double>(i) / fade_in));
            }
            if (fade_out > 0) {
                const auto out_begin = len > fade_out ? len - fade_out : 0;
                for (std::size_t i = out_begin; i < len; ++i) {
                    dst[i] = static_cast<float>(src[i] * (static_cast<double>(len - i) / fade_out));
                }
            }
            out.push_back(std::move(dst));
        }
        return pcm_data(std::move(out));
    }

    float peak_level(const pcm_data& samples) {
        float peak = 0.0f;
        for (std::size_t ch = 0; ch < samples.channel_count(); ++ch) {
            for (float s : samples.channel(ch)) {
                peak = std::max(peak, std::fabs(s));
            }
        }
        return peak;
    }

    pcm_data normalize_peak(pcm_data samples) {
        const float peak = peak_level(samples);
        if (peak <= 0.0f) {
            return samples;
        }
        const double gain = normalize_peak_level / peak;
        for (std::size_t ch = 0; ch < samples.channel_count(); ++ch) {
            for (float& s : samples.channel(ch)) {
                s = static_cast<float>(s * gain);
            }
        }
        return samples;
    }
}

/*
 * Copyright (C) 2025
 *
 * This file is part of audioconv.
 *
 * audioconv is free software: you can redistribute it and/or modify it under
 * the terms of the GNU Lesser General Public License as published by the Free
 * Software Foundation, either version 3 of the License, or (at your option) any
 * later version.
 *
 * audioconv is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR
 * A PARTICULAR PURPOSE.  See the GNU Lesser General Public License for more
 * details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with audioconv.  If not, see <http://www.gnu.org/licenses/>.
 */
