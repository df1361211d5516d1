// This is copyrighted software. More information is at the end of this file.
#include <audioconv/sdk/loudness_processor.hh>
#include <audioconv/sdk/decibel.hh>

#include <algorithm>
#include <cmath>

namespace audioconv {
    double loudness_processor::rms(const pcm_data& samples) {
        double sum = 0.0;
        std::size_t count = 0;
        for (std::size_t ch = 0; ch < samples.channel_count(); ++ch) {
            for (float s : samples.channel(ch)) {
                sum += static_cast<double>(s) * s;
            }
            count += samples.channel(ch).size();
        }
        return count == 0 ? 0.0 : std::sqrt(sum / static_cast<double>(count));
    }

    double loudness_processor::measure(const pcm_data& samples) {
        return rms_to_loudness(rms(samples));
    }

    pcm_data loudness_processor::normalize(pcm_data samples, double target_lu) {
        const double level = rms(samples);
        if (level <= 0.0) {
            return samples;
        }
        const double gain = db_to_linear(target_lu - rms_to_loudness(level));
        for (std::size_t ch = 0; ch < samples.channel_count(); ++ch) {
            for (float& s : samples.channel(ch)) {
                s = static_cast<float>(std::clamp(s * gain, -1.0, 1.0));
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
