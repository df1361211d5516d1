// This is copyrighted software. More information is at the end of this file.
#include <audioconv/sdk/channel_remapper.hh>
#include <audioconv/error.hh>
#include <vector>

namespace audioconv {
    buffer<float> channel_remapper::mix_to_mono(const pcm_data& samples) {
        buffer<float> out(samples.frames());
        const auto channels = samples.channel_count();
        if (channels == 0) {
            return out;
        }
        for (std::size_t i = 0; i < out.size(); ++i) {
            double sum = 0.0;
            for (std::size_t ch = 0; ch < channels; ++ch) {
                sum += samples.channel(ch)[i];
            }
            out[i] = static_cast<float>(sum / channels);
        }
        return out;
    }

    pcm_data channel_remapper::convert_channels(pcm_data samples, channels_t target) {
        if (target == 0) {
            throw validation_error("Target channel count must be positive");
        }
        const auto source = samples.channel_count();
        if (source == target) {
            return samples;
        }
        if (source == 0) {
            throw validation_error("Cannot remap a sample set without channels");
        }

        std::vector<buffer<float>> out;
        out.reserve(target);
        if (source == 2 && target == 1) {
            out.push_back(mix_to_mono(samples));
        } else {
            for (channels_t k = 0; k < target; ++k) {
                out.push_back(samples.channel(k % source).clone());
            }
        }
        return pcm_data(std::move(out));
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
