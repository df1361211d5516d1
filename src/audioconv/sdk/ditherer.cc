// This is copyrighted software. More information is at the end of this file.
#include <audioconv/sdk/ditherer.hh>
#include <audioconv/sdk/audio_format.hh>
#include <audioconv/error.hh>

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace {
    double quantization_levels(audioconv::bit_depth_t bits) {
        if (!audioconv::is_valid_bit_depth(bits)) {
            throw audioconv::validation_error("Cannot quantize to " + std::to_string(bits) + " bits");
        }
        return std::ldexp(1.0, bits - 1);
    }

    // Half-up rounding; negative halves go towards zero.
    double quantize(double v, double levels) {
        return std::floor(v * levels + 0.5) / levels;
    }

    template<typename Fn>
    audioconv::pcm_data per_channel(audioconv::pcm_data samples, Fn&& fn) {
        std::vector<audioconv::buffer<float>> out;
        out.reserve(samples.channel_count());
        for (std::size_t ch = 0; ch < samples.channel_count(); ++ch) {
            out.push_back(fn(samples.channel(ch)));
        }
        return audioconv::pcm_data(std::move(out));
    }
}

namespace audioconv {
    ditherer::ditherer()
        : m_engine(std::random_device{}()) {
    }

    ditherer::ditherer(std::uint32_t seed)
        : m_engine(seed) {
    }

    buffer<float> ditherer::apply(const buffer<float>& samples,
                                  bit_depth_t target_bit_depth,
                                  bool noise_shaping) {
        const double levels = quantization_levels(target_bit_depth);
        std::uniform_real_distribution<double> uniform(0.0, 1.0);

        buffer<float> out(samples.size());
        double residual = 0.0;
        for (std::size_t i = 0; i < samples.size(); ++i) {
            double v = static_cast<double>(samples[i]) + residual;
            const double r1 = uniform(m_engine);
            const double r2 = uniform(m_engine);
            v += (r1 + r2 - 1.0) / levels;

            // The error feedback excludes clipping; only the output is clamped.
            const double q = quantize(v, levels);
            residual = noise_shaping ? (v - q) * 0.5 : 0.0;
            out[i] = static_cast<float>(std::clamp(q, -1.0, 1.0));
        }
        return out;
    }

    pcm_data ditherer::apply(pcm_data samples,
                             bit_depth_t target_bit_depth,
                             bool noise_shaping) {
        return per_channel(std::move(samples), [&](const buffer<float>& ch) {
            return apply(ch, target_bit_depth, noise_shaping);
        });
    }

    buffer<float> ditherer::requantize(const buffer<float>& samples,
                                       bit_depth_t target_bit_depth) {
        const double levels = quantization_levels(target_bit_depth);
        buffer<float> out(samples.size());
        for (std::size_t i = 0; i < samples.size(); ++i) {
            out[i] = static_cast<float>(std::clamp(quantize(samples[i], levels), -1.0, 1.0));
        }
        return out;
    }

    pcm_data ditherer::requantize(pcm_data samples, bit_depth_t target_bit_depth) {
        return per_channel(std::move(samples), [&](const buffer<float>& ch) {
            return requantize(ch, target_bit_depth);
        });
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
