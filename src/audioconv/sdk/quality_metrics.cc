// This is copyrighted software. More information is at the end of this file.
#include <audioconv/sdk/quality_metrics.hh>
#include <audioconv/sdk/channel_remapper.hh>
#include <audioconv/sdk/decibel.hh>

#include <algorithm>
#include <cmath>
#include <limits>

namespace audioconv {
    double quality_metrics_calculator::power(const buffer<float>& mono) {
        if (mono.empty()) {
            return 0.0;
        }
        double sum = 0.0;
        for (float s : mono) {
            sum += static_cast<double>(s) * s;
        }
        return sum / static_cast<double>(mono.size());
    }

    quality_metrics quality_metrics_calculator::calculate(const pcm_data& original,
                                                          const pcm_data& processed) {
        const auto mono = channel_remapper::mix_to_mono(processed);

        double peak = 0.0;
        for (float s : mono) {
            peak = std::max(peak, static_cast<double>(std::fabs(s)));
        }
        const double processed_power = power(mono);
        const double rms = std::sqrt(processed_power);

        quality_metrics m;
        m.peak_level = linear_to_db(peak);
        m.rms_level = linear_to_db(rms);
        m.loudness = m.rms_level - loudness_calibration_offset;
        m.dynamic_range = linear_to_db(peak / (rms > 0.0 ? rms : min_linear_level));
        m.crest_factor = peak / (rms > 0.0 ? rms : min_linear_level);

        if (processed_power > 0.0) {
            const double signal_power = power(channel_remapper::mix_to_mono(original));
            m.snr = 10.0 * std::log10(signal_power / processed_power);
        } else {
            m.snr = std::numeric_limits<double>::infinity();
        }
        return m;
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
