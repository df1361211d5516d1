// This is copyrighted software. More information is at the end of this file.
#ifndef AUDIOCONV_SDK_QUALITY_METRICS_HH
#define AUDIOCONV_SDK_QUALITY_METRICS_HH

#include <audioconv/sdk/pcm_data.hh>
#include <audioconv/sdk/export_audioconv_sdk.h>

namespace audioconv {
    /**
     * @struct quality_metrics
     * @brief Level measurements of a processed signal
     *
     * All levels are computed on a mono mix-down. `thd` is not measured;
     * it is always 0 and `thd_measured` is false.
     */
    struct quality_metrics {
        double snr = 0.0;            ///< dB, +inf when the processed signal is silent
        double thd = 0.0;
        bool thd_measured = false;
        double dynamic_range = 0.0;  ///< dB, peak over RMS
        double peak_level = 0.0;     ///< dBFS
        double rms_level = 0.0;      ///< dBFS
        double loudness = 0.0;       ///< RMS dBFS - 23
        double crest_factor = 0.0;   ///< linear peak / RMS
    };

    class AUDIOCONV_SDK_EXPORT quality_metrics_calculator {
        public:
            /**
             * @brief Measure @p processed, with SNR taken against @p original
             */
            [[nodiscard]] static quality_metrics calculate(const pcm_data& original,
                                                           const pcm_data& processed);

            /**
             * @brief Mean of squared samples
             */
            [[nodiscard]] static double power(const buffer<float>& mono);
    };
}

#endif // AUDIOCONV_SDK_QUALITY_METRICS_HH

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
